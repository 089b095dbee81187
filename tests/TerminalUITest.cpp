#include <gtest/gtest.h>

#include "TerminalUI.h"
#include "TestSupport.h"

#include <sstream>

TEST(TerminalUITest, DomainSummaryListsEveryVariable) {
    std::ostringstream out;
    TerminalUI::printDomainSummary("sample.tab", sampleTable(), out);
    const std::string text = out.str();
    EXPECT_NE(text.find("Source: sample.tab"), std::string::npos);
    EXPECT_NE(text.find("Rows: 2 | Attributes: 2 | Class: 1 | Metas: 1 | Weights: 1"), std::string::npos);
    EXPECT_NE(text.find("unit=cm"), std::string::npos);
    EXPECT_NE(text.find("ordered: lo hi"), std::string::npos);
    EXPECT_NE(text.find("blue red"), std::string::npos);
}

TEST(TerminalUITest, PreviewTruncatesRows) {
    std::ostringstream out;
    TerminalUI::printPreview(sampleTable(), 1, out);
    const std::string text = out.str();
    EXPECT_NE(text.find("weights_0"), std::string::npos);
    EXPECT_NE(text.find("blue"), std::string::npos);
    EXPECT_EQ(text.find("red"), std::string::npos);
    EXPECT_NE(text.find("... 1 more rows"), std::string::npos);
}

TEST(TerminalUITest, FormatListing) {
    std::ostringstream out;
    TerminalUI::printFormats(FormatRegistry::defaults(), out);
    const std::string text = out.str();
    EXPECT_NE(text.find("Comma-separated values (*.csv)"), std::string::npos);
    EXPECT_NE(text.find(" .tab.gz"), std::string::npos);
    EXPECT_NE(text.find("Writer extensions:"), std::string::npos);
}
