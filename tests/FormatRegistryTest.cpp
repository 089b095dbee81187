#include <gtest/gtest.h>

#include "FormatRegistry.h"
#include "ParquetFormat.h"
#include "TabulaExceptions.h"
#include "TestSupport.h"
#include "VariableRegistry.h"

#include <algorithm>

namespace {
class StubCsvFormat : public FileFormat {
public:
    std::string name() const override { return "stub"; }
    std::string description() const override { return "Stub"; }
    std::vector<std::string> extensions() const override { return {".CSV"}; }

    Table readFile(const std::string&, const ReadOptions&) const override {
        return Table();
    }
};

bool hasExtension(const std::vector<std::pair<std::string, const FileFormat*>>& entries, const std::string& ext) {
    return std::any_of(entries.begin(), entries.end(), [&](const auto& e) { return e.first == ext; });
}
} // namespace

class FormatRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.registry = &variables_;
    }

    FormatRegistry registry_ = FormatRegistry::defaults();
    VariableRegistry variables_;
    ReadOptions options_;
    ScratchDir dir_;
};

TEST_F(FormatRegistryTest, ReaderByExtension) {
    EXPECT_EQ(registry_.readerFor("data.csv").name(), "csv");
    EXPECT_EQ(registry_.readerFor("dir/DATA.TAB").name(), "tab");
    EXPECT_EQ(registry_.readerFor("data.tsv").name(), "tab");
    EXPECT_EQ(registry_.readerFor("book.xls").name(), "excel");
    EXPECT_EQ(registry_.readerFor("book.xlsx").name(), "excel");
    EXPECT_EQ(registry_.readerFor("items.bsk").name(), "basket");
    EXPECT_EQ(registry_.readerFor("snapshot.tbin").name(), "tbin");
    EXPECT_EQ(registry_.readerFor("cols.parquet").name(), "parquet");
}

TEST_F(FormatRegistryTest, CompressedVariantsOfTextFormats) {
    EXPECT_EQ(registry_.readerFor("data.tab.gz").name(), "tab");
    EXPECT_EQ(registry_.readerFor("data.csv.bz2").name(), "csv");
    EXPECT_EQ(registry_.readerFor("data.tsv.xz").name(), "tab");
    EXPECT_THROW(registry_.readerFor("snapshot.tbin.gz"), Tabula::FormatException);
}

TEST_F(FormatRegistryTest, SheetSelectorResolvesToExcel) {
    EXPECT_EQ(registry_.readerFor("book.xlsx:Sheet2").name(), "excel");
    EXPECT_EQ(registry_.readerFor("book.xls:3").name(), "excel");
    EXPECT_THROW(registry_.readerFor("data.csv:1"), Tabula::FormatException);
}

TEST_F(FormatRegistryTest, UnknownExtensionHasNoReader) {
    try {
        registry_.readerFor("notes.txt");
        FAIL() << "expected FormatException";
    } catch (const Tabula::FormatException& e) {
        EXPECT_NE(std::string(e.what()).find("No readers for file \"notes.txt\""), std::string::npos);
    }
}

TEST_F(FormatRegistryTest, WritersExcludeReadOnlyFormats) {
    EXPECT_EQ(registry_.writerFor("out.tab.bz2").name(), "tab");
    EXPECT_EQ(registry_.writerFor("out.tbin").name(), "tbin");
    EXPECT_THROW(registry_.writerFor("out.xlsx"), Tabula::FormatException);
    EXPECT_THROW(registry_.writerFor("out.basket"), Tabula::FormatException);

    EXPECT_TRUE(hasExtension(registry_.writers(), ".csv.gz"));
    EXPECT_FALSE(hasExtension(registry_.writers(), ".xls"));
    EXPECT_TRUE(hasExtension(registry_.readers(), ".xls"));
}

TEST_F(FormatRegistryTest, LaterRegistrationWins) {
    registry_.registerFormat(std::make_shared<StubCsvFormat>());
    EXPECT_EQ(registry_.readerFor("data.csv").name(), "stub");
    EXPECT_EQ(registry_.readerFor("data.csv.gz").name(), "csv");
    EXPECT_THROW(registry_.writerFor("data.csv"), Tabula::FormatException);
}

TEST_F(FormatRegistryTest, DescriptionsListExtensions) {
    const auto descriptions = registry_.descriptions();
    EXPECT_NE(std::find(descriptions.begin(), descriptions.end(), "Tab-separated values (*.tab *.tsv)"), descriptions.end());
    EXPECT_NE(std::find(descriptions.begin(), descriptions.end(), "Microsoft Excel spreadsheet (*.xls *.xlsx)"), descriptions.end());
}

TEST_F(FormatRegistryTest, SplitSheetSelector) {
    std::string path;
    std::string sheet;
    ASSERT_TRUE(FormatRegistry::splitSheetSelector("dir/Book.XLSX:Q1 totals", {".xlsx"}, path, sheet));
    EXPECT_EQ(path, "dir/Book.XLSX");
    EXPECT_EQ(sheet, "Q1 totals");
    EXPECT_FALSE(FormatRegistry::splitSheetSelector("book.xlsx", {".xlsx"}, path, sheet));
    EXPECT_FALSE(FormatRegistry::splitSheetSelector("C:data.csv", {".xlsx"}, path, sheet));
}

TEST_F(FormatRegistryTest, ReadTableAddsFilenameToParseErrors) {
    const std::string path = dir_.file("bad.csv", "a,b\nc,c\n,\n1,oops\n");
    try {
        TableIO::readTable(registry_, path, options_);
        FAIL() << "expected ParseException";
    } catch (const Tabula::ParseException& e) {
        EXPECT_EQ(e.cause(), "Cannot parse dataset " + path + ": could not convert string to float: 'oops'");
        EXPECT_EQ(e.row(), 0u);
        EXPECT_EQ(e.column(), 1u);
    }
}

TEST_F(FormatRegistryTest, ReadTableRejectsUnknownExtension) {
    EXPECT_THROW(TableIO::readTable(dir_.path("table.unknown"), options_), Tabula::FormatException);
}

TEST_F(FormatRegistryTest, ConvertBetweenFormats) {
    const Table original = sampleTable();
    const std::string tab = dir_.path("sample.tab");
    const std::string tbin = dir_.path("sample.tbin");

    TableIO::writeTable(registry_, tab, original);
    const Table fromTab = TableIO::readTable(registry_, tab, options_);
    TableIO::writeTable(tbin, fromTab);
    expectSameTable(original, TableIO::readTable(tbin, options_));
}

TEST_F(FormatRegistryTest, ParquetRoundTripOrMissingSupport) {
    const Table original = sampleTable();
    const std::string path = dir_.path("sample.parquet");
    if (!ParquetFormat::nativeSupport()) {
        EXPECT_THROW(TableIO::writeTable(registry_, path, original), Tabula::IOException);
        return;
    }
    TableIO::writeTable(registry_, path, original);
    expectSameTable(original, TableIO::readTable(registry_, path, options_));
}

TEST_F(FormatRegistryTest, EmptyFileIsAParseError) {
    const std::string path = dir_.file("empty.csv", "");
    try {
        TableIO::readTable(registry_, path, options_);
        FAIL() << "expected ParseException";
    } catch (const Tabula::ParseException& e) {
        EXPECT_NE(e.cause().find("Cannot parse dataset"), std::string::npos);
        EXPECT_NE(e.cause().find("No columns found"), std::string::npos);
    }
}

TEST_F(FormatRegistryTest, PickledTablesAreRefused) {
    for (const std::string name : {"data.pkl", "DATA.PICKLE", "data.pkl.gz"}) {
        try {
            registry_.readerFor(name);
            FAIL() << "expected FormatException for " << name;
        } catch (const Tabula::FormatException& e) {
            EXPECT_NE(std::string(e.what()).find("Pickled tables are not supported"), std::string::npos);
        }
    }
    EXPECT_THROW(registry_.writerFor("out.pkl"), Tabula::FormatException);
}
