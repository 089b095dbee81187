#include <gtest/gtest.h>

#include "TabulaConfig.h"
#include "TabulaExceptions.h"
#include "TestSupport.h"

#include <string>
#include <vector>

class TabulaConfigTest : public ::testing::Test {
protected:
    TabulaConfig parse(std::vector<std::string> args) {
        args.insert(args.begin(), "tabula");
        argvStorage_ = std::move(args);
        argv_.clear();
        for (auto& a : argvStorage_) argv_.push_back(&a[0]);
        argv_.push_back(nullptr);
        return TabulaConfig::fromArgs(static_cast<int>(argvStorage_.size()), argv_.data());
    }

    ScratchDir dir_;
    std::vector<std::string> argvStorage_;
    std::vector<char*> argv_;
};

TEST_F(TabulaConfigTest, DefaultsWithInputOnly) {
    const TabulaConfig config = parse({"iris.tab"});
    EXPECT_EQ(config.inputPath, "iris.tab");
    EXPECT_EQ(config.delimiter, '\0');
    EXPECT_DOUBLE_EQ(config.headerNumericRatio, 0.9);
    EXPECT_EQ(config.discreteMaxNumericValues, 3u);
    EXPECT_TRUE(config.summary);
    EXPECT_EQ(config.logLevel, "warning");
    EXPECT_FALSE(config.listFormats);
}

TEST_F(TabulaConfigTest, CommandLineOptions) {
    const TabulaConfig config = parse({"data.csv", "--delimiter", "tab", "--missing-values", "NA, -, n/a",
                                       "--preview-rows", "5", "--output", "out.tbin", "--verbose",
                                       "--isolated-registry", "yes"});
    EXPECT_EQ(config.delimiter, '\t');
    EXPECT_EQ(config.missingValues, (std::vector<std::string>{"NA", "-", "n/a"}));
    EXPECT_EQ(config.previewRows, 5u);
    EXPECT_EQ(config.outputPath, "out.tbin");
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_TRUE(config.isolatedRegistry);
}

TEST_F(TabulaConfigTest, FormatsListingNeedsNoInput) {
    const TabulaConfig config = parse({"--formats"});
    EXPECT_TRUE(config.listFormats);
    EXPECT_TRUE(config.inputPath.empty());
}

TEST_F(TabulaConfigTest, UsageErrors) {
    EXPECT_THROW(parse({}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"--delimiter", ","}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "stray"}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "--preview-rows"}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "--colour", "red"}), Tabula::ConfigurationException);
}

TEST_F(TabulaConfigTest, InvalidValues) {
    EXPECT_THROW(parse({"data.csv", "--header-numeric-ratio", "1.5"}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "--header-numeric-ratio", "0.5x"}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "--discrete-cardinality-exponent", "0"}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "--discrete-max-numeric-values", "0"}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "--preview-rows", "-2"}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "--summary", "maybe"}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "--delimiter", ";;"}), Tabula::ConfigurationException);
    EXPECT_THROW(parse({"data.csv", "--log-level", "loud"}), Tabula::ConfigurationException);
}

TEST_F(TabulaConfigTest, ConfigFileIsOverriddenByCommandLine) {
    const std::string path = dir_.file("tabula.yaml",
                                       "# reader settings\n"
                                       "delimiter: \";\"\n"
                                       "header_numeric_ratio: 0.75\n"
                                       "preview_rows: 3\n"
                                       "summary: false\n");
    const TabulaConfig config = parse({"data.csv", "--config", path, "--preview-rows", "10"});
    EXPECT_EQ(config.delimiter, ';');
    EXPECT_DOUBLE_EQ(config.headerNumericRatio, 0.75);
    EXPECT_EQ(config.previewRows, 10u);
    EXPECT_FALSE(config.summary);
    EXPECT_EQ(config.inputPath, "data.csv");
}

TEST_F(TabulaConfigTest, JsonStyleConfigFile) {
    const std::string path = dir_.file("tabula.json",
                                       "{\n"
                                       "  \"sheet\": \"Q1: totals\",\n"
                                       "  \"encoding\": \"windows-1252\",\n"
                                       "  \"discrete-cardinality-exponent\": 0.5\n"
                                       "}\n");
    TabulaConfig base;
    base.inputPath = "book.xlsx";
    const TabulaConfig config = TabulaConfig::fromFile(path, base);
    EXPECT_EQ(config.sheet, "Q1: totals");
    EXPECT_EQ(config.encoding, "windows-1252");
    EXPECT_DOUBLE_EQ(config.discreteCardinalityExponent, 0.5);
}

TEST_F(TabulaConfigTest, ConfigFileErrorsNameTheLine) {
    const std::string path = dir_.file("bad.yaml", "summary: true\nunknown_key: 1\n");
    TabulaConfig base;
    base.inputPath = "x.csv";
    try {
        TabulaConfig::fromFile(path, base);
        FAIL() << "expected ConfigurationException";
    } catch (const Tabula::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
    EXPECT_THROW(TabulaConfig::fromFile(dir_.path("absent.yaml"), base), Tabula::ConfigurationException);
}

TEST_F(TabulaConfigTest, ToReadOptionsCopiesReaderSettings) {
    const TabulaConfig config = parse({"data.csv", "--delimiter", "|", "--sheet", "2", "--encoding", "latin-1",
                                       "--discrete-max-numeric-values", "5"});
    const ReadOptions options = config.toReadOptions();
    EXPECT_EQ(options.delimiter, '|');
    EXPECT_EQ(options.sheet, "2");
    EXPECT_EQ(options.encoding, "latin-1");
    EXPECT_EQ(options.discreteMaxNumericValues, 5u);
    EXPECT_EQ(options.missingValues, config.missingValues);
    EXPECT_EQ(options.registry, nullptr);
}
