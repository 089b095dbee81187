#include <gtest/gtest.h>

#include "TableBuilder.h"
#include "TabulaExceptions.h"
#include "TestSupport.h"
#include "VariableRegistry.h"

#include <cmath>

class TableBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.registry = &registry_;
    }

    Table build(std::vector<RawRow> rows) const {
        VectorRowSource source(std::move(rows));
        return TableBuilder(options_).build(source);
    }

    VariableRegistry registry_;
    ReadOptions options_;
};

TEST_F(TableBuilderTest, ThreeHeaderRowsRouteClassAndFeatures) {
    const Table table = build({
        {"a", "b", "cls"},
        {"c", "c", "d"},
        {"", "", "class"},
        {"1", "2", "x"},
        {"3", "4", "y"},
    });

    ASSERT_EQ(table.rowCount(), 2u);
    const Domain& domain = table.domain();
    ASSERT_EQ(domain.attributes.size(), 2u);
    EXPECT_EQ(domain.attributes[0], Variable::continuous("a"));
    EXPECT_EQ(domain.attributes[1], Variable::continuous("b"));
    ASSERT_EQ(domain.classVars.size(), 1u);
    EXPECT_EQ(domain.classVars[0], Variable::discrete("cls", {"x", "y"}));
    EXPECT_TRUE(domain.metas.empty());

    expectSameColumn({1, 3}, table.X()[0]);
    expectSameColumn({2, 4}, table.X()[1]);
    expectSameColumn({0, 1}, table.Y()[0]);
    EXPECT_FALSE(table.hasWeights());
}

TEST_F(TableBuilderTest, TwoHeaderRowsUseCombinedTypeCells) {
    const Table table = build({
        {"a", "b", "c"},
        {"c", "d", "s"},
        {"1", "x", "foo"},
        {"2", "y", "bar"},
    });

    const Domain& domain = table.domain();
    ASSERT_EQ(domain.attributes.size(), 2u);
    EXPECT_TRUE(domain.attributes[0].isContinuous());
    EXPECT_EQ(domain.attributes[1], Variable::discrete("b", {"x", "y"}));
    EXPECT_TRUE(domain.classVars.empty());
    ASSERT_EQ(domain.metas.size(), 1u);
    EXPECT_TRUE(domain.metas[0].isString());
    EXPECT_EQ(std::get<StringColumn>(table.metas()[0]), (StringColumn{"foo", "bar"}));
}

TEST_F(TableBuilderTest, MetaFlagWinsOverClass) {
    const Table table = build({
        {"a", "b"},
        {"c", "c"},
        {"", "meta class"},
        {"1", "2"},
    });
    EXPECT_TRUE(table.domain().classVars.empty());
    ASSERT_EQ(table.domain().metas.size(), 1u);
    EXPECT_EQ(table.domain().metas[0].name, "b");
    expectSameColumn({2}, std::get<NumericColumn>(table.metas()[0]));
}

TEST_F(TableBuilderTest, LastColumnBecomesClassWithoutTypeRows) {
    const Table table = build({
        {"A", "B", "C"},
        {"1", "2", "3"},
        {"4", "5", "6"},
        {"7", "8", "9"},
    });
    const Domain& domain = table.domain();
    ASSERT_EQ(domain.attributes.size(), 2u);
    ASSERT_EQ(domain.classVars.size(), 1u);
    EXPECT_EQ(domain.classVars[0], Variable::continuous("C"));
    expectSameColumn({3, 6, 9}, table.Y()[0]);
}

TEST_F(TableBuilderTest, SoleFeatureIsNotDemotedToClass) {
    const Table table = build({{"A"}, {"1.5"}, {"2.5"}, {"3.5"}, {"4.5"}});
    ASSERT_EQ(table.domain().attributes.size(), 1u);
    EXPECT_TRUE(table.domain().classVars.empty());
}

TEST_F(TableBuilderTest, MissingTokensBecomeNaN) {
    const Table table = build({
        {"a", "b"},
        {"continuous", "continuous"},
        {"", ""},
        {"1", ""},
        {"?", "3"},
    });
    expectSameColumn({1, NAN}, table.X()[0]);
    expectSameColumn({NAN, 3}, table.X()[1]);
}

TEST_F(TableBuilderTest, CustomMissingTokens) {
    options_.missingValues = {"n/a"};
    const Table table = build({
        {"a", "b"},
        {"c", "s"},
        {"", ""},
        {"n/a", "?"},
        {"2", "n/a"},
    });
    expectSameColumn({NAN, 2}, table.X()[0]);
    EXPECT_EQ(std::get<StringColumn>(table.metas()[0]), (StringColumn{"?", ""}));
}

TEST_F(TableBuilderTest, BlankRowsAreDroppedAndShortRowsPadded) {
    const Table table = build({
        {"a", "b", "c"},
        {"c", "c", "c"},
        {"", "", ""},
        {"1", "2", "3"},
        {"", " ", ""},
        {"4"},
    });
    ASSERT_EQ(table.rowCount(), 2u);
    expectSameColumn({2, NAN}, table.X()[1]);
    expectSameColumn({3, NAN}, table.X()[2]);
}

TEST_F(TableBuilderTest, RegistryKeepsIndexSpaceAcrossReads) {
    const Table first = build({{"color", "x"}, {"d", "c"}, {"", ""}, {"red", "1"}, {"green", "2"}});
    EXPECT_EQ(first.domain().attributes[0].values, (std::vector<std::string>{"green", "red"}));
    expectSameColumn({1, 0}, first.X()[0]);

    const Table second = build({{"color", "x"}, {"d", "c"}, {"", ""}, {"blue", "1"}, {"red", "2"}});
    EXPECT_EQ(second.domain().attributes[0].values, (std::vector<std::string>{"green", "red", "blue"}));
    expectSameColumn({2, 1}, second.X()[0]);
    EXPECT_EQ(registry_.values("color"), (std::vector<std::string>{"green", "red", "blue"}));
}

TEST_F(TableBuilderTest, UnnamedColumnsGetFeatureNames) {
    const Table table = build({
        {"", "b", ""},
        {"c", "c", "c"},
        {"", "", "class"},
        {"1", "2", "3"},
    });
    ASSERT_EQ(table.domain().attributes.size(), 2u);
    EXPECT_EQ(table.domain().attributes[0].name, "Feature 1");
    EXPECT_EQ(table.domain().attributes[1].name, "b");
    EXPECT_EQ(table.domain().classVars[0].name, "Feature 2");
}

TEST_F(TableBuilderTest, IgnoredColumnsAreDropped) {
    const Table table = build({
        {"a", "skip", "b"},
        {"c", "c", "c"},
        {"", "i", ""},
        {"1", "not a number", "2"},
    });
    EXPECT_EQ(table.domain().size(), 2u);
    EXPECT_EQ(table.domain().find("skip"), nullptr);
}

TEST_F(TableBuilderTest, WeightColumnGoesToW) {
    const Table table = build({
        {"a", "w"},
        {"c", "c"},
        {"", "weight"},
        {"1", "0.5"},
        {"2", "2"},
    });
    ASSERT_TRUE(table.hasWeights());
    expectSameColumn({0.5, 2}, table.W()[0]);
    EXPECT_EQ(table.domain().size(), 1u);
}

TEST_F(TableBuilderTest, StringWeightColumnStaysMeta) {
    const Table table = build({
        {"a", "w"},
        {"c", "s"},
        {"", "weight"},
        {"1", "heavy"},
    });
    EXPECT_FALSE(table.hasWeights());
    ASSERT_EQ(table.domain().metas.size(), 1u);
    EXPECT_EQ(table.domain().metas[0].name, "w");
}

TEST_F(TableBuilderTest, ValueListIsOrderedAndUnknownValuesAreMissing) {
    const Table table = build({
        {"size", "x"},
        {"small medium large", "c"},
        {"", ""},
        {"large", "1"},
        {"huge", "2"},
        {"small", "3"},
    });
    const Variable& size = table.domain().attributes[0];
    EXPECT_TRUE(size.ordered);
    EXPECT_EQ(size.values, (std::vector<std::string>{"small", "medium", "large"}));
    expectSameColumn({2, NAN, 0}, table.X()[0]);
    EXPECT_EQ(registry_.values("size"), size.values);
}

TEST_F(TableBuilderTest, DuplicateValueInListIsAnError) {
    try {
        build({{"a", "b"}, {"c", "x y x"}, {"", ""}, {"1", "x"}});
        FAIL() << "expected ParseException";
    } catch (const Tabula::ParseException& e) {
        EXPECT_EQ(e.column(), 1u);
        EXPECT_NE(std::string(e.what()).find("Duplicate value 'x'"), std::string::npos);
    }
}

TEST_F(TableBuilderTest, UnparsableContinuousCellReportsPosition) {
    try {
        build({{"a", "b"}, {"c", "c"}, {"", ""}, {"abc", "1"}});
        FAIL() << "expected ParseException";
    } catch (const Tabula::ParseException& e) {
        EXPECT_EQ(e.row(), 0u);
        EXPECT_EQ(e.column(), 0u);
        EXPECT_EQ(std::string(e.what()), "could not convert string to float: 'abc' (row 1, column 1)");
    }
}

TEST_F(TableBuilderTest, UnknownTypeTagFallsBackToInference) {
    LogCapture log;
    const Table table = build({{"a", "Q#b", "c"}, {"1", "1.5", "x"}, {"2", "2.5", "y"}});
    EXPECT_TRUE(log.contains("Unknown type tag 'q'"));
    const Variable* b = table.domain().find("b");
    ASSERT_NE(b, nullptr);
    EXPECT_TRUE(b->isContinuous());
}

TEST_F(TableBuilderTest, HeuristicPicksKindFromContent) {
    const Table table = build({
        {"bin", "num", "mixed", "text", "last"},
        {"0", "1.5", "1", "alpha", "1"},
        {"1", "2.5", "2", "beta", "2"},
        {"0", "3.5", "x", "gamma", "3"},
        {"1", "4.5", "1", "delta", "4"},
    });
    const Domain& domain = table.domain();
    EXPECT_EQ(domain.attributes[0], Variable::discrete("bin", {"0", "1"}));
    EXPECT_TRUE(domain.attributes[1].isContinuous());
    EXPECT_EQ(domain.attributes[2], Variable::discrete("mixed", {"1", "2", "x"}));
    ASSERT_EQ(domain.metas.size(), 1u);
    EXPECT_EQ(domain.metas[0].name, "text");
    EXPECT_TRUE(domain.metas[0].isString());
    EXPECT_EQ(domain.classVars[0].name, "last");
}

TEST_F(TableBuilderTest, InferDiscreteValuesRules) {
    const TableBuilder builder(options_);
    const std::vector<uint8_t> none(4, 0);

    auto binary = builder.inferDiscreteValues({"1", "0", "1", "0"}, none);
    ASSERT_TRUE(binary.has_value());
    EXPECT_EQ(*binary, (std::vector<std::string>{"0", "1"}));

    EXPECT_FALSE(builder.inferDiscreteValues({"1", "2", "3", "1"}, none).has_value());
    EXPECT_FALSE(builder.inferDiscreteValues({"a", "b", "c", "d"}, none).has_value());

    auto labels = builder.inferDiscreteValues({"a", "b", "a", "b"}, none);
    ASSERT_TRUE(labels.has_value());
    EXPECT_EQ(labels->size(), 2u);

    EXPECT_FALSE(builder.inferDiscreteValues({"", "", "", ""}, {1, 1, 1, 1}).has_value());
}

TEST_F(TableBuilderTest, ParseNumberIsStrict) {
    double v = 0.0;
    EXPECT_TRUE(TableBuilder::parseNumber(" +2.5e1 ", v));
    EXPECT_DOUBLE_EQ(v, 25.0);
    EXPECT_TRUE(TableBuilder::parseNumber("-3", v));
    EXPECT_DOUBLE_EQ(v, -3.0);
    EXPECT_FALSE(TableBuilder::parseNumber("3abc", v));
    EXPECT_FALSE(TableBuilder::parseNumber("", v));
    EXPECT_FALSE(TableBuilder::parseNumber("+", v));
}

TEST_F(TableBuilderTest, SourceWithoutColumnsIsAnError) {
    try {
        build({});
        FAIL() << "expected ParseException";
    } catch (const Tabula::ParseException& e) {
        EXPECT_EQ(e.cause(), "No columns found");
    }
}
