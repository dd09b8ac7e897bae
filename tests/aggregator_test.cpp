// aggregator_test.cpp - DecayAggregator weighted means, leakage boundary,
// missing-value policies and absent-history handling

#include <gtest/gtest.h>

#include "aggregation/aggregator.hpp"
#include "date_utils.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <cstring>
#include <stdexcept>
#include <vector>

using test_helpers::make_goals_table;
using test_helpers::make_synthetic_table;
using test_helpers::NaN;
using test_helpers::INF;

namespace {

constexpr int CUTOFF = 20240115;

double expected_mean(const std::vector<std::pair<double, double>>& age_value, double alpha) {
    double num = 0.0, den = 0.0;
    for (const auto& [age, v] : age_value) {
        double w = std::exp(-alpha * age);
        num += w * v;
        den += w;
    }
    return num / den;
}

}  // anonymous namespace

// ===========================================================================
// Weighted mean
// ===========================================================================

TEST(AggregatorTest, TwoRowScenario) {
    auto table = make_goals_table({{"E", 20240101, 1.0}, {"E", 20240108, 3.0}});
    DecayAggregator agg(AggregatorConfig{0.1, MissingValuePolicy::DROP_CELL});

    auto out = agg.aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out->column_names.size(), 1u);
    EXPECT_EQ(out->column_names[0], "goals");
    EXPECT_EQ(out->entity_id, "E");
    EXPECT_EQ(out->cutoff, CUTOFF);
    EXPECT_EQ(out->rows_used, 2);
    EXPECT_NEAR(out->values[0], 2.3364, 1e-4);
    EXPECT_NEAR(out->values[0], expected_mean({{14, 1.0}, {7, 3.0}}, 0.1), 1e-12);
    EXPECT_NEAR(out->total_weight, std::exp(-1.4) + std::exp(-0.7), 1e-12);
}

TEST(AggregatorTest, RecentRowsDominate) {
    auto table = make_goals_table({{"E", 20231201, 10.0}, {"E", 20240114, 0.0}});
    auto out = DecayAggregator().aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    EXPECT_LT(out->values[0], 5.0);
}

TEST(AggregatorTest, SingleRowEqualsRowRegardlessOfWeight) {
    ObservationTable table({"goals", "shots"});
    table.add_row("E", 20230101, {1.25, 7.5});  // ancient row, tiny weight
    for (double alpha : {0.01, 0.1, 1.0}) {
        auto out = DecayAggregator(AggregatorConfig{alpha}).aggregate(table, CUTOFF);
        ASSERT_TRUE(out.has_value());
        EXPECT_DOUBLE_EQ(out->values[0], 1.25) << "alpha=" << alpha;
        EXPECT_DOUBLE_EQ(out->values[1], 7.5) << "alpha=" << alpha;
    }
}

TEST(AggregatorTest, AncientSingleRowKeepsItsValue) {
    // 2022-01-01 is 744 days before the cutoff; exp(-744) is subnormal.
    auto table = make_goals_table({{"E", 20220101, 0.3}});
    auto out = DecayAggregator(AggregatorConfig{1.0}).aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    EXPECT_DOUBLE_EQ(out->values[0], 0.3);
    EXPECT_GT(out->total_weight, 0.0);
}

TEST(AggregatorTest, NewerRowDominatesPastUnderflow) {
    // Both absolute weights clamp to the smallest double at alpha 1.0.
    auto table = make_goals_table({{"E", date_utils::add_days(CUTOFF, -900), 0.0},
                                   {"E", date_utils::add_days(CUTOFF, -800), 10.0}});
    auto out = DecayAggregator(AggregatorConfig{1.0}).aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    EXPECT_NEAR(out->values[0], 10.0, 1e-12);
    EXPECT_EQ(out->rows_used, 2);
}

TEST(AggregatorTest, OldHistoryMatchesRebasedMean) {
    // Rows twenty years before the cutoff at alpha 0.1.
    auto table = make_goals_table({{"E", date_utils::add_days(CUTOFF, -7400), 4.0},
                                   {"E", date_utils::add_days(CUTOFF, -7307), 1.0},
                                   {"E", date_utils::add_days(CUTOFF, -7300), 2.0}});
    auto out = DecayAggregator().aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    EXPECT_NEAR(out->values[0], expected_mean({{100, 4.0}, {7, 1.0}, {0, 2.0}}, 0.1), 1e-12);
}

TEST(AggregatorTest, DerivedNameColumnsAreNotAggregated) {
    ObservationTable table({"goals", "weight"});
    table.add_row("E", 20240101, {1.0, 80.0});
    table.add_row("E", 20240108, {3.0, 81.0});
    auto out = DecayAggregator().aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->column_names, (std::vector<std::string>{"goals"}));
    EXPECT_NEAR(out->values[0], 2.3364, 1e-4);
}

TEST(AggregatorTest, LargerAlphaFavorsRecentRows) {
    auto table = make_goals_table({{"E", 20240101, 1.0}, {"E", 20240114, 3.0}});
    auto slow = DecayAggregator(AggregatorConfig{0.01}).aggregate(table, CUTOFF);
    auto fast = DecayAggregator(AggregatorConfig{1.0}).aggregate(table, CUTOFF);
    ASSERT_TRUE(slow && fast);
    EXPECT_GT(fast->values[0], slow->values[0]);
}

// ===========================================================================
// Leakage boundary
// ===========================================================================

TEST(AggregatorTest, RowsOnOrAfterCutoffAreIgnored) {
    auto base = make_goals_table({{"E", 20240101, 1.0}, {"E", 20240108, 3.0}});
    auto with_future = make_goals_table({{"E", 20240101, 1.0}, {"E", 20240108, 3.0},
                                         {"E", CUTOFF, 100.0}, {"E", 20240120, -50.0}});
    auto a = DecayAggregator().aggregate(base, CUTOFF);
    auto b = DecayAggregator().aggregate(with_future, CUTOFF);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->values, b->values);
    EXPECT_EQ(b->rows_used, 2);
}

TEST(AggregatorTest, BoundaryIsExclusive) {
    auto table = make_goals_table({{"E", CUTOFF, 5.0}});
    EXPECT_FALSE(DecayAggregator().aggregate(table, CUTOFF).has_value());
    auto next_day = DecayAggregator().aggregate(table, 20240116);
    ASSERT_TRUE(next_day.has_value());
    EXPECT_DOUBLE_EQ(next_day->values[0], 5.0);
}

// ===========================================================================
// Absent history
// ===========================================================================

TEST(AggregatorTest, NoHistoryIsAbsent) {
    auto table = make_goals_table({{"F", CUTOFF, 2.0}});
    EXPECT_FALSE(DecayAggregator().aggregate(table, CUTOFF).has_value());
}

TEST(AggregatorTest, EmptyRowsIsAbsent) {
    ObservationTable table({"goals"});
    EXPECT_FALSE(DecayAggregator().aggregate(table, CUTOFF).has_value());
}

TEST(AggregatorTest, AllCellsMissingIsAbsent) {
    auto table = make_goals_table({{"E", 20240101, NaN}, {"E", 20240102, INF}});
    EXPECT_FALSE(DecayAggregator().aggregate(table, CUTOFF).has_value());
}

// ===========================================================================
// Missing-value policies
// ===========================================================================

TEST(AggregatorTest, DropCellExcludesOnlyTheCell) {
    ObservationTable table({"goals", "shots"});
    table.add_row("E", 20240101, {1.0, NaN});
    table.add_row("E", 20240108, {3.0, 6.0});

    auto out = DecayAggregator().aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    EXPECT_NEAR(*out->get("goals"), expected_mean({{14, 1.0}, {7, 3.0}}, 0.1), 1e-12);
    EXPECT_DOUBLE_EQ(*out->get("shots"), 6.0);
    EXPECT_EQ(out->rows_used, 2);
}

TEST(AggregatorTest, DropRowExcludesWholeRow) {
    ObservationTable table({"goals", "shots"});
    table.add_row("E", 20240101, {1.0, NaN});
    table.add_row("E", 20240108, {3.0, 6.0});

    auto out = DecayAggregator(AggregatorConfig{0.1, MissingValuePolicy::DROP_ROW})
                   .aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    EXPECT_DOUBLE_EQ(*out->get("goals"), 3.0);
    EXPECT_DOUBLE_EQ(*out->get("shots"), 6.0);
    EXPECT_EQ(out->rows_used, 1);
}

TEST(AggregatorTest, FillZeroKeepsWeight) {
    ObservationTable table({"goals", "shots"});
    table.add_row("E", 20240101, {1.0, NaN});
    table.add_row("E", 20240108, {3.0, 6.0});

    auto out = DecayAggregator(AggregatorConfig{0.1, MissingValuePolicy::FILL_ZERO})
                   .aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    EXPECT_NEAR(*out->get("shots"), expected_mean({{14, 0.0}, {7, 6.0}}, 0.1), 1e-12);
}

TEST(AggregatorTest, ColumnWithoutFiniteValuesIsOmitted) {
    ObservationTable table({"goals", "xg"});
    table.add_row("E", 20240101, {1.0, NaN});
    table.add_row("E", 20240108, {3.0, -INF});

    auto out = DecayAggregator().aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->has_column("goals"));
    EXPECT_FALSE(out->has_column("xg"));
    for (double v : out->values) EXPECT_TRUE(std::isfinite(v));
}

TEST(AggregatorTest, OutputNeverContainsNonFinite) {
    ObservationTable table({"a", "b", "c"});
    table.add_row("E", 20240101, {INF, 1.0, NaN});
    table.add_row("E", 20240105, {2.0, NaN, NaN});
    table.add_row("E", 20240110, {-INF, 3.0, 4.0});
    for (auto policy : {MissingValuePolicy::DROP_CELL, MissingValuePolicy::FILL_ZERO}) {
        auto out = DecayAggregator(AggregatorConfig{0.1, policy}).aggregate(table, CUTOFF);
        ASSERT_TRUE(out.has_value());
        for (double v : out->values) EXPECT_TRUE(std::isfinite(v)) << policy_name(policy);
    }
}

// ===========================================================================
// Column selection
// ===========================================================================

TEST(AggregatorTest, RequestedColumnsOnlyInRequestedOrder) {
    ObservationTable table({"goals", "shots", "dist"});
    table.add_row("E", 20240101, {1.0, 2.0, 3.0});
    auto out = DecayAggregator().aggregate(table, CUTOFF, {"dist", "goals"});
    ASSERT_TRUE(out.has_value());
    std::vector<std::string> expected = {"dist", "goals"};
    EXPECT_EQ(out->column_names, expected);
    EXPECT_DOUBLE_EQ(out->values[0], 3.0);
    EXPECT_DOUBLE_EQ(out->values[1], 1.0);
}

TEST(AggregatorTest, OutputColumnsAreSubsetOfInput) {
    auto table = make_synthetic_table(1, 10, CUTOFF, 5);
    auto out = DecayAggregator().aggregate(table, CUTOFF);
    ASSERT_TRUE(out.has_value());
    for (const auto& c : out->column_names) EXPECT_TRUE(table.has_column(c)) << c;
}

TEST(AggregatorTest, RejectsUnknownOrReservedColumns) {
    auto table = make_goals_table({{"E", 20240101, 1.0}});
    EXPECT_THROW(DecayAggregator().aggregate(table, CUTOFF, {"xg"}), std::invalid_argument);
    EXPECT_THROW(DecayAggregator().aggregate(table, CUTOFF, {"date"}), std::invalid_argument);
    EXPECT_THROW(DecayAggregator().aggregate(table, CUTOFF, {"weight"}), std::invalid_argument);
}

// ===========================================================================
// Contract checks
// ===========================================================================

TEST(AggregatorTest, RejectsMixedEntities) {
    auto table = make_goals_table({{"A", 20240101, 1.0}, {"B", 20240102, 1.0}});
    EXPECT_THROW(DecayAggregator().aggregate(table, CUTOFF), std::invalid_argument);
}

TEST(AggregatorTest, RejectsNonPositiveAlpha) {
    EXPECT_THROW(DecayAggregator(AggregatorConfig{0.0}), std::invalid_argument);
    EXPECT_THROW(DecayAggregator(AggregatorConfig{-0.5}), std::invalid_argument);
}

TEST(AggregatorTest, IdempotentBitIdentical) {
    auto table = make_synthetic_table(1, 30, CUTOFF, 6);
    DecayAggregator agg;
    auto a = agg.aggregate(table, CUTOFF);
    auto b = agg.aggregate(table, CUTOFF);
    ASSERT_TRUE(a && b);
    ASSERT_EQ(a->values.size(), b->values.size());
    EXPECT_EQ(std::memcmp(a->values.data(), b->values.data(), a->values.size() * sizeof(double)), 0);
}

TEST(AggregatorTest, DoesNotMutateInput) {
    auto table = make_goals_table({{"E", 20240101, 1.0}, {"E", 20240108, NaN}});
    auto before_cols = table.column_names();
    DecayAggregator().aggregate(table, CUTOFF);
    EXPECT_EQ(table.column_names(), before_cols);
    EXPECT_EQ(table.num_rows(), 2u);
    EXPECT_DOUBLE_EQ(table.rows()[0].values[0], 1.0);
    EXPECT_TRUE(std::isnan(table.rows()[1].values[0]));
}

// ===========================================================================
// Policy names
// ===========================================================================

TEST(MissingValuePolicyTest, ParseAndName) {
    EXPECT_EQ(parse_policy("drop-cell"), MissingValuePolicy::DROP_CELL);
    EXPECT_EQ(parse_policy("drop-row"), MissingValuePolicy::DROP_ROW);
    EXPECT_EQ(parse_policy("fill-zero"), MissingValuePolicy::FILL_ZERO);
    EXPECT_EQ(policy_name(MissingValuePolicy::DROP_ROW), "drop-row");
    EXPECT_THROW(parse_policy("drop"), std::invalid_argument);
}

TEST(MissingValuePolicyTest, DefaultIsDropCell) {
    AggregatorConfig config;
    EXPECT_EQ(config.policy, MissingValuePolicy::DROP_CELL);
    EXPECT_DOUBLE_EQ(config.alpha, 0.1);
}
