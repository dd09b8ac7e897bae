// observation_table_test.cpp - ObservationTable construction and selection

#include <gtest/gtest.h>

#include "records/observation_table.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <set>
#include <stdexcept>

using test_helpers::make_player_table;

TEST(ObservationTableTest, ColumnLookup) {
    ObservationTable table({"goals", "shots"});
    EXPECT_EQ(table.num_columns(), 2u);
    EXPECT_EQ(*table.column_index("shots"), 1u);
    EXPECT_FALSE(table.column_index("dist").has_value());
    EXPECT_TRUE(table.has_column("goals"));
}

TEST(ObservationTableTest, RejectsDuplicateColumns) {
    EXPECT_THROW(ObservationTable({"goals", "goals"}), std::invalid_argument);
}

TEST(ObservationTableTest, RejectsKeyColumnsAsFeatures) {
    EXPECT_THROW(ObservationTable({"goals", "date"}), std::invalid_argument);
    EXPECT_THROW(ObservationTable({"entity_id"}), std::invalid_argument);
}

TEST(ObservationTableTest, DerivedNamesAreStoredButReserved) {
    ObservationTable table({"goals", "weight", "age"});
    EXPECT_EQ(table.num_columns(), 3u);
    EXPECT_TRUE(table.has_column("weight"));
    EXPECT_TRUE(table.is_reserved("weight"));
    EXPECT_TRUE(table.is_reserved("age"));
    EXPECT_FALSE(table.is_key_column("weight"));
    EXPECT_FALSE(table.is_reserved("goals"));
}

TEST(ObservationTableTest, CustomSchemaReservesItsOwnNames) {
    TableSchema schema{"Player_ID", "Date"};
    EXPECT_NO_THROW(ObservationTable({"date", "goals"}, schema));
    EXPECT_THROW(ObservationTable({"Player_ID"}, schema), std::invalid_argument);
}

TEST(ObservationTableTest, RejectsRowWidthMismatch) {
    ObservationTable table({"goals", "shots"});
    EXPECT_THROW(table.add_row("A", 20240101, {1.0}), std::invalid_argument);
    EXPECT_THROW(table.add_row("", 20240101, {1.0, 2.0}), std::invalid_argument);
}

TEST(ObservationTableTest, EntityIdsAreSortedAndDistinct) {
    auto table = make_player_table();
    auto ids = table.entity_ids();
    std::vector<std::string> expected = {"A", "B", "C", "F"};
    EXPECT_EQ(ids, expected);
}

TEST(ObservationTableTest, PartitionIsDisjoint) {
    auto table = make_player_table();
    auto before = table.rows_before(20240115);
    auto on = table.rows_on(20240115);
    EXPECT_EQ(before.num_rows(), 4u);
    EXPECT_EQ(on.num_rows(), 3u);
    EXPECT_EQ(before.num_rows() + on.num_rows(), table.num_rows());
    for (const auto& r : before.rows()) EXPECT_LT(r.date, 20240115);
    for (const auto& r : on.rows()) EXPECT_EQ(r.date, 20240115);
}

TEST(ObservationTableTest, SelectionLeavesSourceUntouched) {
    auto table = make_player_table();
    auto copy = table;
    auto restricted = table.restrict_to_entities({"A"});
    EXPECT_EQ(restricted.num_rows(), 3u);
    ASSERT_EQ(table.num_rows(), copy.num_rows());
    for (size_t i = 0; i < table.num_rows(); ++i) {
        EXPECT_EQ(table.rows()[i].entity_id, copy.rows()[i].entity_id);
        EXPECT_EQ(table.rows()[i].values, copy.rows()[i].values);
    }
}

TEST(ObservationTableTest, GroupByEntityKeepsRowOrder) {
    auto table = make_player_table();
    auto groups = table.group_by_entity();
    ASSERT_EQ(groups.size(), 4u);
    ASSERT_EQ(groups["A"].size(), 3u);
    EXPECT_EQ(groups["A"][0].date, 20240101);
    EXPECT_EQ(groups["A"][2].date, 20240115);
}

TEST(ObservationTableTest, WithColumnReturnsNewTable) {
    ObservationTable table({"gf", "ga"});
    table.add_row("T", 20240101, {2.0, 1.0});
    auto derived = table.with_column("goal_diff", [](const ObservationTable& t, const ObservationRow& r) {
        return t.value(r, "gf") - t.value(r, "ga");
    });
    EXPECT_EQ(table.num_columns(), 2u);
    ASSERT_EQ(derived.num_columns(), 3u);
    EXPECT_DOUBLE_EQ(derived.rows()[0].values[2], 1.0);
    EXPECT_THROW(derived.with_column("gf", [](const ObservationTable&, const ObservationRow&) {
        return 0.0;
    }), std::invalid_argument);
}

TEST(ObservationTableTest, ValueOfUnknownColumnIsNaN) {
    auto table = make_player_table();
    EXPECT_TRUE(std::isnan(table.value(table.rows()[0], "xg")));
    EXPECT_DOUBLE_EQ(table.value(table.rows()[0], "shots"), 4.0);
}
