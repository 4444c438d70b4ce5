#include "PostProcessor.h"
#include "Statistics.h"
#include "SynthraExceptions.h"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace {

ColumnInfo column(const std::string& name, ColumnKind kind, std::optional<double> lo = std::nullopt,
                  std::optional<double> hi = std::nullopt) {
    ColumnInfo info;
    info.name = name;
    info.kind = kind;
    info.minValue = lo;
    info.maxValue = hi;
    info.isIdentifier = kind == ColumnKind::IDENTIFIER;
    return info;
}

Schema customerSchema() {
    Schema schema;
    schema.columns.push_back(column("id", ColumnKind::IDENTIFIER, 100.0, 199.0));
    schema.columns.push_back(column("age", ColumnKind::INT, 18.0, 65.0));
    schema.columns.push_back(column("score", ColumnKind::FLOAT, 0.0, 1.0));
    ColumnInfo city = column("city", ColumnKind::CATEGORICAL);
    city.categories = {"1", "2"};
    schema.columns.push_back(city);
    schema.rowCount = 100;
    schema.columnCount = 4;
    return schema;
}

} // namespace

TEST(post_processor, match_moments_hits_target_mean_and_std) {
    const auto out = PostProcessor::matchMoments({1.0, 2.0, 3.0, 4.0, 5.0}, MomentStats{10.0, 2.0});
    const ColumnStats stats = Statistics::calculateStats(out);
    EXPECT_NEAR(stats.mean, 10.0, 1e-12);
    EXPECT_NEAR(stats.stddev, 2.0, 1e-12);
}

TEST(post_processor, match_moments_keeps_missing_entries) {
    const auto out = PostProcessor::matchMoments({1.0, std::nan(""), 3.0}, MomentStats{0.0, 1.0});
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_NEAR(out[0], -std::sqrt(0.5), 1e-12);
    EXPECT_NEAR(out[2], std::sqrt(0.5), 1e-12);
}

TEST(post_processor, match_moments_degenerate_column_takes_target_mean) {
    const auto out = PostProcessor::matchMoments({5.0, 5.0, 5.0}, MomentStats{42.0, 3.0});
    for (double v : out) EXPECT_DOUBLE_EQ(v, 42.0);
    const auto single = PostProcessor::matchMoments({7.0}, MomentStats{1.5, 0.5});
    EXPECT_DOUBLE_EQ(single[0], 1.5);
}

TEST(post_processor, match_moments_without_values_is_identity) {
    EXPECT_TRUE(PostProcessor::matchMoments({}, MomentStats{1.0, 1.0}).empty());
    const auto out = PostProcessor::matchMoments({std::nan("")}, MomentStats{1.0, 1.0});
    EXPECT_TRUE(std::isnan(out[0]));
}

TEST(post_processor, sequential_identifier_counts_from_start) {
    TypedDataset data;
    data.addColumn(PostProcessor::sequentialIdentifier("id", 5, 3));
    ASSERT_EQ(data.rowCount(), 3u);
    EXPECT_EQ(data.cellText(0, 0), "5");
    EXPECT_EQ(data.cellText(0, 2), "7");
    EXPECT_EQ(data.missingCount(0), 0u);
}

TEST(post_processor, sequential_identifier_refuses_to_overflow) {
    constexpr int64_t top = std::numeric_limits<int64_t>::max();
    constexpr int64_t bottom = std::numeric_limits<int64_t>::min();
    EXPECT_TRUE(PostProcessor::identifierRangeFits(top, 1));
    EXPECT_FALSE(PostProcessor::identifierRangeFits(top, 2));
    EXPECT_TRUE(PostProcessor::identifierRangeFits(top - 9, 10));
    EXPECT_TRUE(PostProcessor::identifierRangeFits(bottom, 1000));
    EXPECT_TRUE(PostProcessor::identifierRangeFits(top, 0));

    EXPECT_EQ(PostProcessor::sequentialIdentifier("id", top - 1, 2).missing.size(), 2u);
    EXPECT_THROW(PostProcessor::sequentialIdentifier("id", top - 1, 3), Synthra::DatasetException);
}

TEST(post_processor, reconcile_clips_casts_and_regenerates_identifiers) {
    TypedDataset raw;
    raw.addColumn(TypedDataset::textColumn("city", {"1", "2", "1"}));
    raw.addColumn(TypedDataset::floatColumn("score", {-0.5, 0.5, std::nan("")}));
    raw.addColumn(TypedDataset::floatColumn("age", {10.4, 30.6, 70.0}));

    const ReconcileOutcome outcome = PostProcessor().reconcile(raw, customerSchema(), {}, 3);
    const TypedDataset& out = outcome.data;
    EXPECT_TRUE(outcome.missingColumns.empty());
    ASSERT_EQ(out.columnNames(), (std::vector<std::string>{"id", "age", "score", "city"}));

    EXPECT_EQ(out.column(0).type, ColumnType::INTEGER);
    EXPECT_EQ(out.cellText(0, 0), "100");
    EXPECT_EQ(out.cellText(0, 2), "102");

    EXPECT_EQ(out.column(1).type, ColumnType::INTEGER);
    EXPECT_EQ(out.cellText(1, 0), "18");
    EXPECT_EQ(out.cellText(1, 1), "31");
    EXPECT_EQ(out.cellText(1, 2), "65");

    EXPECT_EQ(out.column(2).type, ColumnType::FLOAT);
    EXPECT_EQ(out.cellText(2, 0), "0.0");
    EXPECT_EQ(out.cellText(2, 1), "0.5");
    EXPECT_TRUE(out.isMissing(2, 2));

    EXPECT_EQ(out.column(3).type, ColumnType::TEXT);
    EXPECT_EQ(out.cellText(3, 1), "2");
}

TEST(post_processor, reconcile_applies_moments_before_clipping) {
    Schema schema;
    schema.columns.push_back(column("x", ColumnKind::FLOAT, 0.0, 12.0));
    OriginalStatistics stats;
    stats["x"] = MomentStats{10.0, 5.0};

    TypedDataset raw;
    raw.addColumn(TypedDataset::floatColumn("x", {1.0, 2.0, 3.0}));
    const TypedDataset out = PostProcessor().reconcile(raw, schema, stats, 3).data;
    const auto values = out.numericValues(0);
    EXPECT_NEAR(values[0], 5.0, 1e-12);
    EXPECT_NEAR(values[1], 10.0, 1e-12);
    EXPECT_NEAR(values[2], 12.0, 1e-12);
}

TEST(post_processor, integer_columns_with_missing_stay_missing) {
    Schema schema;
    schema.columns.push_back(column("n", ColumnKind::INT, 0.0, 10.0));
    TypedDataset raw;
    raw.addColumn(TypedDataset::floatColumn("n", {2.2, std::nan("")}));
    const TypedDataset out = PostProcessor().reconcile(raw, schema, {}, 2).data;
    EXPECT_EQ(out.column(0).type, ColumnType::INTEGER);
    EXPECT_EQ(out.cellText(0, 0), "2");
    EXPECT_TRUE(out.isMissing(0, 1));
}

TEST(post_processor, absent_columns_are_reported_not_thrown) {
    TypedDataset raw;
    raw.addColumn(TypedDataset::floatColumn("age", {20.0, 30.0}));
    const ReconcileOutcome outcome = PostProcessor().reconcile(raw, customerSchema(), {}, 2);
    EXPECT_EQ(outcome.missingColumns, (std::vector<std::string>{"score", "city"}));
    EXPECT_EQ(outcome.data.columnNames(), (std::vector<std::string>{"id", "age"}));
}

TEST(post_processor, row_count_mismatch_throws) {
    TypedDataset raw;
    raw.addColumn(TypedDataset::floatColumn("age", {20.0, 30.0}));
    EXPECT_THROW(PostProcessor().reconcile(raw, customerSchema(), {}, 5), Synthra::DatasetException);
}
