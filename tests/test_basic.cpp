/**
 * CommTree Tests
 */

#include <gtest/gtest.h>
#include "commtree/commtree.hpp"
#include <cmath>

// ============================================================================
// Types Tests
// ============================================================================

TEST(TypesTest, EntityAttributes) {
    commtree::Entity e("note");
    e.set("type", "line");

    ASSERT_NE(e.get("type"), nullptr);
    EXPECT_EQ(*e.get("type"), "line");
    EXPECT_EQ(e.get("missing"), nullptr);
    EXPECT_TRUE(e.has("type"));
    EXPECT_EQ(e.label(), "note");
}

TEST(TypesTest, EntityList) {
    std::vector<commtree::Entity> entities(3);
    auto list = commtree::make_entity_list(entities);

    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[1], &entities[1]);
}

TEST(TypesTest, BranchValueToString) {
    EXPECT_EQ(commtree::to_string(commtree::BranchValue()), "null");
    EXPECT_EQ(commtree::to_string(commtree::BranchValue(true)), "true");
    EXPECT_EQ(commtree::to_string(commtree::BranchValue(std::string("lt"))), "\"lt\"");
}

TEST(TypesTest, SplitArgToString) {
    EXPECT_EQ(commtree::to_string(commtree::SplitArg()), "null");
    EXPECT_EQ(commtree::to_string(commtree::SplitArg(5.0)), "5");
    EXPECT_EQ(commtree::to_string(commtree::SplitArg(std::string("x"))), "\"x\"");
}

// ============================================================================
// Entropy Tests
// ============================================================================

TEST(EntropyTest, PureDistributionIsZero) {
    for (commtree::Index n : {1u, 2u, 7u, 1000u}) {
        EXPECT_DOUBLE_EQ(commtree::entropy({n}), 0.0);
    }
}

TEST(EntropyTest, UniformDistributionIsLog2K) {
    EXPECT_NEAR(commtree::entropy({5, 5}), 1.0, 1e-12);
    EXPECT_NEAR(commtree::entropy({3, 3, 3}), std::log2(3.0), 1e-12);
    EXPECT_NEAR(commtree::entropy({2, 2, 2, 2}), 2.0, 1e-12);
}

TEST(EntropyTest, SkewedDistribution) {
    // 3:1 split
    double expected = 0.75 * std::log2(4.0 / 3.0) + 0.25 * std::log2(4.0);
    EXPECT_NEAR(commtree::entropy({3, 1}), expected, 1e-12);
}

TEST(EntropyTest, EmptyDistributionThrows) {
    EXPECT_THROW(commtree::entropy({}), std::invalid_argument);
    EXPECT_THROW(commtree::entropy({3, 0}), std::invalid_argument);
}

TEST(EntropyTest, LabelCountsKeepFirstOccurrenceOrder) {
    std::vector<commtree::Entity> entities = {
        commtree::Entity("b"), commtree::Entity("a"), commtree::Entity("b")
    };
    auto counts = commtree::label_counts(commtree::make_entity_list(entities));

    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts.begin()->first, "b");
    EXPECT_EQ(counts.count("b"), 2u);
    EXPECT_EQ(counts.count("a"), 1u);
    EXPECT_EQ(counts.total(), 3u);
}

TEST(EntropyTest, MajorityLabelTiesGoToFirstSeen) {
    commtree::LabelCounts counts;
    counts.add("x", 2);
    counts.add("y", 3);
    counts.add("z", 3);

    EXPECT_EQ(commtree::majority_label(counts), "y");
    EXPECT_THROW(commtree::majority_label(commtree::LabelCounts()), std::invalid_argument);
}

TEST(EntropyTest, DatasetEntropyOfEmptySetThrows) {
    EXPECT_THROW(commtree::dataset_entropy({}), std::invalid_argument);
}

// ============================================================================
// Config Tests
// ============================================================================

TEST(ConfigTest, DefaultValues) {
    commtree::Config config;

    EXPECT_DOUBLE_EQ(config.builder.min_entropy, 0.10);
    EXPECT_EQ(config.builder.min_count, 10u);
    EXPECT_EQ(config.label_attribute, "key");
    EXPECT_EQ(config.features, commtree::FeatureSet::Categories);
}

TEST(ConfigTest, TargetsPreset) {
    auto config = commtree::Config::targets();

    EXPECT_EQ(config.features, commtree::FeatureSet::Targets);
}

TEST(ConfigTest, Validation) {
    commtree::Config config;

    EXPECT_NO_THROW(config.validate());

    config.builder.min_entropy = -1.0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = commtree::Config();
    config.label_attribute.clear();
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

// ============================================================================
// Version Tests
// ============================================================================

TEST(VersionTest, VersionInfo) {
    EXPECT_EQ(commtree::Version::major, 0);
    EXPECT_EQ(commtree::Version::minor, 3);
    EXPECT_EQ(commtree::Version::patch, 0);
    EXPECT_STREQ(commtree::Version::string, "0.3.0");
}

// Main
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
