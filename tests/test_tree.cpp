/**
 * CommTree Tree Tests
 */

#include <gtest/gtest.h>
#include "commtree/tree.hpp"
#include "commtree/metrics.hpp"
#include <sstream>

using namespace commtree;

namespace {

Entity make(const std::string& label, std::initializer_list<std::pair<const char*, const char*>> attrs) {
    Entity e(label);
    for (const auto& kv : attrs) {
        e.set(kv.first, kv.second);
    }
    return e;
}

BuilderConfig exhaustive() {
    BuilderConfig config;
    config.min_entropy = 0.0;
    config.min_count = 1;
    return config;
}

std::string dump(const Tree& tree) {
    std::ostringstream out;
    tree.dump(out);
    return out.str();
}

std::vector<Entity> mixed_entities() {
    return {
        make("X", {{"type", "line"}, {"tags", "a,b"}, {"value", "1"}}),
        make("Y", {{"type", "line"}, {"tags", "b"}, {"value", "2"}}),
        make("X", {{"type", "block"}, {"tags", "a"}, {"value", "3"}}),
        make("Z", {{"type", "block"}, {"tags", "c"}, {"value", "4"}}),
        make("Z", {{"type", "line"}, {"tags", "a,c"}, {"value", "5"}}),
        make("Y", {{"type", "doc"}, {"tags", "b"}, {"value", "6"}}),
        make("X", {{"type", "doc"}, {"tags", "a"}}),
    };
}

FeatureRegistry mixed_registry() {
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    registry.emplace<MembershipFeature>("tags");
    registry.emplace<QuantitativeFeature>("value");
    return registry;
}

} // namespace

// ============================================================================
// TreeNode
// ============================================================================

TEST(TreeNodeTest, LeafDefaults) {
    auto leaf = TreeNode::make_leaf("A");

    EXPECT_TRUE(leaf->is_leaf);
    EXPECT_EQ(leaf->label, "A");
    EXPECT_EQ(leaf->feature, nullptr);
    EXPECT_EQ(leaf->n_nodes(), 1u);
    EXPECT_EQ(leaf->n_leaves(), 1u);
    EXPECT_EQ(leaf->depth(), 0);
}

TEST(TreeTest, DefaultConstruction) {
    Tree tree;

    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.n_nodes(), 0u);
    EXPECT_EQ(tree.n_leaves(), 0u);
    EXPECT_THROW(tree.root(), std::logic_error);
}

// ============================================================================
// TreeBuilder
// ============================================================================

TEST(TreeBuilderTest, ExhaustiveTreeReproducesTrainingLabels) {
    auto entities = mixed_entities();
    auto registry = mixed_registry();
    TreeBuilder builder(registry, exhaustive());

    Tree tree = builder.fit(entities);

    ASSERT_FALSE(tree.root().is_leaf);
    for (const auto& e : entities) {
        EXPECT_EQ(tree.classify(e), e.label());
    }
}

TEST(TreeBuilderTest, ChildStopsBecomeMajorityLeaves) {
    std::vector<Entity> entities = {
        make("A", {{"type", "line"}}),
        make("A", {{"type", "line"}}),
        make("B", {{"type", "line"}}),
        make("B", {{"type", "block"}}),
        make("B", {{"type", "block"}}),
    };
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    BuilderConfig config;
    config.min_entropy = 0.0;
    config.min_count = 3;
    TreeBuilder builder(registry, config);

    auto root = builder.build(make_entity_list(entities));

    ASSERT_NE(root, nullptr);
    EXPECT_FALSE(root->is_leaf);
    EXPECT_EQ(root->feature->name(), "DF:type");
    EXPECT_EQ(root->default_label(), "B");

    ASSERT_EQ(root->children.size(), 2u);
    const TreeNode* line = root->child(BranchValue(std::string("line")));
    const TreeNode* block = root->child(BranchValue(std::string("block")));
    ASSERT_NE(line, nullptr);
    ASSERT_NE(block, nullptr);
    EXPECT_TRUE(line->is_leaf);
    EXPECT_EQ(line->label, "A");
    EXPECT_TRUE(block->is_leaf);
    EXPECT_EQ(block->label, "B");

    EXPECT_EQ(root->n_nodes(), 3u);
    EXPECT_EQ(root->n_leaves(), 2u);
    EXPECT_EQ(root->depth(), 1);
}

TEST(TreeBuilderTest, StopsBelowMinimumCount) {
    std::vector<Entity> entities = {
        make("A", {{"type", "line"}}),
        make("B", {{"type", "block"}}),
        make("B", {{"type", "block"}}),
    };
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    TreeBuilder builder(registry);  // min_count 10

    EXPECT_EQ(builder.build(make_entity_list(entities)), nullptr);

    Tree tree = builder.fit(entities);
    ASSERT_TRUE(tree.root().is_leaf);
    EXPECT_EQ(tree.root().label, "B");
}

TEST(TreeBuilderTest, StopsBelowMinimumEntropy) {
    std::vector<Entity> entities = {
        make("A", {{"type", "line"}}),
        make("A", {{"type", "line"}}),
        make("A", {{"type", "line"}}),
        make("A", {{"type", "line"}}),
        make("B", {{"type", "block"}}),
    };
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    BuilderConfig config;
    config.min_count = 1;
    config.min_entropy = 0.8;  // dataset entropy is about 0.72
    TreeBuilder builder(registry, config);

    EXPECT_EQ(builder.build(make_entity_list(entities)), nullptr);

    config.min_entropy = 0.5;
    TreeBuilder lower(registry, config);
    EXPECT_NE(lower.build(make_entity_list(entities)), nullptr);
}

TEST(TreeBuilderTest, StopsWithoutDiscerningFeature) {
    std::vector<Entity> entities = {
        make("A", {{"type", "line"}}),
        make("B", {{"type", "line"}}),
    };
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    registry.emplace<QuantitativeFeature>("value");
    TreeBuilder builder(registry, exhaustive());

    EXPECT_EQ(builder.build(make_entity_list(entities)), nullptr);
}

TEST(TreeBuilderTest, EmptyEntitySetThrows) {
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    TreeBuilder builder(registry, exhaustive());

    EXPECT_THROW(builder.build(EntityList()), std::invalid_argument);
    EXPECT_THROW(builder.fit(EntityList()), std::invalid_argument);
}

TEST(TreeBuilderTest, PrefersLowerWeightedEntropy) {
    std::vector<Entity> entities = {
        make("A", {{"noisy", "p"}, {"clean", "u"}}),
        make("A", {{"noisy", "q"}, {"clean", "u"}}),
        make("B", {{"noisy", "p"}, {"clean", "v"}}),
        make("B", {{"noisy", "q"}, {"clean", "v"}}),
    };
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("noisy");
    registry.emplace<DiscreteFeature>("clean");
    TreeBuilder builder(registry, exhaustive());

    auto root = builder.build(make_entity_list(entities));

    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->feature->name(), "DF:clean");
}

TEST(TreeBuilderTest, TiesGoToFirstRegisteredFeature) {
    std::vector<Entity> entities = {
        make("A", {{"first", "p"}, {"second", "u"}}),
        make("B", {{"first", "q"}, {"second", "v"}}),
    };
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("second");
    registry.emplace<DiscreteFeature>("first");
    TreeBuilder builder(registry, exhaustive());

    auto root = builder.build(make_entity_list(entities));

    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->feature->name(), "DF:second");
}

TEST(TreeBuilderTest, IdenticalInputGivesIdenticalTree) {
    auto entities = mixed_entities();
    auto registry = mixed_registry();
    TreeBuilder builder(registry, exhaustive());

    Tree a = builder.fit(entities);
    Tree b = builder.fit(entities);

    EXPECT_EQ(dump(a), dump(b));
    EXPECT_EQ(a.n_nodes(), b.n_nodes());
}

TEST(TreeBuilderTest, VerboseBuildLogsProgress) {
    auto entities = mixed_entities();
    auto registry = mixed_registry();
    TreeBuilder builder(registry, exhaustive(), 2);

    testing::internal::CaptureStdout();
    Tree tree = builder.fit(entities);
    std::string log = testing::internal::GetCapturedStdout();

    EXPECT_NE(log.find("Build: "), std::string::npos);
    EXPECT_NE(log.find("Feature: "), std::string::npos);
    EXPECT_NE(log.find("Tree built from 7 entities"), std::string::npos);
}

TEST(TreeBuilderTest, ConfigConstructionValidates) {
    FeatureRegistry registry;
    Config config;
    config.builder.min_entropy = -0.5;

    EXPECT_THROW({ TreeBuilder builder(registry, config); }, std::invalid_argument);
}

// ============================================================================
// Classification
// ============================================================================

TEST(ClassifyTest, UnseenValueFallsBackToDefault) {
    std::vector<Entity> entities = {
        make("A", {{"type", "line"}}),
        make("B", {{"type", "block"}}),
        make("A", {{"type", "line"}}),
    };
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    TreeBuilder builder(registry, exhaustive());

    Tree tree = builder.fit(entities);
    ASSERT_FALSE(tree.root().is_leaf);
    EXPECT_EQ(tree.root().default_label(), "A");

    EXPECT_EQ(tree.classify(make("B", {{"type", "doc"}})), "A");
    EXPECT_EQ(tree.classify(Entity("B")), "A");
    EXPECT_EQ(tree.classify(make("A", {{"type", "block"}})), "B");
}

TEST(ClassifyTest, DumpShowsBranchesAndLeaves) {
    std::vector<Entity> entities = {
        make("A", {{"type", "line"}}),
        make("B", {{"type", "block"}}),
    };
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    TreeBuilder builder(registry, exhaustive());

    std::string text = dump(builder.fit(entities));

    EXPECT_NE(text.find("Branch DF:type: null, default=A"), std::string::npos);
    EXPECT_NE(text.find(" Value: \"line\" ->"), std::string::npos);
    EXPECT_NE(text.find("  Leaf B"), std::string::npos);
}
