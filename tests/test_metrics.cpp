/**
 * CommTree Evaluation Tests
 */

#include <gtest/gtest.h>
#include "commtree/metrics.hpp"
#include "commtree/codec.hpp"
#include <cmath>

using namespace commtree;

namespace {

std::vector<Entity> labelled(std::initializer_list<const char*> labels) {
    std::vector<Entity> entities;
    for (const char* l : labels) {
        entities.emplace_back(Label(l));
    }
    return entities;
}

} // namespace

// ============================================================================
// Label Scores
// ============================================================================

TEST(LabelScoreTest, Ratios) {
    LabelScore s{"A", 3, 4, 6};

    EXPECT_DOUBLE_EQ(s.precision(), 0.75);
    EXPECT_DOUBLE_EQ(s.recall(), 0.5);
    EXPECT_DOUBLE_EQ(s.f1_score(), 0.6);
}

TEST(LabelScoreTest, UndefinedRatiosAreNaN) {
    LabelScore never_predicted{"A", 0, 0, 2};
    EXPECT_TRUE(std::isnan(never_predicted.precision()));
    EXPECT_DOUBLE_EQ(never_predicted.recall(), 0.0);
    EXPECT_TRUE(std::isnan(never_predicted.f1_score()));

    LabelScore never_actual{"B", 0, 2, 0};
    EXPECT_DOUBLE_EQ(never_actual.precision(), 0.0);
    EXPECT_TRUE(std::isnan(never_actual.recall()));
    EXPECT_TRUE(std::isnan(never_actual.f1_score()));
}

TEST(LabelScoreTest, ZeroPrecisionAndRecallGiveZeroF1) {
    LabelScore s{"A", 0, 3, 2};

    EXPECT_DOUBLE_EQ(s.f1_score(), 0.0);
}

// ============================================================================
// Evaluator
// ============================================================================

TEST(EvaluatorTest, ConstantPredictor) {
    Tree tree(TreeNode::make_leaf("A"));
    auto entities = labelled({"A", "B", "A", "C", "A"});

    auto report = Evaluator::score_all(tree, make_entity_list(entities));

    EXPECT_EQ(report.total, 5u);
    EXPECT_EQ(report.correct, 3u);
    EXPECT_DOUBLE_EQ(report.accuracy(), 0.6);

    const LabelScore* a = report.find("A");
    ASSERT_NE(a, nullptr);
    EXPECT_DOUBLE_EQ(a->precision(), report.accuracy());
    EXPECT_DOUBLE_EQ(a->recall(), 1.0);

    for (const char* other : {"B", "C"}) {
        const LabelScore* s = report.find(other);
        ASSERT_NE(s, nullptr);
        EXPECT_DOUBLE_EQ(s->recall(), 0.0);
        EXPECT_EQ(s->predicted, 0u);
    }
}

TEST(EvaluatorTest, LabelsInFirstOccurrenceOrder) {
    Tree tree(TreeNode::make_leaf("Z"));
    auto entities = labelled({"B", "A", "B"});

    auto report = Evaluator::score_all(tree, make_entity_list(entities));

    ASSERT_EQ(report.labels.size(), 3u);
    EXPECT_EQ(report.labels[0].label, "B");
    EXPECT_EQ(report.labels[1].label, "A");
    EXPECT_EQ(report.labels[2].label, "Z");
    EXPECT_TRUE(std::isnan(report.labels[2].recall()));
    EXPECT_EQ(report.find("missing"), nullptr);
}

TEST(EvaluatorTest, ConfusionMatrix) {
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    Tree tree = TreeCodec::parse(registry,
        R"(["DF:type", null, "A", [["line", "A"], ["block", "B"]]])");

    std::vector<Entity> entities(4);
    entities[0].set_label("A"); entities[0].set("type", "line");
    entities[1].set_label("A"); entities[1].set("type", "block");
    entities[2].set_label("B"); entities[2].set("type", "block");
    entities[3].set_label("B"); entities[3].set("type", "doc");

    auto report = Evaluator::score_all(tree, make_entity_list(entities));

    ASSERT_EQ(report.confusion.rows(), 2);
    ASSERT_EQ(report.confusion.cols(), 2);
    EXPECT_EQ(report.confusion(0, 0), 1u);
    EXPECT_EQ(report.confusion(0, 1), 1u);
    EXPECT_EQ(report.confusion(1, 0), 1u);
    EXPECT_EQ(report.confusion(1, 1), 1u);
    EXPECT_EQ(report.confusion.trace(), report.correct);
    EXPECT_EQ(report.confusion.sum(), report.total);
}

TEST(EvaluatorTest, EmptySetThrows) {
    Tree tree(TreeNode::make_leaf("A"));

    EXPECT_THROW(Evaluator::score_all(tree, EntityList()), std::invalid_argument);
}

TEST(EvaluatorTest, FormatReport) {
    Tree tree(TreeNode::make_leaf("A"));
    auto entities = labelled({"A", "A", "B", "B"});

    auto report = Evaluator::score_all(tree, make_entity_list(entities));
    std::string text = Evaluator::format_report(report);

    EXPECT_EQ(text,
        "A: prec=0.500(2/4), recl=1.000(2/2), F=0.667\n"
        "B: prec=nan(0/0), recl=0.000(0/2), F=nan\n"
        "2/4\n");
}
