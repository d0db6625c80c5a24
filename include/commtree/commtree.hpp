#pragma once

/**
 * CommTree: Entropy-Driven Decision Trees for Comment Classification
 *
 * Induces a classification tree from labelled comment records and scores
 * its predictions.
 *
 * Usage:
 * ```cpp
 * #include <commtree/commtree.hpp>
 *
 * commtree::Config config = commtree::Config::categories();
 * auto registry = commtree::FeatureRegistry::for_set(config.features);
 *
 * commtree::EntityLoader loader(config);
 * auto entities = loader.load("comments.jsonl");
 *
 * commtree::TreeBuilder builder(registry, config);
 * commtree::Tree tree = builder.fit(entities);
 * commtree::TreeCodec::save(tree, "comments.tree.json");
 * ```
 *
 * Scoring a persisted tree:
 * ```cpp
 * commtree::Tree tree = commtree::TreeCodec::load(registry, "comments.tree.json");
 * auto report = commtree::Evaluator::score_all(tree, commtree::make_entity_list(entities));
 * std::fputs(commtree::Evaluator::format_report(report).c_str(), stdout);
 * ```
 *
 * @version 0.3.0
 */

#define COMMTREE_VERSION_MAJOR 0
#define COMMTREE_VERSION_MINOR 3
#define COMMTREE_VERSION_PATCH 0
#define COMMTREE_VERSION_STRING "0.3.0"

#include "commtree/types.hpp"
#include "commtree/config.hpp"
#include "commtree/entropy.hpp"
#include "commtree/feature.hpp"
#include "commtree/tree.hpp"
#include "commtree/codec.hpp"
#include "commtree/metrics.hpp"
#include "commtree/dataset.hpp"

#include <cstdio>

namespace commtree {

/**
 * Library version information
 */
struct Version {
    static constexpr int major = COMMTREE_VERSION_MAJOR;
    static constexpr int minor = COMMTREE_VERSION_MINOR;
    static constexpr int patch = COMMTREE_VERSION_PATCH;
    static constexpr const char* string = COMMTREE_VERSION_STRING;
};

/**
 * Print library info
 */
inline void print_info() {
    std::printf("CommTree v%s\n", Version::string);
    std::printf("  Category features: %zu\n", FeatureRegistry::comment_categories().size());
    std::printf("  Target features:   %zu\n", FeatureRegistry::comment_targets().size());
}

} // namespace commtree
