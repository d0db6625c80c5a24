#pragma once

/**
 * CommTree Tree Codec
 *
 * Persisted form of a tree (JSON):
 *   Branch -> [feature_name, split_arg, default_label, [[branch_value, child], ...]]
 *   Leaf   -> "label"
 *
 * split_arg is null, a string token or a number threshold; branch_value is
 * null, a boolean or a string. Any non-null scalar is a label: numbers and
 * booleans are read back as their JSON text, so a leaf 5 imports as "5".
 * Import validates every node against this grammar and against the feature
 * kinds in the registry.
 */

#include "types.hpp"
#include "feature.hpp"
#include "tree.hpp"
#include <nlohmann/json.hpp>
#include <iosfwd>
#include <memory>
#include <string>

namespace commtree {

class TreeCodec {
public:
    using Json = nlohmann::json;

    // ========================================================================
    // Structured form
    // ========================================================================

    static Json export_node(const TreeNode& node);
    static Json export_tree(const Tree& tree);

    /**
     * Rebuild a tree from its structured form.
     * Throws UnknownFeature for a feature missing from registry and
     * TreeParseError for anything outside the Branch/Leaf grammar.
     */
    static std::unique_ptr<TreeNode> import_node(const FeatureRegistry& registry, const Json& data);
    static Tree import_tree(const FeatureRegistry& registry, const Json& data);

    // ========================================================================
    // Text and file form
    // ========================================================================

    static std::string to_string(const Tree& tree, int indent = -1);

    // Throws TreeParseError on malformed JSON text
    static Tree parse(const FeatureRegistry& registry, const std::string& text);

    static void save(const Tree& tree, std::ostream& out);
    static Tree load(const FeatureRegistry& registry, std::istream& in);

    // Throw std::runtime_error when the file cannot be opened
    static void save(const Tree& tree, const std::string& path);
    static Tree load(const FeatureRegistry& registry, const std::string& path);

private:
    static Json export_value(const BranchValue& value);
    static Json export_arg(const SplitArg& arg);
    static BranchValue import_value(const Json& data);
    static SplitArg import_arg(const Feature& feature, const Json& data);
};

} // namespace commtree
