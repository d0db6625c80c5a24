/**
 * CommTree Tree Codec Implementation
 */

#include "commtree/codec.hpp"
#include <fstream>
#include <iterator>
#include <ostream>
#include <istream>
#include <stdexcept>
#include <vector>

namespace commtree {

// ============================================================================
// Export
// ============================================================================

TreeCodec::Json TreeCodec::export_value(const BranchValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        return Json(*b);
    }
    if (const std::string* s = std::get_if<std::string>(&value)) {
        return Json(*s);
    }
    return Json(nullptr);
}

TreeCodec::Json TreeCodec::export_arg(const SplitArg& arg) {
    if (const std::string* s = std::get_if<std::string>(&arg)) {
        return Json(*s);
    }
    if (const Float* f = std::get_if<Float>(&arg)) {
        return Json(*f);
    }
    return Json(nullptr);
}

TreeCodec::Json TreeCodec::export_node(const TreeNode& node) {
    if (node.is_leaf) {
        return Json(node.label);
    }

    Json children = Json::array();
    for (const auto& c : node.children) {
        children.push_back(Json::array({export_value(c.value), export_node(*c.node)}));
    }

    return Json::array({
        node.feature->name(),
        export_arg(node.arg),
        node.label,
        std::move(children)
    });
}

TreeCodec::Json TreeCodec::export_tree(const Tree& tree) {
    return export_node(tree.root());
}

// ============================================================================
// Import
// ============================================================================

BranchValue TreeCodec::import_value(const Json& data) {
    if (data.is_null()) return BranchValue();
    if (data.is_boolean()) return BranchValue(data.get<bool>());
    if (data.is_string()) return BranchValue(data.get<std::string>());
    throw TreeParseError("branch value must be null, a boolean or a string");
}

SplitArg TreeCodec::import_arg(const Feature& feature, const Json& data) {
    switch (feature.arg_kind()) {
        case SplitArgKind::None:
            if (!data.is_null()) {
                throw TreeParseError("split argument of " + feature.name() + " must be null");
            }
            return SplitArg();
        case SplitArgKind::Token:
            if (!data.is_string()) {
                throw TreeParseError("split argument of " + feature.name() + " must be a string");
            }
            return SplitArg(data.get<std::string>());
        case SplitArgKind::Threshold:
            if (!data.is_number()) {
                throw TreeParseError("split argument of " + feature.name() + " must be a number");
            }
            return SplitArg(data.get<Float>());
    }
    throw TreeParseError("unsupported split argument kind for " + feature.name());
}

namespace {

// Branch values a feature can actually produce
bool value_fits(const Feature& feature, const BranchValue& value) {
    switch (feature.arg_kind()) {
        case SplitArgKind::None:
            return !std::holds_alternative<bool>(value);
        case SplitArgKind::Token:
            return std::holds_alternative<bool>(value);
        case SplitArgKind::Threshold: {
            const std::string* s = std::get_if<std::string>(&value);
            return s && (*s == QuantitativeFeature::kBelow ||
                         *s == QuantitativeFeature::kAtOrAbove ||
                         *s == QuantitativeFeature::kUndefined);
        }
    }
    return false;
}

// Labels are strings; other scalars keep their JSON text
bool import_label(const TreeCodec::Json& data, Label& label) {
    if (data.is_string()) {
        label = data.get<std::string>();
        return true;
    }
    if (data.is_number() || data.is_boolean()) {
        label = data.dump();
        return true;
    }
    return false;
}

} // namespace

std::unique_ptr<TreeNode> TreeCodec::import_node(const FeatureRegistry& registry, const Json& data) {
    Label label;
    if (import_label(data, label)) {
        return TreeNode::make_leaf(std::move(label));
    }
    if (!data.is_array()) {
        throw TreeParseError("node must be a scalar label or a branch array, got " +
                             std::string(data.type_name()));
    }
    if (data.size() != 4) {
        throw TreeParseError("branch must have 4 elements, got " + std::to_string(data.size()));
    }
    if (!data[0].is_string()) {
        throw TreeParseError("feature name must be a string");
    }

    const Feature& feature = registry.get(data[0].get<std::string>());
    SplitArg arg = import_arg(feature, data[1]);

    Label default_label;
    if (!import_label(data[2], default_label)) {
        throw TreeParseError("default label of " + feature.name() + " must be a scalar");
    }
    if (!data[3].is_array() || data[3].empty()) {
        throw TreeParseError("children of " + feature.name() + " must be a non-empty array");
    }

    std::vector<TreeChild> children;
    children.reserve(data[3].size());

    for (const auto& entry : data[3]) {
        if (!entry.is_array() || entry.size() != 2) {
            throw TreeParseError("child of " + feature.name() + " must be a [value, node] pair");
        }
        BranchValue value = import_value(entry[0]);
        if (!value_fits(feature, value)) {
            throw TreeParseError("branch value " + entry[0].dump() +
                                 " cannot be produced by " + feature.name());
        }
        for (const auto& c : children) {
            if (c.value == value) {
                throw TreeParseError("duplicate branch value " + entry[0].dump() +
                                     " under " + feature.name());
            }
        }
        children.push_back(TreeChild{std::move(value), import_node(registry, entry[1])});
    }

    return TreeNode::make_branch(feature, std::move(arg), std::move(default_label),
                                 std::move(children));
}

Tree TreeCodec::import_tree(const FeatureRegistry& registry, const Json& data) {
    return Tree(import_node(registry, data));
}

// ============================================================================
// Text and File Form
// ============================================================================

std::string TreeCodec::to_string(const Tree& tree, int indent) {
    return export_tree(tree).dump(indent);
}

Tree TreeCodec::parse(const FeatureRegistry& registry, const std::string& text) {
    Json data;
    try {
        data = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw TreeParseError(e.what());
    }
    return import_tree(registry, data);
}

void TreeCodec::save(const Tree& tree, std::ostream& out) {
    out << to_string(tree) << "\n";
    if (!out) {
        throw std::runtime_error("Failed to write tree");
    }
}

Tree TreeCodec::load(const FeatureRegistry& registry, std::istream& in) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(registry, text);
}

void TreeCodec::save(const Tree& tree, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    save(tree, out);
}

Tree TreeCodec::load(const FeatureRegistry& registry, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file for reading: " + path);
    }
    return load(registry, in);
}

} // namespace commtree
