/**
 * CommTree Tree Implementation
 */

#include "commtree/tree.hpp"
#include "commtree/metrics.hpp"
#include <algorithm>
#include <cstdio>
#include <ostream>
#include <stdexcept>
#include <string>

namespace commtree {

namespace {

std::string format_counts(const LabelCounts& counts) {
    std::string out = "{";
    bool first = true;
    for (const auto& entry : counts) {
        if (!first) out += ", ";
        out += entry.first + ": " + std::to_string(entry.second);
        first = false;
    }
    out += "}";
    return out;
}

} // namespace

// ============================================================================
// TreeNode
// ============================================================================

std::unique_ptr<TreeNode> TreeNode::make_leaf(Label label) {
    auto node = std::make_unique<TreeNode>();
    node->is_leaf = true;
    node->label = std::move(label);
    return node;
}

std::unique_ptr<TreeNode> TreeNode::make_branch(
    const Feature& feature,
    SplitArg arg,
    Label default_label,
    std::vector<TreeChild> children
) {
    auto node = std::make_unique<TreeNode>();
    node->is_leaf = false;
    node->label = std::move(default_label);
    node->feature = &feature;
    node->arg = std::move(arg);
    node->children = std::move(children);
    return node;
}

const TreeNode* TreeNode::child(const BranchValue& value) const {
    for (const auto& c : children) {
        if (c.value == value) return c.node.get();
    }
    return nullptr;
}

size_t TreeNode::n_nodes() const {
    size_t n = 1;
    for (const auto& c : children) {
        n += c.node->n_nodes();
    }
    return n;
}

size_t TreeNode::n_leaves() const {
    if (is_leaf) return 1;
    size_t n = 0;
    for (const auto& c : children) {
        n += c.node->n_leaves();
    }
    return n;
}

uint16_t TreeNode::depth() const {
    uint16_t d = 0;
    for (const auto& c : children) {
        d = std::max<uint16_t>(d, static_cast<uint16_t>(c.node->depth() + 1));
    }
    return d;
}

void TreeNode::dump(std::ostream& out, int indent) const {
    std::string ind(2 * indent, ' ');
    if (is_leaf) {
        out << ind << "Leaf " << label << "\n";
        return;
    }
    out << ind << "Branch " << feature->name() << ": " << to_string(arg)
        << ", default=" << label << "\n";
    for (const auto& c : children) {
        out << ind << " Value: " << to_string(c.value) << " ->\n";
        c.node->dump(out, indent + 1);
    }
}

// ============================================================================
// Tree
// ============================================================================

const TreeNode& Tree::root() const {
    if (!root_) {
        throw std::logic_error("Tree is empty");
    }
    return *root_;
}

const Label& Tree::classify(const Entity& entity) const {
    return Evaluator::classify(root(), entity);
}

void Tree::dump(std::ostream& out) const {
    if (root_) root_->dump(out);
}

// ============================================================================
// TreeBuilder
// ============================================================================

TreeBuilder::TreeBuilder(
    const FeatureRegistry& registry,
    const BuilderConfig& config,
    int32_t verbosity
) : registry_(registry), config_(config), verbosity_(verbosity) {}

TreeBuilder::TreeBuilder(const FeatureRegistry& registry, const Config& config)
    : registry_(registry), config_(config.builder), verbosity_(config.verbosity) {
    config.validate();
}

std::unique_ptr<TreeNode> TreeBuilder::build(const EntityList& entities) const {
    if (entities.empty()) {
        throw std::invalid_argument("Cannot build a tree from an empty entity set");
    }
    return build_recursive(entities, 0);
}

Tree TreeBuilder::fit(const EntityList& entities) const {
    auto root = build(entities);
    if (!root) {
        Label best = majority_label(label_counts(entities));
        if (verbosity_ > 0) {
            std::printf("Root is a leaf: %s\n", best.c_str());
        }
        root = TreeNode::make_leaf(best);
    }

    Tree tree(std::move(root));
    if (verbosity_ > 0) {
        std::printf("Tree built from %zu entities: %zu nodes, %zu leaves, depth %u\n",
                    entities.size(), tree.n_nodes(), tree.n_leaves(),
                    static_cast<unsigned>(tree.depth()));
    }
    return tree;
}

Tree TreeBuilder::fit(const std::vector<Entity>& entities) const {
    return fit(make_entity_list(entities));
}

std::unique_ptr<TreeNode> TreeBuilder::build_recursive(
    const EntityList& entities,
    int depth
) const {
    const std::string ind(2 * depth, ' ');

    LabelCounts counts = label_counts(entities);
    Float etp = entropy(counts.values());

    if (verbosity_ > 0) {
        std::printf("%sBuild: %s, etp=%.3f\n", ind.c_str(), format_counts(counts).c_str(), etp);
    }

    if (etp < config_.min_entropy) {
        if (verbosity_ > 0) {
            std::printf("%s Too little entropy. Stopping.\n", ind.c_str());
        }
        return nullptr;
    }
    if (entities.size() < config_.min_count) {
        if (verbosity_ > 0) {
            std::printf("%s Too few entities. Stopping.\n", ind.c_str());
        }
        return nullptr;
    }

    // Winner-take-all over registry order; earlier features win ties
    const Feature* best_feature = nullptr;
    Split best_split;

    for (const auto& feature : registry_.features()) {
        try {
            Split candidate = feature->split(entities);
            if (!best_feature || candidate.weighted_entropy < best_split.weighted_entropy) {
                best_feature = feature.get();
                best_split = std::move(candidate);
            }
        } catch (const InvalidSplit&) {
            continue;
        }
    }

    if (!best_feature) {
        if (verbosity_ > 0) {
            std::printf("%s No discerning feature. Stopping.\n", ind.c_str());
        }
        return nullptr;
    }

    if (verbosity_ > 0) {
        std::printf("%sFeature: %s, arg=%s, etp=%.3f\n", ind.c_str(),
                    best_feature->name().c_str(), to_string(best_split.arg).c_str(),
                    best_split.weighted_entropy);
    }

    Label default_label = majority_label(counts);

    std::vector<TreeChild> children;
    children.reserve(best_split.partitions.size());

    for (size_t i = 0; i < best_split.partitions.size(); ++i) {
        Partition& part = best_split.partitions[i];
        const std::string value = to_string(part.value);

        if (verbosity_ >= 2) {
            std::printf("%s Split%zu (%zu): %s\n", ind.c_str(), i,
                        part.entities.size(), value.c_str());
            for (const Entity* e : part.entities) {
                const std::string* raw = e->get(best_feature->attribute());
                std::printf("%s   %s -> %s\n", ind.c_str(),
                            raw ? raw->c_str() : "(none)", e->label().c_str());
            }
        }
        if (verbosity_ > 0) {
            std::printf("%s Value: %s ->\n", ind.c_str(), value.c_str());
        }

        auto node = build_recursive(part.entities, depth + 1);
        if (!node) {
            Label best = majority_label(label_counts(part.entities));
            if (verbosity_ > 0) {
                std::printf("%s Leaf: %s -> %s\n", ind.c_str(), value.c_str(), best.c_str());
            }
            node = TreeNode::make_leaf(best);
        }
        children.push_back(TreeChild{std::move(part.value), std::move(node)});
    }

    return TreeNode::make_branch(*best_feature, std::move(best_split.arg),
                                 std::move(default_label), std::move(children));
}

} // namespace commtree
