#pragma once

/**
 * CommTree Configuration
 *
 * Stopping thresholds for tree induction plus the settings the training
 * tool needs to turn raw comment records into labelled entities.
 */

#include "types.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace commtree {

// ============================================================================
// Builder Configuration
// ============================================================================

struct BuilderConfig {
    Float min_entropy = 0.10;                  // Stop when subset entropy falls below this
    Index min_count = 10;                      // Stop when subset has fewer entities
};

// ============================================================================
// Feature Sets
// ============================================================================

enum class FeatureSet : uint8_t {
    Categories = 0,    // Predict the comment category
    Targets = 1,       // Predict what a comment refers to
};

// ============================================================================
// Main Configuration
// ============================================================================

struct Config {
    BuilderConfig builder;
    FeatureSet features = FeatureSet::Categories;

    // Attribute holding the classification label
    std::string label_attribute = "key";

    // Verbosity and logging
    int32_t verbosity = 0;                     // 0=silent, 1=progress, 2=per-split detail

    // ========================================================================
    // Factory Methods
    // ========================================================================

    static Config categories() {
        Config cfg;
        cfg.features = FeatureSet::Categories;
        return cfg;
    }

    static Config targets() {
        Config cfg;
        cfg.features = FeatureSet::Targets;
        return cfg;
    }

    // Grow until every leaf is pure or indivisible
    static Config exhaustive() {
        Config cfg;
        cfg.builder.min_entropy = 0.0;
        cfg.builder.min_count = 1;
        return cfg;
    }

    // ========================================================================
    // Validation
    // ========================================================================

    void validate() const {
        if (std::isnan(builder.min_entropy) || builder.min_entropy < 0) {
            throw std::invalid_argument("min_entropy must be a non-negative number");
        }
        if (label_attribute.empty()) {
            throw std::invalid_argument("label_attribute cannot be empty");
        }
        if (verbosity < 0) {
            throw std::invalid_argument("verbosity cannot be negative");
        }
    }
};

} // namespace commtree
