#pragma once

/**
 * CommTree Dataset Loading
 *
 * Reads comment records as JSON Lines (one object per line) into entities
 * and derives the positional delta attributes used by the target features.
 */

#include "types.hpp"
#include "config.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace commtree {

class EntityLoader {
public:
    explicit EntityLoader(std::string label_attribute = "key", bool derive_deltas = true)
        : label_attribute_(std::move(label_attribute)), derive_deltas_(derive_deltas) {}

    explicit EntityLoader(const Config& config)
        : EntityLoader(config.label_attribute) {}

    /**
     * Parse one record.
     * - strings are kept verbatim, numbers and booleans in JSON text form
     * - arrays of scalars are joined with commas
     * - null values are treated as absent
     * Throws std::runtime_error naming line_no on malformed input or a
     * missing label.
     */
    Entity parse_record(const std::string& line, size_t line_no = 0) const;

    // Blank lines are skipped
    std::vector<Entity> load(std::istream& in) const;
    std::vector<Entity> load(const std::string& path) const;

    const std::string& label_attribute() const { return label_attribute_; }

private:
    std::string label_attribute_;
    bool derive_deltas_ = true;
};

/**
 * Positional deltas relative to neighbouring code:
 *   deltaLine  = line - prevLine
 *   deltaCols  = cols - prevCols
 *   deltaLeft  = line - leftLine
 *   deltaRight = line - rightLine
 * Each is set only when both operands are integers.
 */
void derive_comment_deltas(Entity& entity);

} // namespace commtree
