/**
 * CommTree Dataset Loading Implementation
 */

#include "commtree/dataset.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <limits>
#include <optional>
#include <stdexcept>

namespace commtree {

namespace {

using Json = nlohmann::json;

std::runtime_error record_error(size_t line_no, const std::string& what) {
    return std::runtime_error("Line " + std::to_string(line_no) + ": " + what);
}

std::string scalar_text(const Json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

std::optional<long> parse_int(const std::string* text) {
    if (!text || text->empty()) return std::nullopt;
    const char* begin = text->c_str();
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) return std::nullopt;
    return v;
}

void set_delta(Entity& entity, const std::string& name,
               const std::optional<long>& base, const std::string& other) {
    if (!base) return;
    auto v = parse_int(entity.get(other));
    if (!v) return;

    // Skip deltas that do not fit in a long
    const long lo = std::numeric_limits<long>::min();
    const long hi = std::numeric_limits<long>::max();
    if ((*v < 0 && *base > hi + *v) || (*v > 0 && *base < lo + *v)) return;

    entity.set(name, std::to_string(*base - *v));
}

} // namespace

Entity EntityLoader::parse_record(const std::string& line, size_t line_no) const {
    Json data;
    try {
        data = Json::parse(line);
    } catch (const Json::parse_error& e) {
        throw record_error(line_no, e.what());
    }
    if (!data.is_object()) {
        throw record_error(line_no, "record must be a JSON object");
    }

    Entity entity;
    for (const auto& item : data.items()) {
        const Json& value = item.value();
        if (value.is_null()) continue;

        if (value.is_array()) {
            std::string joined;
            for (size_t i = 0; i < value.size(); ++i) {
                if (value[i].is_structured() || value[i].is_null()) {
                    throw record_error(line_no, "attribute " + item.key() +
                                                " must hold scalars only");
                }
                if (i > 0) joined += ',';
                joined += scalar_text(value[i]);
            }
            entity.set(item.key(), std::move(joined));
        } else if (value.is_object()) {
            throw record_error(line_no, "attribute " + item.key() + " cannot be an object");
        } else {
            entity.set(item.key(), scalar_text(value));
        }
    }

    const std::string* label = entity.get(label_attribute_);
    if (!label) {
        throw record_error(line_no, "missing label attribute " + label_attribute_);
    }
    entity.set_label(*label);

    if (derive_deltas_) {
        derive_comment_deltas(entity);
    }
    return entity;
}

std::vector<Entity> EntityLoader::load(std::istream& in) const {
    std::vector<Entity> entities;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        entities.push_back(parse_record(line, line_no));
    }
    return entities;
}

std::vector<Entity> EntityLoader::load(const std::string& path) const {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file for reading: " + path);
    }
    return load(in);
}

void derive_comment_deltas(Entity& entity) {
    auto line = parse_int(entity.get("line"));
    auto cols = parse_int(entity.get("cols"));

    set_delta(entity, "deltaLine", line, "prevLine");
    set_delta(entity, "deltaCols", cols, "prevCols");
    set_delta(entity, "deltaLeft", line, "leftLine");
    set_delta(entity, "deltaRight", line, "rightLine");
}

} // namespace commtree
