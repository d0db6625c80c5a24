/**
 * CommTree Core Types Implementation
 */

#include "commtree/types.hpp"
#include <cstdio>

namespace commtree {

namespace {

std::string quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

std::string to_string(const BranchValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const std::string* s = std::get_if<std::string>(&value)) {
        return quote(*s);
    }
    return "null";
}

std::string to_string(const SplitArg& arg) {
    if (const std::string* s = std::get_if<std::string>(&arg)) {
        return quote(*s);
    }
    if (const Float* f = std::get_if<Float>(&arg)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", *f);
        return buf;
    }
    return "null";
}

} // namespace commtree
