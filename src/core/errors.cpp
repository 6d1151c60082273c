/**
 * @file errors.cpp
 * @brief Error message construction.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/errors.hpp"

#include <utility>

namespace idforge {
namespace core {

namespace {

// abc"d -> "abc\"d"
std::string quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}  // namespace

ParseError::ParseError(std::string input, std::string reason)
    : Error("uuid: parsing " + quote(input) + ": " + reason)
    , input_(std::move(input))
    , reason_(std::move(reason))
{}

LengthError::LengthError(size_t got, size_t want)
    : Error("uuid: unexpected length " + std::to_string(got) +
            ", want " + std::to_string(want) + " bytes")
    , got_(got)
    , want_(want)
{}

TypeError::TypeError(std::string typeName)
    : Error("uuid: cannot scan " + typeName + " into UUID")
    , typeName_(std::move(typeName))
{}

}  // namespace core
}  // namespace idforge
