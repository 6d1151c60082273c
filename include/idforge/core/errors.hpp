/**
 * @file errors.hpp
 * @brief Recoverable failures raised by parsing and ingestion.
 *
 * All derive from core::Error, so callers may catch the family or one
 * kind and inspect its fields.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/core/export.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace idforge {
namespace core {

class IDFORGE_CORE_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ParseError
 * @brief Malformed text: wrong length, separators or hex digits.
 */
class IDFORGE_CORE_API ParseError : public Error {
public:
    ParseError(std::string input, std::string reason);

    /// The text that failed to parse.
    const std::string& input() const noexcept { return input_; }

    /// Description of the problem.
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string input_;
    std::string reason_;
};

/**
 * @class LengthError
 * @brief Binary input whose byte count is not the required one.
 */
class IDFORGE_CORE_API LengthError : public Error {
public:
    LengthError(size_t got, size_t want);

    size_t got() const noexcept { return got_; }
    size_t want() const noexcept { return want_; }

private:
    size_t got_;
    size_t want_;
};

/**
 * @class TypeError
 * @brief Flexible ingestion was handed a representation it cannot read.
 */
class IDFORGE_CORE_API TypeError : public Error {
public:
    explicit TypeError(std::string typeName);

    const std::string& typeName() const noexcept { return typeName_; }

private:
    std::string typeName_;
};

}  // namespace core
}  // namespace idforge
