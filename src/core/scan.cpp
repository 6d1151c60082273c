/**
 * @file scan.cpp
 * @brief Column value conversion.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/core/scan.hpp"
#include "idforge/core/parse.hpp"

#include <string_view>
#include <type_traits>

namespace idforge {
namespace core {

namespace {

template<typename T>
constexpr const char* typeName() {
    if constexpr (std::is_same_v<T, std::nullptr_t>) {
        return "nullptr";
    } else if constexpr (std::is_same_v<T, bool>) {
        return "bool";
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return "int64";
    } else if constexpr (std::is_same_v<T, double>) {
        return "double";
    } else {
        return "timestamp";
    }
}

}  // namespace

Uuid scan(const DbValue& value) {
    return std::visit([](const auto& v) -> Uuid {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.size() == Uuid::SIZE) {
                return fromBytes(v);
            }
            return parseLenient(std::string_view(
                reinterpret_cast<const char*>(v.data()), v.size()));
        } else if constexpr (std::is_same_v<T, std::string>) {
            return parseLenient(v);
        } else {
            throw TypeError(typeName<T>());
        }
    }, value);
}

std::optional<Uuid> scanOptional(const DbValue& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        return std::nullopt;
    }
    return scan(value);
}

DbValue value(const Uuid& id) {
    return id.toString();
}

}  // namespace core
}  // namespace idforge
