#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace autobridge {

/**
 * Wire-name table for an enumeration that travels as a string.
 *
 * Specialize with a static entries() returning every enumerator paired with its
 * kebab-case name. The msgpack adaptor in msgpack_adaptors.hpp picks up every
 * specialization automatically.
 */
template <typename E>
struct WireEnum;

template <typename E, typename = void>
struct is_wire_enum : std::false_type {};

template <typename E>
struct is_wire_enum<E, std::void_t<decltype(WireEnum<E>::entries())>> : std::true_type {};

template <typename E>
const char* to_wire(E value) {
    for (const auto& [enumerator, name] : WireEnum<E>::entries()) {
        if (enumerator == value) {
            return name;
        }
    }
    return "";
}

template <typename E>
std::optional<E> from_wire(std::string_view name) {
    for (const auto& [enumerator, wire_name] : WireEnum<E>::entries()) {
        if (name == wire_name) {
            return enumerator;
        }
    }
    return std::nullopt;
}

} // namespace autobridge
