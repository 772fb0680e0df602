#pragma once

// msgpack-c adaptors for the protocol's own value types. Must be included before
// any struct that uses MSGPACK_DEFINE_MAP with these members.

#include "error_envelope.hpp"
#include "timestamp.hpp"
#include "wire_enum.hpp"

#include <msgpack.hpp>

#include <string>
#include <type_traits>

namespace msgpack {
MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS) {
namespace adaptor {

template <typename E>
struct convert<E, std::enable_if_t<std::conjunction<std::is_enum<E>, autobridge::is_wire_enum<E>>::value>> {
    const msgpack::object& operator()(const msgpack::object& o, E& v) const {
        if (o.type != msgpack::type::STR) {
            throw msgpack::type_error();
        }
        auto parsed = autobridge::from_wire<E>(std::string(o.via.str.ptr, o.via.str.size));
        if (!parsed) {
            throw msgpack::type_error();
        }
        v = *parsed;
        return o;
    }
};

template <typename E>
struct pack<E, std::enable_if_t<std::conjunction<std::is_enum<E>, autobridge::is_wire_enum<E>>::value>> {
    template <typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const E& v) const {
        o.pack(std::string(autobridge::to_wire(v)));
        return o;
    }
};

template <>
struct convert<autobridge::Timestamp> {
    const msgpack::object& operator()(const msgpack::object& o, autobridge::Timestamp& v) const {
        if (o.type != msgpack::type::STR) {
            throw msgpack::type_error();
        }
        auto parsed = autobridge::Timestamp::parse_iso8601(std::string(o.via.str.ptr, o.via.str.size));
        if (!parsed) {
            throw msgpack::type_error();
        }
        v = *parsed;
        return o;
    }
};

template <>
struct pack<autobridge::Timestamp> {
    template <typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const autobridge::Timestamp& v) const {
        o.pack(v.to_iso8601());
        return o;
    }
};

template <>
struct convert<autobridge::ErrorEnvelope> {
    const msgpack::object& operator()(const msgpack::object& o, autobridge::ErrorEnvelope& v) const {
        if (o.type != msgpack::type::MAP) {
            throw msgpack::type_error();
        }
        autobridge::ErrorCode code = autobridge::ErrorCode::internal_error;
        std::string message;
        std::optional<std::string> details;
        bool has_code = false;

        for (uint32_t i = 0; i < o.via.map.size; ++i) {
            const auto& kv = o.via.map.ptr[i];
            if (kv.key.type != msgpack::type::STR) {
                throw msgpack::type_error();
            }
            std::string key(kv.key.via.str.ptr, kv.key.via.str.size);
            if (key == "code") {
                kv.val.convert(code);
                has_code = true;
            } else if (key == "message") {
                kv.val.convert(message);
            } else if (key == "details") {
                kv.val.convert(details);
            }
        }
        if (!has_code) {
            throw msgpack::type_error();
        }
        v = autobridge::ErrorEnvelope(code, std::move(message), std::move(details));
        return o;
    }
};

template <>
struct pack<autobridge::ErrorEnvelope> {
    template <typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const autobridge::ErrorEnvelope& v) const {
        o.pack_map(3);
        o.pack("code");
        o.pack(v.code());
        o.pack("message");
        o.pack(v.message());
        o.pack("details");
        o.pack(v.details());
        return o;
    }
};

} // namespace adaptor
} // MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
} // namespace msgpack
