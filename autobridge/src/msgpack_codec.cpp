#include "msgpack_codec.hpp"

#include <new>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace autobridge::codec {

namespace {

struct Envelope {
    std::string case_name;
    const msgpack::object* payload = nullptr;
};

Envelope read_envelope(const msgpack::object& root) {
    if (root.type != msgpack::type::MAP) {
        throw DecodeError("message is not a map");
    }
    const msgpack::object* case_obj = find_key(root, "case");
    if (!case_obj || case_obj->type != msgpack::type::STR) {
        throw DecodeError("message has no case discriminant");
    }

    Envelope envelope;
    envelope.case_name = as_string(*case_obj);
    envelope.payload = find_key(root, "payload");
    if (envelope.payload && envelope.payload->is_nil()) {
        envelope.payload = nullptr;
    }
    return envelope;
}

// Nesting deeper than any payload type needs.
constexpr std::size_t kMaxNestingDepth = 64;

msgpack::object_handle unpack_root(const std::string& bytes) {
    if (bytes.empty()) {
        throw DecodeError("empty message");
    }
    // The unpacker reserves room for a container as soon as it reads the header, so a
    // claimed element count must never exceed what the message could actually hold.
    const std::size_t n = bytes.size();
    const msgpack::unpack_limit limit(n, n, n, n, n, kMaxNestingDepth);
    try {
        return msgpack::unpack(bytes.data(), bytes.size(), nullptr, nullptr, limit);
    } catch (const msgpack::unpack_error& exc) {
        throw DecodeError(std::string("malformed message: ") + exc.what());
    } catch (const msgpack::size_overflow& exc) {
        throw DecodeError(std::string("message exceeds its own size: ") + exc.what());
    } catch (const std::bad_alloc&) {
        throw DecodeError("message too large to decode");
    }
}

template <typename T>
void convert_into(const std::string& name, const msgpack::object& payload, T& value) {
    try {
        payload.convert(value);
    } catch (const msgpack::type_error&) {
        throw DecodeError("invalid payload for case '" + name + "'");
    }
}

void pack_case(msgpack::packer<msgpack::sbuffer>& pk, const char* name) {
    pk.pack_map(1);
    pk.pack("case");
    pk.pack(name);
}

template <typename T>
void pack_case(msgpack::packer<msgpack::sbuffer>& pk, const char* name, const T& payload) {
    pk.pack_map(2);
    pk.pack("case");
    pk.pack(name);
    pk.pack("payload");
    pk.pack(payload);
}

// Requests

using RequestDecoder = Request (*)(const msgpack::object*);

template <typename T>
Request decode_request_alternative(const msgpack::object* payload) {
    T value{};
    if constexpr (!std::is_empty_v<T>) {
        const std::string name = request_case_name_of<T>();
        if (!payload) {
            throw DecodeError("missing payload for case '" + name + "'");
        }
        convert_into(name, *payload, value);
    }
    return Request{std::move(value)};
}

template <std::size_t... I>
std::unordered_map<std::string, RequestDecoder> make_request_decoders(std::index_sequence<I...>) {
    std::unordered_map<std::string, RequestDecoder> decoders;
    (decoders.emplace(request_case_name_of<std::variant_alternative_t<I, Request>>(),
                      &decode_request_alternative<std::variant_alternative_t<I, Request>>),
     ...);
    return decoders;
}

const std::unordered_map<std::string, RequestDecoder>& request_decoders() {
    static const auto decoders = make_request_decoders(std::make_index_sequence<std::variant_size_v<Request>>{});
    return decoders;
}

// Responses

using ResponseDecoder = Response (*)(const msgpack::object*);

template <typename T>
Response decode_response_alternative(const msgpack::object* payload) {
    T response{};
    if constexpr (!std::is_empty_v<T>) {
        const std::string name = to_wire(T::kCase);
        // An absent payload reads as nil, which only optional values accept.
        msgpack::object nil;
        convert_into(name, payload ? *payload : nil, response.value);
    }
    return Response{std::move(response)};
}

template <std::size_t... I>
std::unordered_map<std::string, ResponseDecoder> make_response_decoders(std::index_sequence<I...>) {
    std::unordered_map<std::string, ResponseDecoder> decoders;
    (decoders.emplace(to_wire(std::variant_alternative_t<I, Response>::kCase),
                      &decode_response_alternative<std::variant_alternative_t<I, Response>>),
     ...);
    return decoders;
}

const std::unordered_map<std::string, ResponseDecoder>& response_decoders() {
    static const auto decoders = make_response_decoders(std::make_index_sequence<std::variant_size_v<Response>>{});
    return decoders;
}

} // namespace

std::string encode_request(const Request& request) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    std::visit([&pk](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_empty_v<T>) {
            pack_case(pk, request_case_name_of<T>());
        } else {
            pack_case(pk, request_case_name_of<T>(), payload);
        }
    }, request);

    return std::string(buffer.data(), buffer.size());
}

Request decode_request(const std::string& bytes) {
    msgpack::object_handle handle = unpack_root(bytes);
    Envelope envelope = read_envelope(handle.get());

    const auto& decoders = request_decoders();
    auto it = decoders.find(envelope.case_name);
    if (it == decoders.end()) {
        throw DecodeError("unknown request case '" + envelope.case_name + "'");
    }
    return it->second(envelope.payload);
}

std::string encode_response(const Response& response) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    std::visit([&pk](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_empty_v<T>) {
            pack_case(pk, to_wire(T::kCase));
        } else {
            pack_case(pk, to_wire(T::kCase), value.value);
        }
    }, response);

    return std::string(buffer.data(), buffer.size());
}

Response decode_response(const std::string& bytes) {
    msgpack::object_handle handle = unpack_root(bytes);
    Envelope envelope = read_envelope(handle.get());

    const auto& decoders = response_decoders();
    auto it = decoders.find(envelope.case_name);
    if (it == decoders.end()) {
        throw DecodeError("unknown response case '" + envelope.case_name + "'");
    }
    return it->second(envelope.payload);
}

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key) {
    if (map_obj.type != msgpack::type::MAP) {
        return nullptr;
    }

    auto map = map_obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        if (map.ptr[i].key.type == msgpack::type::STR) {
            std::string k(map.ptr[i].key.via.str.ptr, map.ptr[i].key.via.str.size);
            if (k == key) {
                return &map.ptr[i].val;
            }
        }
    }
    return nullptr;
}

std::string as_string(const msgpack::object& obj, const std::string& fallback) {
    if (obj.type == msgpack::type::STR) {
        return std::string(obj.via.str.ptr, obj.via.str.size);
    }
    return fallback;
}

} // namespace autobridge::codec
