#pragma once

#include "messages.hpp"

#include <msgpack.hpp>

#include <stdexcept>
#include <string>

namespace autobridge::codec {

/// Raised when bytes do not form a known request or response.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Envelope: {"case": <name>, "payload": <value>}; payload omitted when the case carries none.
std::string encode_request(const Request& request);
Request decode_request(const std::string& bytes);

std::string encode_response(const Response& response);
Response decode_response(const std::string& bytes);

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key);
std::string as_string(const msgpack::object& obj, const std::string& fallback = "");

} // namespace autobridge::codec
