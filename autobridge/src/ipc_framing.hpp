#pragma once

#include <cstdint>
#include <string>

namespace autobridge::ipc {

/// Frames above this size are refused and the connection is dropped.
constexpr uint32_t kMaxFrameSize = 64u * 1024u * 1024u;

// Each frame is a 4-byte big-endian length followed by the body.
// Both calls block until the whole frame moved; false means the peer is gone
// or sent something unusable, and the descriptor should be closed.
bool read_frame(int fd, std::string& body);
bool write_frame(int fd, const std::string& body);

enum class FrameStatus {
    complete,
    incomplete,
    too_large,
};

/// Pop the first whole frame off a receive buffer into body. The buffer is left
/// untouched unless a complete frame was taken.
FrameStatus take_frame(std::string& buffer, std::string& body);

} // namespace autobridge::ipc
