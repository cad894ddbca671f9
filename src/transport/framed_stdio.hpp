#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace transport {

// uint32 little-endian length prefix, payload capped at 1 MiB
constexpr uint32_t kMaxFrameBytes = 1024u * 1024u;
constexpr std::size_t kHeaderBytes = 4;

enum class ReadResult {
  Frame, // payload holds one complete frame
  Eof,   // clean end of stream before a header byte
  Error  // truncated frame or invalid length, err describes it
};

/**
 * @brief Read one length-prefixed frame.
 *
 * Zero-length frames and frames above max_len are protocol errors; the
 * stream is not resynchronized afterwards.
 */
ReadResult read_frame(std::istream &in, std::string &payload, std::string &err,
                      uint32_t max_len = kMaxFrameBytes);

// Write one frame and flush. Returns false and sets err on failure.
bool write_frame(std::ostream &out, const std::string &payload,
                 std::string &err, uint32_t max_len = kMaxFrameBytes);

} // namespace transport
