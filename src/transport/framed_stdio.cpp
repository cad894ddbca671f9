#include "transport/framed_stdio.hpp"

namespace transport {

namespace {

uint32_t decode_length(const unsigned char header[kHeaderBytes]) {
  uint32_t value = 0;
  for (std::size_t i = 0; i < kHeaderBytes; ++i) {
    value |= static_cast<uint32_t>(header[i]) << (8 * i);
  }
  return value;
}

void encode_length(uint32_t value, char header[kHeaderBytes]) {
  for (std::size_t i = 0; i < kHeaderBytes; ++i) {
    header[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
  }
}

// Number of bytes actually read (less than n only at EOF/failure)
std::size_t read_up_to(std::istream &in, char *buf, std::size_t n) {
  std::size_t got = 0;
  while (got < n) {
    in.read(buf + got, static_cast<std::streamsize>(n - got));
    const std::streamsize r = in.gcount();
    if (r <= 0) {
      break;
    }
    got += static_cast<std::size_t>(r);
  }
  return got;
}

} // namespace

ReadResult read_frame(std::istream &in, std::string &payload, std::string &err,
                      uint32_t max_len) {
  err.clear();
  payload.clear();

  unsigned char header[kHeaderBytes] = {0, 0, 0, 0};
  const std::size_t header_got =
      read_up_to(in, reinterpret_cast<char *>(header), kHeaderBytes);
  if (header_got == 0) {
    return ReadResult::Eof;
  }
  if (header_got < kHeaderBytes) {
    err = "unexpected EOF while reading frame header";
    return ReadResult::Error;
  }

  const uint32_t len = decode_length(header);
  if (len == 0) {
    err = "invalid frame length: 0";
    return ReadResult::Error;
  }
  if (len > max_len) {
    err = "frame length " + std::to_string(len) + " exceeds max " +
          std::to_string(max_len);
    return ReadResult::Error;
  }

  payload.resize(len);
  if (read_up_to(in, &payload[0], len) < len) {
    payload.clear();
    err = "unexpected EOF while reading frame payload";
    return ReadResult::Error;
  }
  return ReadResult::Frame;
}

bool write_frame(std::ostream &out, const std::string &payload,
                 std::string &err, uint32_t max_len) {
  err.clear();

  if (payload.empty()) {
    err = "invalid frame length: 0";
    return false;
  }
  if (payload.size() > max_len) {
    err = "frame length " + std::to_string(payload.size()) + " exceeds max " +
          std::to_string(max_len);
    return false;
  }

  char header[kHeaderBytes];
  encode_length(static_cast<uint32_t>(payload.size()), header);
  out.write(header, kHeaderBytes);
  out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
  out.flush();
  if (!out.good()) {
    err = "failed writing frame";
    return false;
  }
  return true;
}

} // namespace transport
