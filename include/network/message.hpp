// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message_type.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace skiff {
namespace network {

// Payload encoding. Both ends of an association must agree on it.
enum class Encoding {
  Binary,  // BSON
  Text     // JSON, for protocol debugging
};

const char* encoding_name(Encoding encoding);

// Accepts "bson"/"binary" and "json"/"text".
std::optional<Encoding> parse_encoding(const std::string& name);

// A typed message. In Binary encoding the body must be a JSON object.
struct Message {
  MessageType type;
  nlohmann::json body;

  Message(MessageType type, nlohmann::json body) : type(std::move(type)), body(std::move(body)) {}

  std::string to_string() const { return type.to_string() + " " + body.dump(); }

  friend bool operator==(const Message& a, const Message& b) { return a.type == b.type && a.body == b.body; }
};

// Frame layout (big-endian):
//   type id (2 bytes) | payload length (4 bytes) | payload
constexpr size_t FRAME_HEADER_SIZE = 6;
constexpr uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

struct FrameHeader {
  uint16_t type_id{0};
  uint32_t length{0};
};

struct Frame {
  uint16_t type_id{0};
  std::vector<uint8_t> payload;
};

void write_frame_header(const FrameHeader& header, uint8_t* out);
FrameHeader read_frame_header(const uint8_t* data);

// Throws CodecError if the body cannot be represented in the encoding or the
// result exceeds MAX_PAYLOAD_SIZE.
std::vector<uint8_t> encode_body(const nlohmann::json& body, Encoding encoding);

// Throws CodecError on malformed payloads.
nlohmann::json decode_body(const uint8_t* data, size_t size, Encoding encoding);

// Header + encoded body, ready to write.
std::vector<uint8_t> encode_message(const Message& message, Encoding encoding);

// FrameDecoder - reassembles frames from an ordered byte stream
//
// Bytes may arrive split at arbitrary points; feed() returns every frame
// completed by the new data. A header announcing more than MAX_PAYLOAD_SIZE
// throws CodecError and leaves the decoder unusable.
class FrameDecoder {
public:
  std::vector<Frame> feed(const uint8_t* data, size_t size);

  size_t buffered() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
  bool failed_{false};
};

}  // namespace network
}  // namespace skiff
