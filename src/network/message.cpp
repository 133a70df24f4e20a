// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace skiff {
namespace network {

const char* encoding_name(Encoding encoding) {
  switch (encoding) {
  case Encoding::Binary:
    return "bson";
  case Encoding::Text:
    return "json";
  }
  return "unknown";
}

std::optional<Encoding> parse_encoding(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  if (lower == "bson" || lower == "binary") {
    return Encoding::Binary;
  }
  if (lower == "json" || lower == "text") {
    return Encoding::Text;
  }
  return std::nullopt;
}

void write_frame_header(const FrameHeader& header, uint8_t* out) {
  out[0] = static_cast<uint8_t>(header.type_id >> 8);
  out[1] = static_cast<uint8_t>(header.type_id);
  out[2] = static_cast<uint8_t>(header.length >> 24);
  out[3] = static_cast<uint8_t>(header.length >> 16);
  out[4] = static_cast<uint8_t>(header.length >> 8);
  out[5] = static_cast<uint8_t>(header.length);
}

FrameHeader read_frame_header(const uint8_t* data) {
  FrameHeader header;
  header.type_id = static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
  header.length = (static_cast<uint32_t>(data[2]) << 24) | (static_cast<uint32_t>(data[3]) << 16) |
                  (static_cast<uint32_t>(data[4]) << 8) | static_cast<uint32_t>(data[5]);
  return header;
}

std::vector<uint8_t> encode_body(const nlohmann::json& body, Encoding encoding) {
  std::vector<uint8_t> payload;
  try {
    if (encoding == Encoding::Binary) {
      if (!body.is_object()) {
        throw CodecError(std::string("BSON payload must be a JSON object, got ") + body.type_name());
      }
      payload = nlohmann::json::to_bson(body);
    } else {
      const std::string text = body.dump();
      payload.assign(text.begin(), text.end());
    }
  } catch (const nlohmann::json::exception& e) {
    throw CodecError(std::string("cannot encode payload: ") + e.what());
  }

  if (payload.size() > MAX_PAYLOAD_SIZE) {
    throw CodecError("payload of " + std::to_string(payload.size()) + " bytes exceeds limit of " +
                     std::to_string(MAX_PAYLOAD_SIZE));
  }
  return payload;
}

nlohmann::json decode_body(const uint8_t* data, size_t size, Encoding encoding) {
  try {
    if (encoding == Encoding::Binary) {
      return nlohmann::json::from_bson(data, data + size);
    }
    return nlohmann::json::parse(data, data + size);
  } catch (const nlohmann::json::exception& e) {
    throw CodecError(std::string("cannot decode ") + encoding_name(encoding) + " payload: " + e.what());
  }
}

std::vector<uint8_t> encode_message(const Message& message, Encoding encoding) {
  std::vector<uint8_t> payload = encode_body(message.body, encoding);

  std::vector<uint8_t> frame(FRAME_HEADER_SIZE + payload.size());
  write_frame_header(FrameHeader{message.type.id(), static_cast<uint32_t>(payload.size())}, frame.data());
  std::copy(payload.begin(), payload.end(), frame.begin() + FRAME_HEADER_SIZE);
  return frame;
}

std::vector<Frame> FrameDecoder::feed(const uint8_t* data, size_t size) {
  if (failed_) {
    throw CodecError("frame decoder used after a framing error");
  }
  buffer_.insert(buffer_.end(), data, data + size);

  std::vector<Frame> frames;
  size_t offset = 0;
  while (buffer_.size() - offset >= FRAME_HEADER_SIZE) {
    const FrameHeader header = read_frame_header(buffer_.data() + offset);
    if (header.length > MAX_PAYLOAD_SIZE) {
      failed_ = true;
      buffer_.clear();
      throw CodecError("frame announces " + std::to_string(header.length) + " payload bytes, limit is " +
                       std::to_string(MAX_PAYLOAD_SIZE));
    }
    if (buffer_.size() - offset - FRAME_HEADER_SIZE < header.length) {
      break;
    }
    const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset + FRAME_HEADER_SIZE);
    frames.push_back(Frame{header.type_id, std::vector<uint8_t>(begin, begin + header.length)});
    offset += FRAME_HEADER_SIZE + header.length;
  }

  buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
  return frames;
}

}  // namespace network
}  // namespace skiff
