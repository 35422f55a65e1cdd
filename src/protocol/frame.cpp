#include "binform/protocol/frame.hpp"

#include "core/logger.hpp"

#include "binform/codec/codec.hpp"
#include "binform/codec/error.hpp"
#include "binform/core/error.hpp"

#include <new>
#include <stdexcept>
#include <utility>

namespace binform::protocol {
namespace {

struct HeaderSchema final {
  codec::Node node{};
  std::error_code ec{};
};

const HeaderSchema& header_holder() {
  static const HeaderSchema holder = [] {
    HeaderSchema h;
    h.ec = codec::StructBuilder("header").add(codec::u8("msg_id")).add(codec::u16("length")).build(h.node);
    return h;
  }();
  return holder;
}

std::error_code read_uint_field(const codec::Mapping& m, std::string_view name, std::uint64_t& out) noexcept {
  const auto* v = m.find(name);
  if (!v) {
    return codec::make_error_code(codec::errc::missing_field);
  }
  const auto* u = v->get_if<std::uint64_t>();
  if (!u) {
    return codec::make_error_code(codec::errc::type_mismatch);
  }
  out = *u;
  return {};
}

}  // namespace

std::error_code header_schema(const codec::Node*& out) noexcept {
  try {
    const auto& holder = header_holder();
    if (holder.ec) {
      return holder.ec;
    }
    out = &holder.node;
    return {};
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::out_of_memory);
  }
}

std::error_code decode_header(core::bytes_view in, Header& out) noexcept {
  const codec::Node* schema = nullptr;
  auto ec = header_schema(schema);
  if (ec) {
    return ec;
  }
  codec::Mapping fields;
  std::size_t consumed = 0;
  ec = codec::decode_one(*schema, in, fields, consumed);
  if (ec) {
    return ec;
  }
  std::uint64_t msg_id = 0;
  std::uint64_t length = 0;
  ec = read_uint_field(fields, "msg_id", msg_id);
  if (ec) {
    return ec;
  }
  ec = read_uint_field(fields, "length", length);
  if (ec) {
    return ec;
  }
  out.msg_id = static_cast<std::uint8_t>(msg_id);
  out.length = static_cast<std::uint16_t>(length);
  return {};
}

std::error_code encode_frame(std::uint8_t msg_id, const codec::Node& schema, codec::Mapping& body,
                             std::vector<core::byte>& out) noexcept {
  const codec::Node* header = nullptr;
  auto ec = header_schema(header);
  if (ec) {
    return ec;
  }
  try {
    // 1) payload
    std::vector<core::byte> payload;
    ec = codec::encode(schema, body, payload);
    if (ec) {
      return ec;
    }
    if (payload.size() > kMaxPayloadSize) {
      core::detail::logger().debug("frame payload for id {:#04x} too large: {} bytes", msg_id, payload.size());
      return core::make_error_code(core::errc::buffer_overflow);
    }

    // 2) header（length 为 payload 的实际字节数）
    codec::Mapping header_fields{
      {"msg_id", codec::Value::unsigned_integer(msg_id)},
      {"length", codec::Value::unsigned_integer(payload.size())},
    };
    std::vector<core::byte> frame;
    frame.reserve(kHeaderSize + payload.size());
    ec = codec::encode(*header, header_fields, frame);
    if (ec) {
      return ec;
    }
    frame.insert(frame.end(), payload.begin(), payload.end());
    out.insert(out.end(), frame.begin(), frame.end());
    return {};
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::out_of_memory);
  } catch (const std::length_error&) {
    return core::make_error_code(core::errc::buffer_overflow);
  }
}

std::error_code encode_frame(const Registry& registry, Frame& frame, std::vector<core::byte>& out) noexcept {
  const auto* kind = registry.find(frame.msg_id);
  if (!kind) {
    core::detail::logger().warn("cannot encode frame: unknown message id {:#04x}", frame.msg_id);
    return codec::make_error_code(codec::errc::unknown_variant);
  }
  return encode_frame(frame.msg_id, kind->schema, frame.body, out);
}

std::error_code decode_frame(const Registry& registry, core::bytes_view in, Frame& out) noexcept {
  Header header;
  auto ec = decode_header(in, header);
  if (ec) {
    return ec;
  }
  const auto payload = in.subspan(kHeaderSize);
  if (payload.size() != header.length) {
    core::detail::logger().debug("frame length mismatch: header says {}, got {} bytes", header.length,
                                 payload.size());
    return codec::make_error_code(codec::errc::length_mismatch);
  }
  const auto* kind = registry.find(header.msg_id);
  if (!kind) {
    core::detail::logger().warn("unknown message id {:#04x}", header.msg_id);
    return codec::make_error_code(codec::errc::unknown_variant);
  }
  codec::Mapping body;
  ec = codec::decode(kind->schema, payload, body);
  if (ec) {
    return ec;
  }
  out.msg_id = header.msg_id;
  out.body = std::move(body);
  return {};
}

}  // namespace binform::protocol
