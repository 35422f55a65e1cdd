#include "binform/protocol/registry.hpp"

#include "core/logger.hpp"

#include "binform/codec/error.hpp"

namespace binform::protocol {

std::error_code Registry::add(std::uint8_t msg_id, std::string name, codec::Node schema) {
  if (!schema.is_struct()) {
    core::detail::logger().error("message '{}' (id {:#04x}) rejected: schema is not a struct", name, msg_id);
    return codec::make_error_code(codec::errc::invalid_schema);
  }
  if (const auto* existing = find(msg_id)) {
    core::detail::logger().error("message id {:#04x} already registered as '{}', cannot add '{}'", msg_id,
                                 existing->name, name);
    return codec::make_error_code(codec::errc::duplicate_variant);
  }
  MessageKind kind{msg_id, std::move(name), std::move(schema)};
  kinds_.emplace(msg_id, std::move(kind));
  return {};
}

const MessageKind* Registry::find(std::uint8_t msg_id) const noexcept {
  const auto it = kinds_.find(msg_id);
  return it == kinds_.end() ? nullptr : &it->second;
}

}  // namespace binform::protocol
