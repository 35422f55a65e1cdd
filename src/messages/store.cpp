#include "binform/messages/store.hpp"

#include "core/logger.hpp"

#include "binform/core/error.hpp"

#include <limits>

namespace binform::messages {
namespace {

using codec::Mapping;
using codec::Value;

std::optional<std::uint64_t> get_uint(const Mapping& m, std::string_view name, std::uint64_t max) {
  const auto* v = m.find(name);
  if (!v) {
    return std::nullopt;
  }
  std::uint64_t out = 0;
  if (const auto* u = v->get_if<std::uint64_t>()) {
    out = *u;
  } else if (const auto* s = v->get_if<std::int64_t>()) {
    if (*s < 0) {
      return std::nullopt;
    }
    out = static_cast<std::uint64_t>(*s);
  } else {
    return std::nullopt;
  }
  if (out > max) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<core::byte>> get_bytes(const Mapping& m, std::string_view name) {
  const auto* v = m.find(name);
  if (!v) {
    return std::nullopt;
  }
  const auto* b = v->get_if<codec::Bytes>();
  if (!b) {
    return std::nullopt;
  }
  return b->value;
}

std::optional<std::string> get_string(const Mapping& m, std::string_view name) {
  auto raw = get_bytes(m, name);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return std::string(raw->begin(), raw->end());
}

std::optional<Status> to_status(std::uint64_t raw) noexcept {
  switch (raw) {
    case 0x00:
      return Status::success;
    case 0x01:
      return Status::eio;
    case 0x02:
      return Status::ekey;
    case 0xFF:
      return Status::fail;
    default:
      return std::nullopt;
  }
}

Value status_value(Status s) { return Value::unsigned_integer(static_cast<std::uint8_t>(s)); }

// 公共前缀 {trans, nlen, name[nlen]}（StoreResponse / FetchRequest 共享）。
codec::StructBuilder& add_name(codec::StructBuilder& b) {
  return b.add(codec::u8("nlen")).dynamic("nlen", codec::bytes("name"));
}

codec::StructBuilder& add_data(codec::StructBuilder& b) {
  return b.add(codec::u16("dlen")).dynamic("dlen", codec::bytes("data"));
}

}  // namespace

std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::success:
      return "success";
    case Status::eio:
      return "eio";
    case Status::ekey:
      return "ekey";
    case Status::fail:
      return "fail";
  }
  return "unknown";
}

// ---- StoreRequest ----

std::error_code StoreRequest::build_schema(codec::Node& out) {
  codec::StructBuilder b(std::string{kName});
  b.add(codec::u8("trans"));
  add_name(b);
  add_data(b);
  return b.build(out);
}

std::optional<StoreRequest> StoreRequest::from_value(const Mapping& value) {
  const auto trans = get_uint(value, "trans", 0xFF);
  auto name = get_string(value, "name");
  auto data = get_bytes(value, "data");
  if (!trans || !name || !data) {
    return std::nullopt;
  }
  return StoreRequest{static_cast<std::uint8_t>(*trans), std::move(*name), std::move(*data)};
}

Mapping StoreRequest::to_value() const {
  // nlen / dlen 由 dynamic 绑定在编码时写回，这里给出占位值。
  return Mapping{
    {"trans", Value::unsigned_integer(trans)},
    {"nlen", Value::unsigned_integer(0)},
    {"name", Value::string(name)},
    {"dlen", Value::unsigned_integer(0)},
    {"data", Value::bytes(data)},
  };
}

// ---- StoreResponse ----

std::error_code StoreResponse::build_schema(codec::Node& out) {
  codec::StructBuilder b(std::string{kName});
  b.add(codec::u8("trans"));
  add_name(b);
  b.add(codec::u8("status"));
  return b.build(out);
}

std::optional<StoreResponse> StoreResponse::from_value(const Mapping& value) {
  const auto trans = get_uint(value, "trans", 0xFF);
  auto name = get_string(value, "name");
  const auto raw_status = get_uint(value, "status", 0xFF);
  if (!trans || !name || !raw_status) {
    return std::nullopt;
  }
  const auto status = to_status(*raw_status);
  if (!status) {
    return std::nullopt;
  }
  return StoreResponse{static_cast<std::uint8_t>(*trans), std::move(*name), *status};
}

Mapping StoreResponse::to_value() const {
  return Mapping{
    {"trans", Value::unsigned_integer(trans)},
    {"nlen", Value::unsigned_integer(0)},
    {"name", Value::string(name)},
    {"status", status_value(status)},
  };
}

// ---- FetchRequest ----

std::error_code FetchRequest::build_schema(codec::Node& out) {
  codec::StructBuilder b(std::string{kName});
  b.add(codec::u8("trans"));
  add_name(b);
  return b.build(out);
}

std::optional<FetchRequest> FetchRequest::from_value(const Mapping& value) {
  const auto trans = get_uint(value, "trans", 0xFF);
  auto name = get_string(value, "name");
  if (!trans || !name) {
    return std::nullopt;
  }
  return FetchRequest{static_cast<std::uint8_t>(*trans), std::move(*name)};
}

Mapping FetchRequest::to_value() const {
  return Mapping{
    {"trans", Value::unsigned_integer(trans)},
    {"nlen", Value::unsigned_integer(0)},
    {"name", Value::string(name)},
  };
}

// ---- FetchResponse ----

std::error_code FetchResponse::build_schema(codec::Node& out) {
  codec::StructBuilder b(std::string{kName});
  b.add(codec::u8("trans")).add(codec::u8("status"));
  add_name(b);
  add_data(b);
  return b.build(out);
}

std::optional<FetchResponse> FetchResponse::from_value(const Mapping& value) {
  const auto trans = get_uint(value, "trans", 0xFF);
  const auto raw_status = get_uint(value, "status", 0xFF);
  auto name = get_string(value, "name");
  auto data = get_bytes(value, "data");
  if (!trans || !raw_status || !name || !data) {
    return std::nullopt;
  }
  const auto status = to_status(*raw_status);
  if (!status) {
    return std::nullopt;
  }
  return FetchResponse{static_cast<std::uint8_t>(*trans), *status, std::move(*name), std::move(*data)};
}

Mapping FetchResponse::to_value() const {
  return Mapping{
    {"trans", Value::unsigned_integer(trans)},
    {"status", status_value(status)},
    {"nlen", Value::unsigned_integer(0)},
    {"name", Value::string(name)},
    {"dlen", Value::unsigned_integer(0)},
    {"data", Value::bytes(data)},
  };
}

// ---- MemoryStorage ----

Status MemoryStorage::store(std::string_view name, std::vector<core::byte> data) {
  if (name.empty()) {
    return Status::ekey;
  }
  std::lock_guard lk(mu_);
  entries_.insert_or_assign(std::string(name), std::move(data));
  return Status::success;
}

Status MemoryStorage::fetch(std::string_view name, std::vector<core::byte>& out) {
  std::lock_guard lk(mu_);
  const auto it = entries_.find(std::string(name));
  if (it == entries_.end()) {
    return Status::ekey;
  }
  out = it->second;
  return Status::success;
}

std::size_t MemoryStorage::size() const {
  std::lock_guard lk(mu_);
  return entries_.size();
}

// ---- handlers ----

std::pair<std::error_code, StoreResponse> StoreHandler::handle(const StoreRequest& request, const protocol::Frame&) {
  // 存储失败通过 status 回报给对端，不作为处理错误。
  const auto status = storage_->store(request.name, request.data);
  core::detail::logger().debug("store '{}' ({} bytes): {}", request.name, request.data.size(), to_string(status));
  return {std::error_code{}, StoreResponse{request.trans, request.name, status}};
}

std::pair<std::error_code, FetchResponse> FetchHandler::handle(const FetchRequest& request, const protocol::Frame&) {
  FetchResponse response{request.trans, Status::fail, request.name, {}};
  response.status = storage_->fetch(request.name, response.data);
  if (response.data.size() > std::numeric_limits<std::uint16_t>::max()) {
    // dlen 放不下：不回传数据。
    response.data.clear();
    response.status = Status::eio;
  }
  core::detail::logger().debug("fetch '{}': {}", request.name, to_string(response.status));
  return {std::error_code{}, std::move(response)};
}

// ---- registration ----

std::error_code register_store_messages(protocol::Registry& registry) {
  auto ec = registry.add<StoreRequest>();
  if (ec) {
    return ec;
  }
  ec = registry.add<StoreResponse>();
  if (ec) {
    return ec;
  }
  ec = registry.add<FetchRequest>();
  if (ec) {
    return ec;
  }
  return registry.add<FetchResponse>();
}

std::error_code register_store_protocol(protocol::Registry& registry, protocol::Dispatcher& dispatcher,
                                        std::shared_ptr<Storage> storage) {
  if (!storage) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  auto ec = register_store_messages(registry);
  if (ec) {
    return ec;
  }
  protocol::register_typed_handler(dispatcher, std::make_shared<StoreHandler>(storage));
  protocol::register_typed_handler(dispatcher, std::make_shared<FetchHandler>(std::move(storage)));
  return {};
}

}  // namespace binform::messages
