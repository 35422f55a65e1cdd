#include "binform/protocol/dispatcher.hpp"

#include "core/logger.hpp"

#include "binform/codec/error.hpp"

namespace binform::protocol {

// 表操作加锁；find 返回拷贝，handler 在锁外执行。
void Dispatcher::set(std::uint8_t msg_id, Handler handler) {
  std::lock_guard lk(mu_);
  handlers_.insert_or_assign(msg_id, std::move(handler));
}

void Dispatcher::erase(std::uint8_t msg_id) noexcept {
  std::lock_guard lk(mu_);
  handlers_.erase(msg_id);
}

void Dispatcher::clear() noexcept {
  std::lock_guard lk(mu_);
  handlers_.clear();
}

std::optional<Handler> Dispatcher::find(std::uint8_t msg_id) const {
  std::lock_guard lk(mu_);
  const auto it = handlers_.find(msg_id);
  if (it == handlers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::error_code Dispatcher::dispatch(core::bytes_view frame, std::vector<core::byte>& reply_out) const {
  Frame request;
  auto ec = decode_frame(registry_, frame, request);
  if (ec) {
    return ec;
  }

  auto handler = find(request.msg_id);
  if (!handler.has_value()) {
    core::detail::logger().warn("no handler for message id {:#04x}", request.msg_id);
    return codec::make_error_code(codec::errc::unknown_variant);
  }

  auto [handler_ec, reply] = (*handler)(request);
  if (handler_ec) {
    return handler_ec;
  }
  if (!reply.has_value()) {
    return {};
  }
  return encode_frame(registry_, *reply, reply_out);
}

}  // namespace binform::protocol
