#pragma once

#include "binform/codec/error.hpp"
#include "binform/core/error.hpp"
#include "binform/protocol/dispatcher.hpp"
#include "binform/protocol/frame.hpp"
#include "binform/protocol/message.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>

namespace binform::protocol {

/**
 * @brief 类型安全的消息处理器基类。
 *
 * 说明：
 * - TRequest/TResponse 必须满足 Message concept
 * - 子类实现 handle() 虚函数，处理业务逻辑
 * - invoke() 负责值树与强类型结构体之间的转换，由 Dispatcher 调用
 *
 * 使用示例：
 * @code
 * class PingHandler : public TypedHandler<PingRequest, PingResponse> {
 *  public:
 *   std::pair<std::error_code, PingResponse> handle(const PingRequest& req, const Frame&) override {
 *     return {std::error_code{}, PingResponse{req.seq}};
 *   }
 * };
 * @endcode
 */
template <Message TRequest, Message TResponse>
class TypedHandler {
 public:
  using request_type = TRequest;
  using response_type = TResponse;

  virtual ~TypedHandler() = default;

  /**
   * @brief 业务逻辑处理函数。
   *
   * @return 成功时 {std::error_code{}, response}；失败时 {error_code, TResponse{}}（响应被忽略）
   */
  virtual std::pair<std::error_code, TResponse> handle(const TRequest& request, const Frame& raw) = 0;

  /**
   * @brief 框架调用的入口。
   *
   * 错误处理：
   * - msg_id 与 TRequest 不符：返回 codec::errc::unknown_variant
   * - from_value 返回 nullopt：返回 core::errc::invalid_argument
   * - handle 返回错误：原样传播，不产生回复帧
   */
  HandlerResult invoke(const Frame& frame) {
    if (frame.msg_id != static_cast<std::uint8_t>(TRequest::kMsgId)) {
      return {codec::make_error_code(codec::errc::unknown_variant), std::nullopt};
    }
    auto request = TRequest::from_value(frame.body);
    if (!request.has_value()) {
      return {core::make_error_code(core::errc::invalid_argument), std::nullopt};
    }
    auto [ec, response] = handle(*request, frame);
    if (ec) {
      return {ec, std::nullopt};
    }
    return {std::error_code{}, Frame{static_cast<std::uint8_t>(TResponse::kMsgId), response.to_value()}};
  }
};

/**
 * @brief 把 TypedHandler 派生类注册到 Dispatcher（按 request_type::kMsgId）。
 */
template <typename THandler>
void register_typed_handler(Dispatcher& dispatcher, std::shared_ptr<THandler> handler) {
  using Request = typename THandler::request_type;
  dispatcher.set(static_cast<std::uint8_t>(Request::kMsgId),
                 [handler](const Frame& frame) -> HandlerResult { return handler->invoke(frame); });
}

}  // 命名空间 binform::protocol
