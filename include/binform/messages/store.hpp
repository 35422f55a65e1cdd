#pragma once

#include "binform/codec/node.hpp"
#include "binform/codec/value.hpp"
#include "binform/core/common.hpp"
#include "binform/protocol/dispatcher.hpp"
#include "binform/protocol/registry.hpp"
#include "binform/protocol/typed_handler.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace binform::messages {

/*
 * 键值存取协议（store / fetch）。
 *
 * 所有消息体以 trans（事务号，原样回显）开头；name / data 为 dynamic 长度的字节串，
 * 长度字段 nlen (u8) / dlen (u16) 紧邻其前。
 */

enum class Status : std::uint8_t {
  success = 0x00,
  eio = 0x01,
  ekey = 0x02,
  fail = 0xFF,
};

[[nodiscard]] std::string_view to_string(Status status) noexcept;

/**
 * @brief StoreRequest（0x01）：把 data 存到 name 下。
 *
 * {trans: u8, nlen: u8, name: bytes[nlen], dlen: u16, data: bytes[dlen]}
 */
struct StoreRequest final {
  static constexpr std::uint8_t kMsgId = 0x01;
  static constexpr std::string_view kName = "store_request";

  std::uint8_t trans{0};
  std::string name{};
  std::vector<core::byte> data{};

  static std::error_code build_schema(codec::Node& out);
  static std::optional<StoreRequest> from_value(const codec::Mapping& value);
  [[nodiscard]] codec::Mapping to_value() const;
};

/**
 * @brief StoreResponse（0x02）：{trans: u8, nlen: u8, name: bytes[nlen], status: u8}
 */
struct StoreResponse final {
  static constexpr std::uint8_t kMsgId = 0x02;
  static constexpr std::string_view kName = "store_response";

  std::uint8_t trans{0};
  std::string name{};
  Status status{Status::fail};

  static std::error_code build_schema(codec::Node& out);
  static std::optional<StoreResponse> from_value(const codec::Mapping& value);
  [[nodiscard]] codec::Mapping to_value() const;
};

/**
 * @brief FetchRequest（0x03）：{trans: u8, nlen: u8, name: bytes[nlen]}
 */
struct FetchRequest final {
  static constexpr std::uint8_t kMsgId = 0x03;
  static constexpr std::string_view kName = "fetch_request";

  std::uint8_t trans{0};
  std::string name{};

  static std::error_code build_schema(codec::Node& out);
  static std::optional<FetchRequest> from_value(const codec::Mapping& value);
  [[nodiscard]] codec::Mapping to_value() const;
};

/**
 * @brief FetchResponse（0x04）：{trans: u8, status: u8, nlen: u8, name: bytes[nlen], dlen: u16, data: bytes[dlen]}
 */
struct FetchResponse final {
  static constexpr std::uint8_t kMsgId = 0x04;
  static constexpr std::string_view kName = "fetch_response";

  std::uint8_t trans{0};
  Status status{Status::fail};
  std::string name{};
  std::vector<core::byte> data{};

  static std::error_code build_schema(codec::Node& out);
  static std::optional<FetchResponse> from_value(const codec::Mapping& value);
  [[nodiscard]] codec::Mapping to_value() const;
};

/**
 * @brief 存储后端能力接口（handler 只通过它访问存储）。
 */
class Storage {
 public:
  virtual ~Storage() = default;

  virtual Status store(std::string_view name, std::vector<core::byte> data) = 0;
  virtual Status fetch(std::string_view name, std::vector<core::byte>& out) = 0;
};

// 内存实现：互斥锁保护的哈希表，可被多个连接共享。
class MemoryStorage final : public Storage {
 public:
  Status store(std::string_view name, std::vector<core::byte> data) override;
  Status fetch(std::string_view name, std::vector<core::byte>& out) override;

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mu_{};
  std::unordered_map<std::string, std::vector<core::byte>> entries_{};
};

class StoreHandler final : public protocol::TypedHandler<StoreRequest, StoreResponse> {
 public:
  explicit StoreHandler(std::shared_ptr<Storage> storage) : storage_(std::move(storage)) {}

  std::pair<std::error_code, StoreResponse> handle(const StoreRequest& request, const protocol::Frame& raw) override;

 private:
  std::shared_ptr<Storage> storage_;
};

class FetchHandler final : public protocol::TypedHandler<FetchRequest, FetchResponse> {
 public:
  explicit FetchHandler(std::shared_ptr<Storage> storage) : storage_(std::move(storage)) {}

  std::pair<std::error_code, FetchResponse> handle(const FetchRequest& request, const protocol::Frame& raw) override;

 private:
  std::shared_ptr<Storage> storage_;
};

/**
 * @brief 注册四种消息的 schema。
 */
std::error_code register_store_messages(protocol::Registry& registry);

/**
 * @brief 注册 schema，并把 StoreHandler / FetchHandler 挂到 dispatcher（服务端使用）。
 *
 * dispatcher 必须引用同一个 registry。
 */
std::error_code register_store_protocol(protocol::Registry& registry, protocol::Dispatcher& dispatcher,
                                        std::shared_ptr<Storage> storage);

}  // namespace binform::messages
