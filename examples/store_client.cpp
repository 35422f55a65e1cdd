/**
 * @file store_client.cpp
 * @brief store/fetch 客户端示例：存入一个键，再取回并打印
 *
 * 用法: ./store_client [host] [port] [name] [data]
 * 默认: 127.0.0.1:4711 greeting "hello binform"
 */

#include "frame_io.hpp"

#include <binform/core/log.hpp>
#include <binform/messages/store.hpp>
#include <binform/protocol/frame.hpp>
#include <binform/protocol/message.hpp>
#include <binform/protocol/registry.hpp>
#include <binform/utils/hex.hpp>
#include <binform/utils/value_dump.hpp>

#include <asio/co_spawn.hpp>
#include <asio/connect.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <vector>

using namespace binform;

namespace {

struct ClientOptions final {
  std::string host{"127.0.0.1"};
  std::string port{"4711"};
  std::string name{"greeting"};
  std::string data{"hello binform"};
};

/**
 * @brief 发送一条请求并等待一帧回复，回复解码为 Resp。
 */
template <protocol::Message Req, protocol::Message Resp>
asio::awaitable<std::optional<Resp>> round_trip(asio::ip::tcp::socket& socket, const protocol::Registry& registry,
                                                const Req& request) {
  protocol::Frame frame{Req::kMsgId, request.to_value()};
  std::vector<core::byte> out;
  if (auto ec = protocol::encode_frame(registry, frame, out)) {
    spdlog::error("[client] encode {} failed: {}", Req::kName, ec.message());
    co_return std::nullopt;
  }
  spdlog::debug("[client] tx {}", utils::to_hex(core::bytes_view{out.data(), out.size()}));
  if (auto ec = co_await examples::async_write_frame(socket, out)) {
    spdlog::error("[client] write failed: {}", ec.message());
    co_return std::nullopt;
  }

  auto [ec, raw] = co_await examples::async_read_frame(socket);
  if (ec) {
    spdlog::error("[client] read failed: {}", ec.message());
    co_return std::nullopt;
  }
  protocol::Frame reply;
  if (auto dec_ec = protocol::decode_frame(registry, core::bytes_view{raw.data(), raw.size()}, reply)) {
    spdlog::error("[client] decode reply failed: {}", dec_ec.message());
    co_return std::nullopt;
  }
  if (reply.msg_id != Resp::kMsgId) {
    spdlog::error("[client] unexpected reply id 0x{:02x}", reply.msg_id);
    co_return std::nullopt;
  }
  utils::ValueDumpOptions dump_opt;
  dump_opt.multiline = false;
  spdlog::info("[client] {} {}", Resp::kName, utils::dump_value(reply.body, dump_opt));
  co_return Resp::from_value(reply.body);
}

asio::awaitable<void> run_client(asio::ip::tcp::socket& socket, const protocol::Registry& registry,
                                 const ClientOptions& opt) {
  messages::StoreRequest store{1, opt.name, std::vector<core::byte>(opt.data.begin(), opt.data.end())};
  auto stored = co_await round_trip<messages::StoreRequest, messages::StoreResponse>(socket, registry, store);
  if (!stored) {
    co_return;
  }
  spdlog::info("[client] store '{}' -> {}", stored->name, messages::to_string(stored->status));

  messages::FetchRequest fetch{2, opt.name};
  auto fetched = co_await round_trip<messages::FetchRequest, messages::FetchResponse>(socket, registry, fetch);
  if (!fetched) {
    co_return;
  }
  spdlog::info("[client] fetch '{}' -> {} ({} bytes): \"{}\"", fetched->name, messages::to_string(fetched->status),
               fetched->data.size(), std::string(fetched->data.begin(), fetched->data.end()));

  messages::FetchRequest missing{3, opt.name + ".missing"};
  auto absent = co_await round_trip<messages::FetchRequest, messages::FetchResponse>(socket, registry, missing);
  if (absent) {
    spdlog::info("[client] fetch '{}' -> {}", absent->name, messages::to_string(absent->status));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  ClientOptions opt;
  if (argc > 1) {
    opt.host = argv[1];
  }
  if (argc > 2) {
    opt.port = argv[2];
  }
  if (argc > 3) {
    opt.name = argv[3];
  }
  if (argc > 4) {
    opt.data = argv[4];
  }
  core::set_log_level(core::LogLevel::info);

  protocol::Registry registry;
  if (auto ec = messages::register_store_messages(registry)) {
    spdlog::error("[client] registry setup failed: {}", ec.message());
    return 1;
  }

  try {
    asio::io_context ioc;
    asio::ip::tcp::resolver resolver(ioc);
    asio::ip::tcp::socket socket(ioc);
    asio::connect(socket, resolver.resolve(opt.host, opt.port));
    spdlog::info("[client] connected to {}:{}", opt.host, opt.port);

    asio::co_spawn(ioc, run_client(socket, registry, opt), asio::detached);
    ioc.run();
  } catch (const std::exception& e) {
    spdlog::error("[client] exception: {}", e.what());
    return 1;
  }
  spdlog::info("[client] done");
  return 0;
}
