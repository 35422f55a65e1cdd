/**
 * @file store_server.cpp
 * @brief store/fetch 服务端示例：每个连接循环“读一帧 -> 分发 -> 写回复”
 *
 * 用法: ./store_server [port]
 * 默认端口: 4711
 */

#include "frame_io.hpp"

#include <binform/core/log.hpp>
#include <binform/messages/store.hpp>
#include <binform/protocol/dispatcher.hpp>
#include <binform/protocol/registry.hpp>
#include <binform/utils/hex.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

using namespace binform;

namespace {

constexpr std::uint16_t kDefaultPort = 4711;

asio::awaitable<void> serve_connection(asio::ip::tcp::socket socket, const protocol::Dispatcher& dispatcher) {
  std::string peer = "?";
  std::error_code ep_ec;
  const auto remote = socket.remote_endpoint(ep_ec);
  if (!ep_ec) {
    peer = remote.address().to_string() + ":" + std::to_string(remote.port());
  }
  spdlog::info("[server] connection from {}", peer);

  while (true) {
    auto [ec, frame] = co_await examples::async_read_frame(socket);
    if (ec) {
      if (ec == asio::error::eof) {
        spdlog::info("[server] {} closed", peer);
      } else {
        spdlog::warn("[server] read from {} failed: {}", peer, ec.message());
      }
      break;
    }
    spdlog::debug("[server] rx {}", utils::to_hex(core::bytes_view{frame.data(), frame.size()}));

    std::vector<core::byte> reply;
    if (auto dispatch_ec = dispatcher.dispatch(core::bytes_view{frame.data(), frame.size()}, reply)) {
      // 无法解析的帧不回复，继续处理下一帧。
      spdlog::warn("[server] dispatch failed: {}", dispatch_ec.message());
      continue;
    }
    if (reply.empty()) {
      continue;
    }
    if (auto write_ec = co_await examples::async_write_frame(socket, reply)) {
      spdlog::warn("[server] write to {} failed: {}", peer, write_ec.message());
      break;
    }
  }
}

asio::awaitable<void> accept_loop(asio::ip::tcp::acceptor& acceptor, const protocol::Dispatcher& dispatcher) {
  while (true) {
    auto [ec, socket] = co_await acceptor.async_accept(asio::as_tuple(asio::use_awaitable));
    if (ec) {
      if (ec == asio::error::operation_aborted) {
        break;
      }
      spdlog::warn("[server] accept failed: {}", ec.message());
      continue;
    }
    asio::co_spawn(acceptor.get_executor(), serve_connection(std::move(socket), dispatcher), asio::detached);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::uint16_t port = kDefaultPort;
  if (argc > 1) {
    port = static_cast<std::uint16_t>(std::atoi(argv[1]));
  }
  core::set_log_level(core::LogLevel::info);

  protocol::Registry registry;
  protocol::Dispatcher dispatcher(registry);
  auto storage = std::make_shared<messages::MemoryStorage>();
  if (auto ec = messages::register_store_protocol(registry, dispatcher, storage)) {
    spdlog::error("[server] protocol setup failed: {}", ec.message());
    return 1;
  }

  try {
    asio::io_context ioc;
    asio::ip::tcp::acceptor acceptor(ioc, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port));
    spdlog::info("[server] listening on port {}", port);

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code&, int) {
      spdlog::info("[server] shutting down, {} entries stored", storage->size());
      acceptor.close();
      ioc.stop();
    });

    asio::co_spawn(ioc, accept_loop(acceptor, dispatcher), asio::detached);
    ioc.run();
  } catch (const std::exception& e) {
    spdlog::error("[server] exception: {}", e.what());
    return 1;
  }
  return 0;
}
