#pragma once

#include <binform/core/common.hpp>
#include <binform/protocol/frame.hpp>

#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/buffer.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <system_error>
#include <utility>
#include <vector>

namespace binform::examples {

/**
 * @brief 从 socket 读取完整的一帧（header + payload），返回原始字节。
 *
 * 先读 kHeaderSize 字节并解码出 length，再恰好读取 length 字节。
 * 对端关闭连接时返回 asio::error::eof。
 */
inline asio::awaitable<std::pair<std::error_code, std::vector<core::byte>>> async_read_frame(
  asio::ip::tcp::socket& socket) {
  std::array<core::byte, protocol::kHeaderSize> head{};
  auto [ec, n] = co_await asio::async_read(socket, asio::buffer(head), asio::as_tuple(asio::use_awaitable));
  if (ec) {
    co_return std::pair{std::error_code(ec), std::vector<core::byte>{}};
  }

  protocol::Header header;
  if (auto dec_ec = protocol::decode_header(core::bytes_view{head.data(), n}, header)) {
    co_return std::pair{dec_ec, std::vector<core::byte>{}};
  }

  std::vector<core::byte> frame(protocol::kHeaderSize + header.length);
  std::copy(head.begin(), head.end(), frame.begin());
  if (header.length != 0) {
    auto [body_ec, body_n] = co_await asio::async_read(
      socket, asio::buffer(frame.data() + protocol::kHeaderSize, header.length),
      asio::as_tuple(asio::use_awaitable));
    (void)body_n;
    if (body_ec) {
      co_return std::pair{std::error_code(body_ec), std::vector<core::byte>{}};
    }
  }
  co_return std::pair{std::error_code{}, std::move(frame)};
}

// 整帧写入（asio::async_write 保证全部写完或出错）。
inline asio::awaitable<std::error_code> async_write_frame(asio::ip::tcp::socket& socket,
                                                          const std::vector<core::byte>& frame) {
  auto [ec, n] = co_await asio::async_write(socket, asio::buffer(frame), asio::as_tuple(asio::use_awaitable));
  (void)n;
  co_return std::error_code(ec);
}

}  // namespace binform::examples
