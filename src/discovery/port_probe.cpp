// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/port_probe.hpp"

#include "util/logging.hpp"

#include <asio.hpp>

namespace cartograph {
namespace discovery {

bool AsioPortProber::IsPortOpen(const std::string& address, uint16_t port, std::chrono::seconds timeout) {
  try {
    asio::io_context io;

    asio::ip::tcp::resolver resolver(io);
    asio::error_code resolve_ec;
    auto endpoints = resolver.resolve(address, std::to_string(port), resolve_ec);
    if (resolve_ec) {
      LOG_CRAWL_DEBUG("probe {}:{} resolve failed: {}", address, port, resolve_ec.message());
      return false;
    }

    asio::ip::tcp::socket socket(io);
    bool connected = false;
    bool timed_out = false;

    // Connect with a deadline timer for timeout
    asio::steady_timer deadline(io, timeout);
    deadline.async_wait([&](const asio::error_code& ec) {
      if (!ec && !connected) {
        timed_out = true;
        asio::error_code ignored;
        socket.close(ignored);
      }
    });

    asio::async_connect(socket, endpoints, [&](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
      if (!ec) {
        connected = true;
      }
      deadline.cancel();
    });

    io.run();

    if (connected) {
      asio::error_code ignored;
      socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
      socket.close(ignored);
    } else {
      LOG_CRAWL_DEBUG("probe {}:{} {}", address, port, timed_out ? "timed out" : "refused");
    }
    return connected;
  } catch (const std::exception& e) {
    LOG_CRAWL_WARN("probe {}:{} failed: {}", address, port, e.what());
    return false;
  }
}

}  // namespace discovery
}  // namespace cartograph
