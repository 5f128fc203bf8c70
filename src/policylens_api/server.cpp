#include "policylens_api/server.hpp"

#include <stdexcept>
#include <utility>

#include "policylens_core/errors.hpp"

namespace policylens_api {
Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

std::pair<std::string, int> Server::parse_address(const std::string &address) {
  size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw policylens_core::ConfigError("Address must be host:port, got '" + address + "'");
  }
  std::string host = address.substr(0, colon);
  std::string port_text = address.substr(colon + 1);
  int port = 0;
  try {
    size_t consumed = 0;
    port = std::stoi(port_text, &consumed);
    if (consumed != port_text.size()) {
      throw std::invalid_argument(port_text);
    }
  } catch (const std::logic_error &) {
    throw policylens_core::ConfigError("Invalid port in address '" + address + "'");
  }
  if (port <= 0 || port > 65535) {
    throw policylens_core::ConfigError("Port out of range in address '" + address + "'");
  }
  return {host, port};
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ =
      std::async(std::launch::async, [this] { app_.port(port_).bindaddr(host_).run(); });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}
}  // namespace policylens_api
