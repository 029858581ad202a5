#include "docqa_api/server.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <tuple>

namespace docqa_api {

std::pair<std::string, int> Server::parse_bind_address(const std::string &bind_address) {
  const size_t colon = bind_address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == bind_address.size()) {
    throw std::invalid_argument("Bind address must have the form host:port, got '" +
                                bind_address + "'");
  }
  const std::string port_text = bind_address.substr(colon + 1);
  if (port_text.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("Invalid port in bind address '" + bind_address + "'");
  }
  const int port = std::stoi(port_text);
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Port out of range in bind address '" + bind_address + "'");
  }
  return {bind_address.substr(0, colon), port};
}

Server::Server(const std::string &bind_address, unsigned threads) : port_(0), threads_(threads) {
  std::tie(host_, port_) = parse_bind_address(bind_address);
  if (threads_ == 0) {
    threads_ = std::max(2u, std::thread::hardware_concurrency());
  }
}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "Serving on " << host_ << ":" << port_ << " with " << threads_
            << " request threads" << std::endl;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.bindaddr(host_).port(static_cast<uint16_t>(port_)).concurrency(threads_).run();
  });
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

}  // namespace docqa_api
