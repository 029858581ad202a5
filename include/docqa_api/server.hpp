#pragma once
#include <crow.h>

#include <future>
#include <string>
#include <utility>

namespace docqa_api {

/**
 * @class Server
 * @brief Crow application serving the query API on a background thread.
 *
 * Requests are handled on a pool of `threads` Crow workers, so independent
 * queries run concurrently.
 */
class Server {
 public:
  // bind_address is "host:port"; throws std::invalid_argument otherwise.
  explicit Server(const std::string &bind_address, unsigned threads = 0);
  ~Server();

  // Disable move and copy operations since crow::SimpleApp doesn't support them
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

  const std::string &host() const {
    return host_;
  }
  int port() const {
    return port_;
  }

  static std::pair<std::string, int> parse_bind_address(const std::string &bind_address);

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  unsigned threads_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};

}  // namespace docqa_api
