#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace docqa_cli
{

  enum class Command
  {
    Ask,
    Rebuild,
    Info,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    std::string corpus_path;
    int top_k = 0;           // 0 = server default
    float threshold = -2.0f; // outside [-1, 1] = server default
    bool verbose = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command; returns the process exit code
    int execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

    // Request bodies, exposed for tests
    static nlohmann::json build_query_request(const CliOptions &options);
    static nlohmann::json build_rebuild_request(const CliOptions &options);

    // Renders a /query response the way `ask` prints it
    static std::string format_answer(const nlohmann::json &response, bool verbose);

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    int handle_ask_command(const CliOptions &options);
    int handle_rebuild_command(const CliOptions &options);
    int handle_info_command(const CliOptions &options);
    int handle_help_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json finish_request(const std::string &response_buffer);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
