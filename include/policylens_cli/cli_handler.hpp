#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace policylens_cli
{

  enum class Command
  {
    Retrieve,
    Ingest,
    Stats,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    int top_k = 5;
    std::string region;
    std::string category;
    std::string pages_file;
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

    // Parse command line arguments; throws CliError on bad usage
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command; throws CliError when the request fails
    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_retrieve_command(const CliOptions &options);
    void handle_ingest_command(const CliOptions &options);
    void handle_stats_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json finish_request(const std::string &response_buffer);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_retrieve_response(const nlohmann::json &response);
    void print_ingest_response(const nlohmann::json &response);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
