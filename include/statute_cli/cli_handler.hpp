#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace statute_cli
{

  enum class Command
  {
    Ingest,
    Search,
    Jurisdictions,
    Chunks,
    Delete,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string document_id;
    std::string jurisdiction;
    std::string region;
    std::string query;
    int top_k = 5;
    float min_relevance = 0.0f;

    // Chunking overrides; unset fields use the server's defaults
    std::optional<int> target_words;
    std::optional<int> max_words;
    std::optional<int> overlap_sentences;
    std::optional<float> semantic_threshold;
    bool structural = false;
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

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Throws CliError on unknown commands, missing values or malformed numbers.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Request body for POST /ingest, without the document text.
    static nlohmann::json build_ingest_request(const CliOptions &options);

    void execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    void handle_ingest_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_jurisdictions_command(const CliOptions &options);
    void handle_chunks_command(const CliOptions &options);
    void handle_delete_command(const CliOptions &options);

    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json make_delete_request(const std::string &endpoint);
    nlohmann::json perform(const std::string &endpoint);

    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_search_response(const nlohmann::json &response);
    void print_jurisdictions_response(const nlohmann::json &response);
    void print_chunks_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    static void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
