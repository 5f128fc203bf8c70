#include "policylens_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <stdexcept>

namespace policylens_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "retrieve" || command == "r") {
        options.command = Command::Retrieve;
        for (int i = 2; i < argc; i += 2) {
            std::string flag = argv[i];
            if (i + 1 >= argc) {
                throw CliError("Missing value for " + flag);
            }
            std::string value = argv[i + 1];

            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--top-k" || flag == "-k") {
                try {
                    options.top_k = std::stoi(value);
                } catch (const std::logic_error&) {
                    throw CliError("--top-k expects a number, got '" + value + "'");
                }
                if (options.top_k < 1) {
                    throw CliError("--top-k must be at least 1");
                }
            } else if (flag == "--region") {
                options.region = value;
            } else if (flag == "--category") {
                options.category = value;
            } else {
                throw CliError("Unknown option for retrieve: " + flag);
            }
        }
        if (options.query.empty()) {
            throw CliError("Retrieve command requires a query. Usage: retrieve --query <query>");
        }
    } else if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
        for (int i = 2; i < argc; i += 2) {
            std::string flag = argv[i];
            if (i + 1 >= argc) {
                throw CliError("Missing value for " + flag);
            }
            std::string value = argv[i + 1];

            if (flag == "--pages" || flag == "-p") {
                options.pages_file = value;
            } else {
                throw CliError("Unknown option for ingest: " + flag);
            }
        }
        if (options.pages_file.empty()) {
            throw CliError("Ingest command requires a pages file. Usage: ingest --pages <file>");
        }
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Retrieve:
            handle_retrieve_command(options);
            break;
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Stats:
            handle_stats_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_retrieve_command(const CliOptions& options) {
    std::cout << "Retrieving for: " << options.query << " (top_k: " << options.top_k << ")" << std::endl;

    nlohmann::json request_data = {
        {"query", options.query},
        {"top_k", options.top_k}
    };
    if (!options.region.empty()) {
        request_data["region"] = options.region;
    }
    if (!options.category.empty()) {
        request_data["category"] = options.category;
    }

    print_retrieve_response(make_post_request("/retrieve", request_data));
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    std::cout << "Ingesting pages from: " << options.pages_file << std::endl;

    nlohmann::json request_data = {
        {"pages_file", options.pages_file}
    };
    print_ingest_response(make_post_request("/ingest", request_data));
}

void CliHandler::handle_stats_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/stats");
    std::cout << "Vectors:    " << response.value("total_vectors", 0) << std::endl;
    std::cout << "Dimension:  " << response.value("dimension", 0) << std::endl;
    std::cout << "Regions:    " << response.value("regions", nlohmann::json::object()).dump() << std::endl;
    std::cout << "Categories: " << response.value("categories", nlohmann::json::object()).dump() << std::endl;
}

void CliHandler::print_retrieve_response(const nlohmann::json& response) {
    const auto results = response.value("results", nlohmann::json::array());
    if (results.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    std::cout << "\n--- Results (lower score = closer) ---" << std::endl;
    for (const auto& result : results) {
        std::cout << std::setw(3) << result.value("rank", 0) << ". "
                  << result.value("chunk_id", "") << "  [" << result.value("region", "unknown")
                  << "/" << result.value("category", "unknown") << "]  score: "
                  << std::fixed << std::setprecision(4) << result.value("score", 0.0) << std::endl;
        std::cout << "     " << result.value("text", "") << std::endl;
    }
}

void CliHandler::print_ingest_response(const nlohmann::json& response) {
    const auto report = response.value("data", nlohmann::json::object());
    std::cout << "Pages received: " << report.value("pages_received", 0)
              << ", indexed: " << report.value("pages_indexed", 0)
              << ", skipped: " << report.value("pages_skipped", 0)
              << ", empty: " << report.value("pages_empty", 0) << std::endl;
    const auto stats = report.value("chunk_stats", nlohmann::json::object());
    std::cout << "Chunks: " << stats.value("total_chunks", 0)
              << " (avg " << stats.value("avg_chunk_size", 0) << " chars, range ["
              << stats.value("min_chunk_size", 0) << ", " << stats.value("max_chunk_size", 0)
              << "])" << std::endl;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }
    return finish_request(response_buffer);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data.dump();
    std::string response_buffer;
    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_handle_);
    curl_slist_free_all(headers);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }
    return finish_request(response_buffer);
}

nlohmann::json CliHandler::finish_request(const std::string& response_buffer) {
    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json response = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
        if (response.is_object() && response.contains("error") && response["error"].is_string()) {
            message += " (" + response["error"].get<std::string>() + ")";
        }
        throw CliError(message);
    }
    if (response.is_discarded()) {
        throw CliError("Server returned a response that is not JSON");
    }
    return response;
}

void CliHandler::print_help() {
    std::cout << R"(
PolicyLens CLI - semantic retrieval over insurance plan documents

Usage: policylens_cli <command> [options]

Commands:
  retrieve, r   Retrieve the chunks closest to a query
    --query, -q <query>  Query text
    --top-k, -k <num>    Number of results to return (default: 5)
    --region <code>      Only chunks from this region (e.g. NC)
    --category <name>    Only chunks of this category (formulary, faq, network, summary)

  ingest, i     Ingest a JSON array of page records and rebuild the store
    --pages, -p <file>   Path to the pages file (readable by the server)

  stats         Show store statistics

  help, h       Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the PolicyLens API (default: http://127.0.0.1:3030)

Examples:
  policylens_cli retrieve --query "Is metformin covered?" --top-k 3 --region NC
  policylens_cli ingest --pages ./data/pages.json
  policylens_cli stats
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

}  // namespace policylens_cli
