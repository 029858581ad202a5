#include "docqa_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <sstream>

namespace docqa_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--verbose" || flag == "-v") {
                options.verbose = true;
                continue;
            }
            if (i + 1 >= argc) {
                throw CliError("Missing value for " + flag);
            }
            std::string value = argv[++i];

            try {
                if (flag == "--query" || flag == "-q") {
                    options.query = value;
                } else if (flag == "--top-k" || flag == "-k") {
                    options.top_k = std::stoi(value);
                    if (options.top_k < 1) {
                        throw CliError("--top-k must be at least 1");
                    }
                } else if (flag == "--threshold" || flag == "-t") {
                    options.threshold = std::stof(value);
                    if (options.threshold < -1.0f || options.threshold > 1.0f) {
                        throw CliError("--threshold must be within [-1, 1]");
                    }
                } else {
                    throw CliError("Unknown option for ask: " + flag);
                }
            } catch (const std::logic_error&) {
                throw CliError("Invalid value for " + flag + ": " + value);
            }
        }
        if (options.query.empty()) {
            throw CliError("Ask command requires a question. Usage: ask --query <question>");
        }
    } else if (command == "rebuild" || command == "r") {
        options.command = Command::Rebuild;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--corpus" || flag == "-c") {
                options.corpus_path = value;
            }
        }
    } else if (command == "info" || command == "i") {
        options.command = Command::Info;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ask:
            return handle_ask_command(options);
        case Command::Rebuild:
            return handle_rebuild_command(options);
        case Command::Info:
            return handle_info_command(options);
        case Command::Help:
            return handle_help_command(options);
    }
    return 1;
}

nlohmann::json CliHandler::build_query_request(const CliOptions& options) {
    nlohmann::json request_data = {
        {"question", options.query}
    };
    if (options.top_k > 0) {
        request_data["top_k"] = options.top_k;
    }
    if (options.threshold >= -1.0f && options.threshold <= 1.0f) {
        request_data["threshold"] = options.threshold;
    }
    return request_data;
}

nlohmann::json CliHandler::build_rebuild_request(const CliOptions& options) {
    nlohmann::json request_data = nlohmann::json::object();
    if (!options.corpus_path.empty()) {
        request_data["corpus_path"] = options.corpus_path;
    }
    return request_data;
}

std::string CliHandler::format_answer(const nlohmann::json& response, bool verbose) {
    std::ostringstream out;
    out << response.value("answer", "") << "\n";

    if (response.value("refused", true)) {
        out << "\n(refused: " << response.value("reason", "unknown");
        if (response.contains("error")) {
            out << ", " << response["error"].get<std::string>();
        }
        out << ")\n";
    } else if (response.contains("sources") && !response["sources"].empty()) {
        out << "\nSources:\n";
        for (const auto& source : response["sources"]) {
            out << "  - " << source.get<std::string>() << "\n";
        }
    }

    if (verbose) {
        if (response.contains("retrieved")) {
            out << "\nRetrieved chunks:\n";
            for (const auto& chunk : response["retrieved"]) {
                out << "  " << std::fixed << std::setprecision(3) << chunk.value("score", 0.0)
                    << "  " << chunk.value("chunk_id", "") << "\n";
            }
        }
        out << "\nContext:\n" << response.value("context", "") << "\n";
    }
    return out.str();
}

int CliHandler::handle_ask_command(const CliOptions& options) {
    try {
        nlohmann::json response = make_post_request("/query", build_query_request(options));
        std::cout << format_answer(response, options.verbose);
        return 0;
    } catch (const std::exception& e) {
        print_error("Failed to ask: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_rebuild_command(const CliOptions& options) {
    std::cout << "Rebuilding index"
              << (options.corpus_path.empty() ? "" : " from " + options.corpus_path) << "..."
              << std::endl;

    try {
        nlohmann::json response = make_post_request("/rebuild", build_rebuild_request(options));
        std::cout << "Generation " << response.value("generation", "") << ": "
                  << response.value("documents", 0) << " documents ("
                  << response.value("skipped_documents", 0) << " skipped), "
                  << response.value("chunks", 0) << " chunks ("
                  << response.value("dropped_chunks", 0) << " dropped)" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        print_error("Failed to rebuild: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_info_command(const CliOptions& options) {
    try {
        nlohmann::json response = make_get_request("/index");
        print_json_response(response);
        return 0;
    } catch (const std::exception& e) {
        print_error("Failed to get index info: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
    return 0;
}

nlohmann::json CliHandler::finish_request(const std::string& response_buffer) {
    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        // Error bodies carry {"success": false, "error": ...}
        nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
        if (!body.is_discarded() && body.is_object() && body.contains("error")) {
            throw CliError(body["error"].get<std::string>() + " (HTTP " +
                           std::to_string(http_code) + ")");
        }
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code));
    }

    return nlohmann::json::parse(response_buffer);
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

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << "DocQA CLI - Ask questions about your documentation\n\n";
    std::cout << "Usage: docqa_cli <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  ask, a       Ask a question\n";
    std::cout << "               --query, -q <question>   Question to answer\n";
    std::cout << "               --top-k, -k <number>     Chunks to retrieve (server default)\n";
    std::cout << "               --threshold, -t <value>  Minimum similarity (server default)\n";
    std::cout << "               --verbose, -v            Show retrieved chunks and context\n\n";
    std::cout << "  rebuild, r   Rebuild the index\n";
    std::cout << "               --corpus, -c <dir>       Corpus directory (server default)\n\n";
    std::cout << "  info, i      Show the served index manifest\n";
    std::cout << "  help, h      Show this help message\n\n";
    std::cout << "Environment:\n";
    std::cout << "  API_BASE_URL  Server address (default: http://127.0.0.1:3030)\n";
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string url = api_base_url_;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + endpoint;
}

}  // namespace docqa_cli
