#include "statute_cli/cli_handler.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace statute_cli {

namespace {

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw CliError("Invalid number for " + flag + ": " + value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw CliError("Invalid number for " + flag + ": " + value);
    }
}

float parse_float(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        float result = std::stof(value, &pos);
        if (pos != value.size()) {
            throw CliError("Invalid number for " + flag + ": " + value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw CliError("Invalid number for " + flag + ": " + value);
    }
}

std::string url_escape(const std::string& value) {
    std::ostringstream out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return out.str();
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CliError("Failed to open file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

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
    : api_base_url_(std::move(other.api_base_url_)), curl_handle_(other.curl_handle_) {
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
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
    } else if (command == "jurisdictions" || command == "j") {
        options.command = Command::Jurisdictions;
    } else if (command == "chunks" || command == "c") {
        options.command = Command::Chunks;
    } else if (command == "delete" || command == "d") {
        options.command = Command::Delete;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--structural") {
            options.structural = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--file" || flag == "-f") {
            options.file_path = value;
        } else if (flag == "--id" || flag == "-i") {
            options.document_id = value;
        } else if (flag == "--jurisdiction" || flag == "-j") {
            options.jurisdiction = value;
        } else if (flag == "--region" || flag == "-r") {
            options.region = value;
        } else if (flag == "--query" || flag == "-q") {
            options.query = value;
        } else if (flag == "--top-k" || flag == "-k") {
            options.top_k = parse_int(flag, value);
        } else if (flag == "--min-relevance") {
            options.min_relevance = parse_float(flag, value);
        } else if (flag == "--target-words") {
            options.target_words = parse_int(flag, value);
        } else if (flag == "--max-words") {
            options.max_words = parse_int(flag, value);
        } else if (flag == "--overlap") {
            options.overlap_sentences = parse_int(flag, value);
        } else if (flag == "--threshold") {
            options.semantic_threshold = parse_float(flag, value);
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    switch (options.command) {
        case Command::Ingest:
            if (options.file_path.empty() || options.document_id.empty() || options.region.empty()) {
                throw CliError(
                    "Ingest requires --file, --id and --region. Usage: ingest --file <path> --id <id> "
                    "--region <region> [--jurisdiction <name>]");
            }
            break;
        case Command::Search:
            if (options.query.empty() || options.region.empty()) {
                throw CliError("Search requires --query and --region. Usage: search --query <query> --region <region>");
            }
            break;
        case Command::Jurisdictions:
            if (options.region.empty()) {
                throw CliError("Jurisdictions requires --region. Usage: jurisdictions --region <region>");
            }
            break;
        case Command::Chunks:
        case Command::Delete:
            if (options.document_id.empty()) {
                throw CliError("This command requires --id <document_id>");
            }
            break;
        default:
            break;
    }

    return options;
}

nlohmann::json CliHandler::build_ingest_request(const CliOptions& options) {
    nlohmann::json request_data = {
        {"document_id", options.document_id},
        {"jurisdiction", options.jurisdiction},
        {"region", options.region}
    };

    nlohmann::json config = nlohmann::json::object();
    if (options.target_words) config["target_words"] = *options.target_words;
    if (options.max_words) config["max_words"] = *options.max_words;
    if (options.overlap_sentences) config["overlap_sentences"] = *options.overlap_sentences;
    if (options.semantic_threshold) config["semantic_threshold"] = *options.semantic_threshold;
    if (options.structural) config["use_semantic_boundaries"] = false;
    if (!config.empty()) {
        request_data["config"] = config;
    }
    return request_data;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Jurisdictions:
            handle_jurisdictions_command(options);
            break;
        case Command::Chunks:
            handle_chunks_command(options);
            break;
        case Command::Delete:
            handle_delete_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    std::cout << "Ingesting " << options.file_path << " as '" << options.document_id << "'" << std::endl;

    try {
        nlohmann::json request_data = build_ingest_request(options);
        request_data["text"] = read_file(options.file_path);
        nlohmann::json response = make_post_request("/ingest", request_data);
        const auto& data = response["data"];
        if (data.value("skipped", false)) {
            std::cout << "Document has no content; nothing was stored." << std::endl;
        } else {
            std::cout << "Stored " << data.value("chunks_written", 0) << " chunks." << std::endl;
        }
    } catch (const std::exception& e) {
        print_error("Failed to ingest document: " + std::string(e.what()));
    }
}

void CliHandler::handle_search_command(const CliOptions& options) {
    std::cout << "Searching " << options.region;
    if (!options.jurisdiction.empty()) {
        std::cout << "/" << options.jurisdiction;
    }
    std::cout << " for: " << options.query << " (top_k: " << options.top_k << ")" << std::endl;

    nlohmann::json request_data = {
        {"query", options.query},
        {"region", options.region},
        {"top_k", options.top_k},
        {"min_relevance", options.min_relevance}
    };
    if (!options.jurisdiction.empty()) {
        request_data["jurisdiction"] = options.jurisdiction;
    }

    try {
        nlohmann::json response = make_post_request("/search", request_data);
        print_search_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to search: " + std::string(e.what()));
    }
}

void CliHandler::handle_jurisdictions_command(const CliOptions& options) {
    try {
        nlohmann::json response = make_get_request("/jurisdictions?region=" + url_escape(options.region));
        print_jurisdictions_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to list jurisdictions: " + std::string(e.what()));
    }
}

void CliHandler::handle_chunks_command(const CliOptions& options) {
    try {
        nlohmann::json response =
            make_get_request("/documents/" + url_escape(options.document_id) + "/chunks");
        print_chunks_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to get chunks: " + std::string(e.what()));
    }
}

void CliHandler::handle_delete_command(const CliOptions& options) {
    try {
        make_delete_request("/documents/" + url_escape(options.document_id));
        std::cout << "Deleted document '" << options.document_id << "'" << std::endl;
    } catch (const std::exception& e) {
        print_error("Failed to delete document: " + std::string(e.what()));
    }
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    return perform(endpoint);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    std::string request_json = data.dump();
    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
    try {
        nlohmann::json response = perform(endpoint);
        curl_slist_free_all(headers);
        return response;
    } catch (const std::exception&) {
        curl_slist_free_all(headers);
        throw;
    }
}

nlohmann::json CliHandler::make_delete_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
    return perform(endpoint);
}

nlohmann::json CliHandler::perform(const std::string& endpoint) {
    std::string url = build_url(endpoint);
    std::string response_buffer;
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, /*allow_exceptions*/ false);
    if (http_code != 200) {
        std::string detail = body.is_object() ? body.value("error", std::string()) : std::string();
        throw CliError("HTTP " + std::to_string(http_code) + (detail.empty() ? "" : ": " + detail));
    }
    if (body.is_discarded()) {
        throw CliError("Server returned malformed JSON");
    }
    return body;
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_search_response(const nlohmann::json& response) {
    std::cout << "\n=== Search Results ===" << std::endl;
    if (!response.contains("results") || response["results"].empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    for (const auto& hit : response["results"]) {
        std::cout << "  • " << hit.value("source_document_id", std::string()) << ":"
                  << hit.value("chunk_number", 0) << " [" << hit.value("jurisdiction", std::string())
                  << "] " << hit.value("section_id", std::string()) << " "
                  << hit.value("section_title", std::string()) << " | Score: " << std::fixed
                  << std::setprecision(3) << hit.value("relevance_score", 0.0f) << std::endl;
        std::string content = hit.value("content", std::string());
        std::cout << "    " << content.substr(0, 100);
        if (content.length() > 100) {
            std::cout << "...";
        }
        std::cout << std::endl << std::endl;
    }

    const auto& best = response["results"][0];
    std::cout << std::string(80, '=') << std::endl;
    std::cout << "BEST MATCH" << std::endl;
    std::cout << std::string(80, '-') << std::endl;
    std::cout << best.value("content", std::string()) << std::endl;
    std::cout << std::string(80, '=') << std::endl;
}

void CliHandler::print_jurisdictions_response(const nlohmann::json& response) {
    if (!response.contains("data") || response["data"].empty()) {
        std::cout << "No jurisdictions indexed for this region." << std::endl;
        return;
    }
    for (const auto& entry : response["data"]) {
        std::cout << "  " << std::left << std::setw(40) << entry.value("jurisdiction", std::string())
                  << entry.value("chunk_count", 0) << " chunks" << std::endl;
    }
}

void CliHandler::print_chunks_response(const nlohmann::json& response) {
    const auto& data = response["data"];
    std::cout << "Document '" << data.value("document_id", std::string()) << "' version "
              << data.value("version", 0) << " (" << data.value("model_version", std::string()) << ")"
              << std::endl;
    for (const auto& chunk : data["chunks"]) {
        std::cout << "  #" << chunk.value("chunk_number", 0) << " " << chunk.value("section_id", std::string())
                  << " " << chunk.value("content_type", std::string()) << " | "
                  << chunk.value("word_count", 0) << " words" << std::endl;
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
Statute CLI - Regulatory Document Index

Usage: statute_cli <command> [options]

Commands:
  ingest, i         Chunk, embed and store a document
    --file, -f <path>          Extracted text of the document
    --id, -i <id>              Document identifier
    --region, -r <region>      Region (e.g. state code)
    --jurisdiction, -j <name>  Jurisdiction within the region
    --target-words <n>         Preferred chunk size in words
    --max-words <n>            Hard chunk size limit in words
    --overlap <n>              Sentences of context on each side
    --threshold <f>            Semantic split threshold in [0, 1]
    --structural               Split on paragraphs and headers instead of embeddings

  search, s         Semantic search within a region
    --query, -q <query>        Search query
    --region, -r <region>      Region to search
    --jurisdiction, -j <name>  Restrict to one jurisdiction
    --top-k, -k <num>          Number of results (default: 5)
    --min-relevance <f>        Drop results scoring below this

  jurisdictions, j  List jurisdictions in a region with chunk counts
    --region, -r <region>

  chunks, c         Show stored chunks of a document
    --id, -i <id>

  delete, d         Remove a document and its chunks
    --id, -i <id>

  help, h           Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the Statute API (default: http://127.0.0.1:3030)

Examples:
  statute_cli ingest --file zoning.txt --id springfield-zoning --region ZZ --jurisdiction Springfield
  statute_cli search --query "setback requirements" --region ZZ --top-k 10
  statute_cli jurisdictions --region ZZ
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

}  // namespace statute_cli
