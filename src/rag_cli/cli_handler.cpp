#include "rag_cli/cli_handler.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "rag_core/io/record_reader.hpp"

namespace rag_cli {

namespace {

int parse_top_k(const std::string& value) {
    size_t consumed = 0;
    int k = 0;
    try {
        k = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw CliError("Invalid value for --top-k: " + value);
    }
    if (consumed != value.size() || k <= 0) {
        throw CliError("--top-k must be a positive integer, got: " + value);
    }
    return k;
}

} // namespace

CliHandler::CliHandler(const Config& config, std::ostream& out, std::ostream& err)
    : config_(config)
    , out_(out)
    , err_(err)
    , index_store_(std::make_shared<rag_core::IndexStore>(config.store_options())) {
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
    } else if (command == "query" || command == "q") {
        options.command = Command::Query;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[i + 1];

        if (flag == "--data-file" || flag == "-d") {
            options.data_file = value;
        } else if (flag == "--query-file" || flag == "-q") {
            options.query_file = value;
        } else if (flag == "--top-k" || flag == "-k") {
            options.top_k = parse_top_k(value);
        } else if (flag == "--config" || flag == "-c") {
            options.config_path = value;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    if (options.command == Command::Ingest && options.data_file.empty()) {
        throw CliError("Missing data file. Usage: ingest --data-file <path>");
    }
    if (options.command == Command::Query && options.query_file.empty()) {
        throw CliError("Missing query file. Usage: query --query-file <path>");
    }

    return options;
}

Config CliHandler::load_config(const CliOptions& options) {
    if (!options.config_path.empty()) {
        return Config::from_file(options.config_path);
    }
    std::error_code ec;
    if (std::filesystem::exists(Config::DEFAULT_CONFIG_FILE, ec)) {
        return Config::from_file(Config::DEFAULT_CONFIG_FILE);
    }
    return Config::defaults();
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Query:
            handle_query_command(options);
            break;
        case Command::Help:
            handle_help_command();
            break;
    }
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    std::vector<rag_core::Record> records = rag_core::RecordReader::read_ingest_file(options.data_file);

    rag_core::IngestService ingest_service(index_store_, config_.use_file_lock);
    rag_core::IngestResult result = ingest_service.ingest(records);

    err_ << "Successfully ingested " << result.ingested_count << " new chunks" << std::endl;
}

void CliHandler::handle_query_command(const CliOptions& options) {
    std::vector<float> query_vector = rag_core::RecordReader::read_query_file(options.query_file);
    int k = options.top_k > 0 ? options.top_k : config_.default_top_k;

    rag_core::QueryService query_service(index_store_, config_.use_file_lock);
    rag_core::QueryResult result = query_service.query(query_vector, k);

    // stdout carries only the JSON result so callers can parse it directly
    out_ << nlohmann::json(result.results).dump() << std::flush;
}

void CliHandler::handle_help_command() {
    out_ << "FAISS index management\n"
         << "\n"
         << "Usage:\n"
         << "  rag_index ingest --data-file <path> [--config <path>]\n"
         << "  rag_index query --query-file <path> [--top-k <k>] [--config <path>]\n"
         << "  rag_index help\n"
         << "\n"
         << "The data file is a JSON array of {\"text\": ..., \"embedding\": [...]} records.\n"
         << "The query file is a JSON object {\"embedding\": [...]}.\n"
         << "Without --config, " << Config::DEFAULT_CONFIG_FILE
         << " in the working directory is used when present.\n";
}

} // namespace rag_cli
