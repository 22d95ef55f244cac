#pragma once

#include <iostream>
#include <memory>
#include <string>

#include "rag_cli/config.hpp"
#include "rag_core/db/index_store.hpp"
#include "rag_core/services/ingest_service.hpp"
#include "rag_core/services/query_service.hpp"

namespace rag_cli
{

  enum class Command
  {
    Ingest,
    Query,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string data_file;
    std::string query_file;
    std::string config_path;
    int top_k = 0; // 0 means use the configured default
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
    // Query results go to out, diagnostics to err
    explicit CliHandler(const Config &config, std::ostream &out = std::cout,
                        std::ostream &err = std::cerr);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Resolve --config, then rag_index.json in the working directory, then defaults
    static Config load_config(const CliOptions &options);

    // Execute command
    void execute_command(const CliOptions &options);

  private:
    Config config_;
    std::ostream &out_;
    std::ostream &err_;
    std::shared_ptr<rag_core::IndexStore> index_store_;

    // Command handlers
    void handle_ingest_command(const CliOptions &options);
    void handle_query_command(const CliOptions &options);
    void handle_help_command();
  };

}
