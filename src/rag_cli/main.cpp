#include "rag_cli/cli_handler.hpp"
#include <iostream>

int main(int argc, char *argv[])
{
  try
  {
    rag_cli::CliOptions options = rag_cli::CliHandler::parse_arguments(argc, argv);

    rag_cli::Config config = rag_cli::CliHandler::load_config(options);

    rag_cli::CliHandler handler(config);

    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
