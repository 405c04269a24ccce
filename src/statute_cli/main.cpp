#include <cstdlib>
#include <iostream>

#include "statute_cli/cli_handler.hpp"

int main(int argc, char *argv[])
{
  statute_cli::CliOptions options;
  try
  {
    options = statute_cli::CliHandler::parse_arguments(argc, argv);
  }
  catch (const statute_cli::CliError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    std::cerr << "Run 'statute_cli help' for usage." << std::endl;
    return 2;
  }

  const char *api_base_url = std::getenv("API_BASE_URL");
  const std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

  try
  {
    statute_cli::CliHandler handler(base_url);
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
