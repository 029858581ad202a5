#include "docqa_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    // Get API base URL from environment variable
    const char *api_base_url = std::getenv("API_BASE_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

    curl_global_init(CURL_GLOBAL_DEFAULT);

    // Create CLI handler
    docqa_cli::CliHandler handler(base_url);

    // Parse command line arguments
    docqa_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    int exit_code = handler.execute_command(options);
    curl_global_cleanup();
    return exit_code;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
