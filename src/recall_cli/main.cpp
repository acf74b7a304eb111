#include <curl/curl.h>

#include <filesystem>
#include <iostream>

#include "recall_cli/cli_handler.hpp"
#include "recall_cli/config.hpp"

int main(int argc, char *argv[]) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;
  try {
    recall_cli::CliOptions options = recall_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == recall_cli::Command::Help) {
      recall_cli::CliHandler::print_help();
    } else {
      // A missing default config file means "use the defaults"
      recall_cli::AppConfig config =
          std::filesystem::exists(options.config_path) || options.config_path != "graph_recall.json"
              ? recall_cli::AppConfig::from_file(options.config_path)
              : recall_cli::AppConfig::from_json(nlohmann::json::object());

      recall_cli::CliHandler handler(config);
      handler.execute_command(options);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }
  curl_global_cleanup();
  return exit_code;
}
