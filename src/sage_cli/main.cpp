#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "sage_cli/cli_handler.hpp"
#include "sage_core/config.hpp"
#include "sage_core/services/service_builder.hpp"

namespace {

// --config wins, then SAGE_CONFIG, then ./sagerc.json if present; otherwise built-in defaults.
sage_core::Config load_config(const sage_cli::CliOptions &options) {
  std::string path = options.config_path;
  if (path.empty()) {
    const char *env_path = std::getenv("SAGE_CONFIG");
    if (env_path) {
      path = env_path;
    } else if (std::filesystem::exists("sagerc.json")) {
      path = "sagerc.json";
    }
  }
  if (path.empty()) {
    return sage_core::Config::from_json(nlohmann::json::object());
  }
  return sage_core::Config::from_file(path);
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    sage_cli::CliOptions options = sage_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == sage_cli::Command::Help) {
      sage_cli::CliHandler::print_help(std::cout);
      return 0;
    }

    sage_core::Config config = load_config(options);
    std::shared_ptr<sage_core::RetrievalService> service =
        sage_core::build_retrieval_service(config);
    service->initialize();

    sage_cli::CliHandler handler(service);
    return handler.execute_command(options);
  } catch (const sage_cli::CliError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    sage_cli::CliHandler::print_help(std::cerr);
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
