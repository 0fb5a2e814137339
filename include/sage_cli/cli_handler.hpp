#pragma once

#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "sage_core/services/retrieval_service.hpp"

namespace sage_cli {

enum class Command { Ingest, Ask, List, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string config_path;
  std::string file_path;
  std::string text;
  std::string document_id;
  std::string query;
  bool json_output = false;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(std::shared_ptr<sage_core::RetrievalService> service,
                      std::ostream &out = std::cout,
                      std::ostream &err = std::cerr);

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments. Throws CliError on bad usage.
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Returns the process exit code.
  int execute_command(const CliOptions &options);

  static void print_help(std::ostream &out);

 private:
  std::shared_ptr<sage_core::RetrievalService> service_;
  std::ostream &out_;
  std::ostream &err_;

  // Command handlers
  int handle_ingest_command(const CliOptions &options);
  int handle_ask_command(const CliOptions &options);
  int handle_list_command(const CliOptions &options);

  static std::string read_file(const std::string &path);
  void print_json(const nlohmann::json &response);
  void print_error(const std::string &kind, const std::string &error, bool json_output);
};

}  // namespace sage_cli
