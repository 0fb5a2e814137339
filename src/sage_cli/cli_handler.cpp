#include "sage_cli/cli_handler.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace sage_cli {

namespace {

// Reads "--flag value" pairs; a flag without a value is a usage error.
std::string flag_value(int argc, char *argv[], int &i, const std::string &flag) {
  if (i + 1 >= argc) {
    throw CliError("Missing value for " + flag);
  }
  return argv[++i];
}

std::string format_time(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

}  // namespace

CliHandler::CliHandler(std::shared_ptr<sage_core::RetrievalService> service,
                       std::ostream &out,
                       std::ostream &err)
    : service_(std::move(service)), out_(out), err_(err) {
  if (!service_) {
    throw CliError("CliHandler requires a retrieval service");
  }
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;
  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
  } else if (command == "ask" || command == "a") {
    options.command = Command::Ask;
  } else if (command == "list" || command == "l") {
    options.command = Command::List;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--config" || flag == "-c") {
      options.config_path = flag_value(argc, argv, i, flag);
    } else if (flag == "--json") {
      options.json_output = true;
    } else if (options.command == Command::Ingest && (flag == "--file" || flag == "-f")) {
      options.file_path = flag_value(argc, argv, i, flag);
    } else if (options.command == Command::Ingest && (flag == "--text" || flag == "-t")) {
      options.text = flag_value(argc, argv, i, flag);
    } else if (options.command == Command::Ingest && flag == "--id") {
      options.document_id = flag_value(argc, argv, i, flag);
    } else if (options.command == Command::Ask && (flag == "--query" || flag == "-q")) {
      options.query = flag_value(argc, argv, i, flag);
    } else {
      throw CliError("Unknown option for " + command + ": " + flag);
    }
  }

  if (options.command == Command::Ingest) {
    if (options.file_path.empty() == options.text.empty()) {
      throw CliError("Ingest command requires exactly one of --file or --text. "
                     "Usage: ingest --file <path> [--id <document_id>]");
    }
  }
  if (options.command == Command::Ask && options.query.empty()) {
    throw CliError("Ask command requires a query. Usage: ask --query <question>");
  }
  return options;
}

int CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Ingest:
      return handle_ingest_command(options);
    case Command::Ask:
      return handle_ask_command(options);
    case Command::List:
      return handle_list_command(options);
    case Command::Help:
      print_help(out_);
      return 0;
  }
  return 1;
}

std::string CliHandler::read_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw CliError("Failed to open file: " + path);
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

int CliHandler::handle_ingest_command(const CliOptions &options) {
  std::string text = options.file_path.empty() ? options.text : read_file(options.file_path);

  sage_core::IngestResult result = options.document_id.empty()
                                       ? service_->ingest_document(text)
                                       : service_->ingest_document(options.document_id, text);
  if (!result.success) {
    print_error(sage_core::to_string(*result.error_kind), result.error_message,
                options.json_output);
    return 1;
  }

  if (options.json_output) {
    print_json({{"success", true},
                {"document_id", result.document_id},
                {"chunk_count", result.chunk_count}});
  } else {
    out_ << "Ingested document " << result.document_id << " (" << result.chunk_count
         << " chunks)" << std::endl;
  }
  return 0;
}

int CliHandler::handle_ask_command(const CliOptions &options) {
  sage_core::AnswerResult result = service_->answer_query(options.query);
  if (!result.success) {
    print_error(sage_core::to_string(*result.error_kind), result.error_message,
                options.json_output);
    return 1;
  }

  const auto &answer = result.answer;
  if (options.json_output) {
    nlohmann::json sources = nlohmann::json::array();
    for (const auto &source : answer.sources) {
      sources.push_back({{"document_id", source.document_id}, {"snippet", source.snippet}});
    }
    print_json({{"success", true}, {"answer", answer.text}, {"sources", sources}});
    return 0;
  }

  out_ << answer.text << std::endl;
  if (!answer.sources.empty()) {
    out_ << std::endl << "Sources:" << std::endl;
    for (size_t i = 0; i < answer.sources.size(); ++i) {
      const auto &source = answer.sources[i];
      out_ << "  [" << (i + 1) << "] " << source.document_id << ": " << source.snippet
           << std::endl;
    }
  }
  return 0;
}

int CliHandler::handle_list_command(const CliOptions &options) {
  auto documents = service_->list_documents();
  auto stats = service_->stats();

  if (options.json_output) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto &document : documents) {
      items.push_back({{"document_id", document.document_id},
                       {"content_hash", document.content_hash},
                       {"chunk_count", document.chunk_count},
                       {"created_at", format_time(document.created_at)}});
    }
    print_json({{"documents", items},
                {"chunk_count", stats.vector_count},
                {"dimension", stats.dimension}});
    return 0;
  }

  if (documents.empty()) {
    out_ << "No documents ingested yet." << std::endl;
    return 0;
  }
  out_ << std::left << std::setw(34) << "DOCUMENT" << std::setw(8) << "CHUNKS"
       << "CREATED (UTC)" << std::endl;
  for (const auto &document : documents) {
    out_ << std::left << std::setw(34) << document.document_id << std::setw(8)
         << document.chunk_count << format_time(document.created_at) << std::endl;
  }
  out_ << documents.size() << " documents, " << stats.vector_count << " chunks" << std::endl;
  return 0;
}

void CliHandler::print_json(const nlohmann::json &response) {
  out_ << response.dump(2) << std::endl;
}

void CliHandler::print_error(const std::string &kind, const std::string &error, bool json_output) {
  if (json_output) {
    print_json({{"success", false}, {"error_kind", kind}, {"error", error}});
    return;
  }
  err_ << "Error (" << kind << "): " << error << std::endl;
}

void CliHandler::print_help(std::ostream &out) {
  out << "sage - answer questions from your own documents\n\n"
      << "Usage: sage <command> [options]\n\n"
      << "Commands:\n"
      << "  ingest, i   Add a document: --file <path> | --text <text> [--id <document_id>]\n"
      << "  ask, a      Answer a question: --query <question>\n"
      << "  list, l     List ingested documents\n"
      << "  help, h     Show this message\n\n"
      << "Options:\n"
      << "  --config, -c <path>   Configuration file (default: $SAGE_CONFIG or ./sagerc.json)\n"
      << "  --json                Print machine-readable JSON\n";
}

}  // namespace sage_cli
