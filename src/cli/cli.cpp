#include "cli/cli.hpp"
#include "crypto/hasher.hpp"
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace nebula {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(node::Node& node, std::istream& input, std::ostream& output)
  : node_(node)
  , input_(input)
  , output_(output)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting command loop";
  output_ << "nebula> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "nebula> " << std::flush;
    }
  }

  running_ = false;
  BOOST_LOG_TRIVIAL(info) << "CLI: Command loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  std::vector<std::string> args;

  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "put" && args.size() == 1) {
    handle_put_command(args[0]);
  }
  else if (command == "get" && args.size() == 2) {
    handle_get_command(args[0], args[1]);
  }
  else if (command == "ls" && args.size() <= 1) {
    handle_list_command(args.empty() ? "" : args[0]);
  }
  else if (command == "stats" && args.empty()) {
    handle_stats_command();
  }
  else if (command == "chunks" && args.empty()) {
    handle_chunks_command();
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments. Type 'help' for usage." << std::endl;
  }
}

void CLI::handle_put_command(const std::string& path) {
  try {
    registry::FileId id = node_.put_file(path);
    output_ << "Stored " << path << " as " << registry::id_to_string(id)
            << " (short id " << registry::short_id(id) << ")" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e);
  }
}

void CLI::handle_get_command(const std::string& id_or_prefix, const std::string& destination) {
  try {
    registry::FileRecord record = node_.get_file(id_or_prefix, destination);
    output_ << "Retrieved " << record.filename << " (" << record.total_size << " bytes) to "
            << destination << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error retrieving file", e);
  }
}

void CLI::handle_list_command(const std::string& filter) {
  try {
    auto records = node_.list_files(filter);
    if (records.empty()) {
      output_ << "No files stored" << std::endl;
      return;
    }
    for (const auto& record : records) {
      output_ << "  " << registry::short_id(record.id) << "  "
              << std::setw(12) << record.total_size << "  "
              << std::setw(6) << record.chunks.size() << " chunks  "
              << record.filename << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing files", e);
  }
}

void CLI::handle_stats_command() {
  try {
    node::NodeStats stats = node_.stats();
    // Formatted apart so output_ keeps its own precision and flags
    std::ostringstream savings;
    savings << std::fixed << std::setprecision(2) << stats.dedup_ratio * 100.0;

    output_ << "Total files: " << stats.total_files << '\n'
            << "Total file size: " << stats.total_file_bytes << " bytes\n"
            << "Total chunks: " << stats.chunk_count << '\n'
            << "Total chunk size: " << stats.total_unique_chunk_bytes << " bytes\n"
            << "Deduplication savings: " << savings.str() << " %" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading stats", e);
  }
}

void CLI::handle_chunks_command() {
  try {
    auto chunks = node_.root().chunk_store().list_chunks();
    for (const auto& chunk : chunks) {
      output_ << "  " << crypto::Hasher::short_hex(chunk.digest) << "  " << chunk.size << " bytes" << std::endl;
    }
    output_ << chunks.size() << " chunks" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error listing chunks", e);
  }
}

void CLI::handle_help_command() {
  output_ << "Commands:\n"
          << "  put <path>                  store a file\n"
          << "  get <id-or-prefix> <dest>   retrieve a file\n"
          << "  ls [filter]                 list stored files\n"
          << "  stats                       storage and deduplication summary\n"
          << "  chunks                      list stored chunks\n"
          << "  quit                        leave the shell" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::exception& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error.what();
  output_ << message << ": " << error.what() << std::endl;
}

} // namespace cli
} // namespace nebula
