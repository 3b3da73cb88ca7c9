#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "node/node.hpp"

namespace nebula {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(node::Node& node, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();
    // Runs a single command line, returns false if it asked to quit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    node::Node& node_;
    std::istream& input_;
    std::ostream& output_;
    bool running_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_put_command(const std::string& path);
    void handle_get_command(const std::string& id_or_prefix, const std::string& destination);
    void handle_list_command(const std::string& filter);
    void handle_stats_command();
    void handle_chunks_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::exception& error);
};

} // namespace cli
} // namespace nebula
