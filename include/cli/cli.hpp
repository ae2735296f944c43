#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "node/local_network.hpp"

namespace xornet {
namespace cli {

// Interactive shell over a local network; uploads and downloads go through node 0
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(node::LocalNetwork& network, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();
    // Runs one shell line; returns false once the shell should stop
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    node::LocalNetwork& network_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_upload_command(const std::string& filename, bool publish);
    void handle_download_command(const std::string& map_file, const std::string& out_file);
    void handle_fetch_command(const std::string& address_hex, const std::string& out_file);
    void handle_peers_command();
    void handle_online_command(const std::string& index, bool online);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace xornet
