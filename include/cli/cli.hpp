#pragma once

#include <iostream>
#include <string>
#include "core/event_channel.hpp"
#include "node/node.hpp"

namespace pasteall {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(node::Node& node, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    // Reads commands until quit or end of input
    void run();
    // Executes one command line, false when it asked to quit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    node::Node& node_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void handle_devices_command();
    void handle_pair_command(const std::string& device_id);
    void handle_respond_command(const std::string& device_id, bool accept);
    void handle_unpair_command(const std::string& device_id);
    void handle_paired_command();
    void handle_send_command(const std::string& device_id, const std::string& path);
    void handle_text_command(const std::string& device_id, const std::string& text);
    void handle_transfers_command();
    void handle_cancel_command(const std::string& transfer_id);
    void handle_events_command();
    void handle_whoami_command();
    void handle_help_command();

    void print_device(const core::DeviceInfo& device);
    void print_event(const core::Event& event);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace pasteall
