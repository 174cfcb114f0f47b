#include "cli/cli.hpp"
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace pasteall {
namespace cli {

namespace {

std::string rest_of_line(std::istringstream& iss) {
  std::string rest;
  std::getline(iss >> std::ws, rest);
  return rest;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(node::Node& node, std::istream& in, std::ostream& out)
  : running_(false)
  , node_(node)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting loop";
  out_ << "pasteall> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "pasteall> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  iss >> command;
  if (command.empty()) {
    return true;
  }

  std::string argument;
  iss >> argument;
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " " << argument;

  if (command == "quit" || command == "exit") {
    return false;
  } else if (command == "help") {
    handle_help_command();
  } else if (command == "devices") {
    handle_devices_command();
  } else if (command == "paired") {
    handle_paired_command();
  } else if (command == "transfers") {
    handle_transfers_command();
  } else if (command == "events") {
    handle_events_command();
  } else if (command == "whoami") {
    handle_whoami_command();
  } else if (argument.empty()) {
    out_ << "Missing argument. Type 'help' for usage" << std::endl;
  } else if (command == "pair") {
    handle_pair_command(argument);
  } else if (command == "accept" || command == "reject") {
    handle_respond_command(argument, command == "accept");
  } else if (command == "unpair") {
    handle_unpair_command(argument);
  } else if (command == "cancel") {
    handle_cancel_command(argument);
  } else if (command == "send") {
    handle_send_command(argument, rest_of_line(iss));
  } else if (command == "text") {
    handle_text_command(argument, rest_of_line(iss));
  } else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_devices_command() {
  node_.refresh_devices();
  const auto devices = node_.get_discovery().get_devices();
  if (devices.empty()) {
    out_ << "No devices discovered yet" << std::endl;
    return;
  }
  for (const auto& device : devices) {
    print_device(device);
  }
}

void CLI::handle_pair_command(const std::string& device_id) {
  const auto device = node_.find_device(device_id);
  if (!device) {
    out_ << "Unknown device: " << device_id << std::endl;
    return;
  }

  out_ << "Pairing with " << device->name << ", confirm the PIN shown in the log on the other device..." << std::endl;
  try {
    const auto paired = node_.get_pairing().request_pairing(*device);
    out_ << "Paired with " << paired.name << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Pairing failed", e.what());
  }
}

void CLI::handle_respond_command(const std::string& device_id, bool accept) {
  if (!node_.respond_to_pairing(device_id, accept)) {
    out_ << "No pending pairing request from " << device_id << std::endl;
    return;
  }
  out_ << (accept ? "Accepted " : "Rejected ") << device_id << std::endl;
}

void CLI::handle_unpair_command(const std::string& device_id) {
  if (node_.get_pairing().unpair(device_id)) {
    out_ << "Unpaired " << device_id << std::endl;
  } else {
    out_ << "Not paired: " << device_id << std::endl;
  }
}

void CLI::handle_paired_command() {
  const auto devices = node_.get_pairing().get_paired_devices();
  if (devices.empty()) {
    out_ << "No paired devices" << std::endl;
    return;
  }
  for (const auto& device : devices) {
    print_device(device);
  }
}

void CLI::handle_send_command(const std::string& device_id, const std::string& path) {
  if (path.empty()) {
    out_ << "Usage: send <device_id> <path>" << std::endl;
    return;
  }
  const auto device = node_.find_device(device_id);
  if (!device) {
    out_ << "Unknown device: " << device_id << std::endl;
    return;
  }

  try {
    const auto id = node_.get_transfer().send_file(*device, path);
    const auto progress = node_.get_transfer().get_progress(id);
    out_ << "Transfer " << id << ": "
         << (progress ? core::transfer_status_to_string(progress->status) : std::string("unknown")) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Sending file failed", e.what());
  }
}

void CLI::handle_text_command(const std::string& device_id, const std::string& text) {
  const auto device = node_.find_device(device_id);
  if (!device) {
    out_ << "Unknown device: " << device_id << std::endl;
    return;
  }

  try {
    node_.get_transfer().send_clipboard(*device, core::TextContent{text});
    out_ << "Clipboard sent" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Sending clipboard failed", e.what());
  }
}

void CLI::handle_transfers_command() {
  const auto transfers = node_.get_transfer().get_transfers();
  if (transfers.empty()) {
    out_ << "No transfers" << std::endl;
    return;
  }
  for (const auto& t : transfers) {
    out_ << "  " << t.id << "  "
         << (t.direction == core::TransferDirection::Outgoing ? "-> " : "<- ") << t.device_id << "  "
         << t.file_name << "  " << t.transferred_bytes << "/" << t.total_bytes << " ("
         << std::fixed << std::setprecision(1) << t.percentage() << "%)  "
         << core::transfer_status_to_string(t.status);
    if (!t.reason.empty()) {
      out_ << ": " << t.reason;
    }
    out_ << std::endl;
  }
}

void CLI::handle_cancel_command(const std::string& transfer_id) {
  if (node_.get_transfer().cancel_transfer(transfer_id)) {
    out_ << "Cancel requested for " << transfer_id << std::endl;
  } else {
    out_ << "No active outgoing transfer " << transfer_id << std::endl;
  }
}

void CLI::handle_events_command() {
  core::Event event;
  std::size_t count = 0;
  while (node_.get_events().consume(event)) {
    print_event(event);
    ++count;
  }
  if (count == 0) {
    out_ << "No new events" << std::endl;
  }
}

void CLI::handle_whoami_command() {
  const auto& local = node_.get_local_device();
  out_ << local.name << " (" << local.id << ")" << std::endl
       << "  public key:  " << local.public_key << std::endl
       << "  pairing:     " << node_.get_pairing().listening_port() << std::endl
       << "  transfer:    " << node_.get_transfer().listening_port() << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                    Display this help message" << std::endl;
  out_ << "  whoami                  Show the local device" << std::endl;
  out_ << "  devices                 List discovered devices" << std::endl;
  out_ << "  pair <id>               Pair with a discovered device" << std::endl;
  out_ << "  accept <id>             Accept a pending pairing request" << std::endl;
  out_ << "  reject <id>             Reject a pending pairing request" << std::endl;
  out_ << "  unpair <id>             Forget a paired device" << std::endl;
  out_ << "  paired                  List paired devices" << std::endl;
  out_ << "  send <id> <path>        Send a file" << std::endl;
  out_ << "  text <id> <text>        Send text as clipboard content" << std::endl;
  out_ << "  transfers               List transfers" << std::endl;
  out_ << "  cancel <transfer_id>    Cancel an outgoing transfer" << std::endl;
  out_ << "  events                  Show events since the last call" << std::endl;
  out_ << "  quit                    Exit the shell" << std::endl << std::endl;
}


//==============================================
// OUTPUT
//==============================================

void CLI::print_device(const core::DeviceInfo& device) {
  out_ << "  " << device.id << "  " << device.name << "  " << device.device_type << "  "
       << device.ip_address.value_or("-") << "  "
       << (device.online ? "online" : "offline") << "  " << device.pairing_status << std::endl;
}

void CLI::print_event(const core::Event& event) {
  struct Printer {
    std::ostream& out;
    void operator()(const core::DeviceDiscoveredEvent& e) const {
      out << "[discovered] " << e.device.name << " (" << e.device.id << ")";
    }
    void operator()(const core::PairingStatusEvent& e) const {
      out << "[pairing] " << e.device_id << " -> " << e.status;
    }
    void operator()(const core::PairingRequestEvent& e) const {
      out << "[pairing request] " << e.device.name << " (" << e.device.id << ") PIN " << e.pin
          << ", answer with accept/reject";
    }
    void operator()(const core::TransferEvent& e) const {
      out << "[transfer] " << e.progress.file_name << " " << e.progress.transferred_bytes << "/"
          << e.progress.total_bytes << " " << e.progress.status;
    }
    void operator()(const core::ClipboardReceivedEvent& e) const {
      out << "[clipboard] from " << e.device_id << ": " << core::describe(e.content);
    }
  };
  std::visit(Printer{out_}, event);
  out_ << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace pasteall
