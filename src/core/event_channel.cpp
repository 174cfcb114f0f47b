#include "core/event_channel.hpp"
#include <boost/log/trivial.hpp>

namespace pasteall {
namespace core {

namespace {

struct EventNamer {
  std::string operator()(const DeviceDiscoveredEvent&) const { return "device_discovered"; }
  std::string operator()(const PairingStatusEvent&) const { return "pairing_status"; }
  std::string operator()(const PairingRequestEvent&) const { return "pairing_request"; }
  std::string operator()(const TransferEvent&) const { return "transfer"; }
  std::string operator()(const ClipboardReceivedEvent&) const { return "clipboard_received"; }
};

} // namespace

std::string event_name(const Event& event) {
  return std::visit(EventNamer{}, event);
}

EventChannel::EventChannel(std::size_t capacity)
  : capacity_(capacity == 0 ? 1 : capacity) {
}

bool EventChannel::produce(Event event) {
  bool kept_all = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
      kept_all = false;
    }
    queue_.push_back(std::move(event));
    BOOST_LOG_TRIVIAL(trace) << "Event channel: Added event. Channel size: " << queue_.size();
  }
  cv_.notify_one();

  if (!kept_all) {
    BOOST_LOG_TRIVIAL(warning) << "Event channel: Channel full, dropped oldest event";
  }
  return kept_all;
}

bool EventChannel::consume(Event& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return false;
  }

  event = std::move(queue_.front());
  queue_.pop_front();
  BOOST_LOG_TRIVIAL(trace) << "Event channel: Retrieved event. Channel size: " << queue_.size();
  return true;
}

bool EventChannel::wait_consume(Event& event, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty(); })) {
    return false;
  }

  event = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

bool EventChannel::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

std::size_t EventChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::size_t EventChannel::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

} // namespace core
} // namespace pasteall
