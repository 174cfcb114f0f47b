#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <variant>
#include "core/clipboard.hpp"
#include "core/types.hpp"

namespace pasteall {
namespace core {

struct DeviceDiscoveredEvent {
    DeviceInfo device;
};

struct PairingStatusEvent {
    std::string device_id;
    PairingStatus status;
};

// A peer asked to pair; pin is what the peer will expect to see echoed
struct PairingRequestEvent {
    DeviceInfo device;
    std::string pin;
};

struct TransferEvent {
    TransferProgress progress;
};

struct ClipboardReceivedEvent {
    std::string device_id;
    ClipboardContent content;
};

using Event = std::variant<DeviceDiscoveredEvent,
                           PairingStatusEvent,
                           PairingRequestEvent,
                           TransferEvent,
                           ClipboardReceivedEvent>;

std::string event_name(const Event& event);

// Bounded multi-producer queue of events drained by the application.
// When full the oldest event is discarded.
class EventChannel {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 1024;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit EventChannel(std::size_t capacity = DEFAULT_CAPACITY);
    ~EventChannel() = default;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds an event to the back of the queue; false if an older event had to be dropped
    bool produce(Event event);
    // Retrieves and removes the next event without blocking
    bool consume(Event& event);
    // Waits up to timeout for the next event
    bool wait_consume(Event& event, std::chrono::milliseconds timeout);


    // ---- QUERY METHODS ----
    bool empty() const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    // Number of events discarded because the channel was full
    std::size_t dropped() const;

private:
    // ---- PARAMETERS ----
    const std::size_t capacity_;
    std::size_t dropped_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
};

} // namespace core
} // namespace pasteall
