#pragma once

// ============================================================
// message_id.hpp -- Per-client GELF message id generator
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <mutex>

// Issues ids of the form  instance_tag(4) || le32(counter).
// The counter is pre-incremented, so the first id carries 1, and it
// wraps to 0 after 2^32 - 1 without error: a client that outlives 2^32
// messages can repeat an id.
class MessageIdCounter {
public:
    explicit MessageIdCounter(const InstanceTag& tag, u32 start = 0)
        : tag_(tag), counter_(start) {}

    MessageIdCounter(const MessageIdCounter&) = delete;
    MessageIdCounter& operator=(const MessageIdCounter&) = delete;

    // Thread-safe. Only the increment runs under the lock.
    MessageId next_id();

    const InstanceTag& instance_tag() const { return tag_; }

    // Value carried by the most recently issued id
    u32 last_counter();

private:
    const InstanceTag tag_;
    std::mutex        mutex_;
    u32               counter_;
};
