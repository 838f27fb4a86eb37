// ============================================================
// message_id.cpp
// ============================================================

#include "message_id.hpp"
#include "../common/protocol_io.hpp"

MessageId MessageIdCounter::next_id() {
    u32 count;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        count = ++counter_;
    }
    return proto::make_message_id(tag_, count);
}

u32 MessageIdCounter::last_counter() {
    std::lock_guard<std::mutex> lk(mutex_);
    return counter_;
}
