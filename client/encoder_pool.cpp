// ============================================================
// encoder_pool.cpp
// ============================================================

#include "encoder_pool.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <exception>
#include <string>

const char* pool_strategy_str(PoolStrategy s) {
    switch (s) {
        case PoolStrategy::POOLED: return "pooled";
        case PoolStrategy::SHARED: return "shared";
    }
    return "?";
}

void ResourcePool::release(EncodingResource* res) noexcept {
    bool ok = true;
    std::string err;
    try {
        res->reset();
    } catch (const std::exception& e) {
        ok = false;
        err = e.what();
    }
    if (ok) {
        checkin(res);
        return;
    }
    // Log only after the lease has ended; SharedEncoder holds its lock until then
    discard(res);
    LOG_WARN("encoder reset failed, resource dropped: " + err);
}

// ---------------------------------------------------------------
// EncoderPool
// ---------------------------------------------------------------

EncodingResource* EncoderPool::checkout() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!free_.empty()) {
            EncodingResource* res = free_.back();
            free_.pop_back();
            return res;
        }
    }
    // Build outside the lock; deflateInit2 allocates ~256 KB
    auto res = std::make_unique<EncodingResource>(level());
    EncodingResource* raw = res.get();
    std::lock_guard<std::mutex> lk(mutex_);
    all_.push_back(std::move(res));
    free_.reserve(all_.size());
    return raw;
}

void EncoderPool::checkin(EncodingResource* res) {
    std::lock_guard<std::mutex> lk(mutex_);
    free_.push_back(res);
}

void EncoderPool::discard(EncodingResource* res) noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = std::find_if(all_.begin(), all_.end(),
                           [res](const std::unique_ptr<EncodingResource>& p) {
                               return p.get() == res;
                           });
    if (it != all_.end()) all_.erase(it);
}

size_t EncoderPool::created() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return all_.size();
}

size_t EncoderPool::idle() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return free_.size();
}

// ---------------------------------------------------------------
// SharedEncoder
// ---------------------------------------------------------------

EncodingResource* SharedEncoder::checkout() {
    mutex_.lock();
    return res_.get();
}

void SharedEncoder::checkin(EncodingResource* /*res*/) {
    mutex_.unlock();
}

void SharedEncoder::discard(EncodingResource* /*res*/) noexcept {
    std::string err;
    try {
        res_ = std::make_unique<EncodingResource>(level());
    } catch (const std::exception& e) {
        // Keep the old one; its next deflate() reports the broken stream
        err = e.what();
    }
    mutex_.unlock();
    if (!err.empty()) LOG_ERROR("shared encoder rebuild failed: " + err);
}

// ---------------------------------------------------------------

std::unique_ptr<ResourcePool> make_resource_pool(PoolStrategy strategy, int level) {
    switch (strategy) {
        case PoolStrategy::SHARED: return std::make_unique<SharedEncoder>(level);
        case PoolStrategy::POOLED: break;
    }
    return std::make_unique<EncoderPool>(level);
}
