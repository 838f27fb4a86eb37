#pragma once

// ============================================================
// encoder_pool.hpp -- Reusable compression resources
//
// An EncodingResource is a gzip stream bound to its own accumulator.
// A write leases one from a ResourcePool; when the Lease goes out of
// scope (normally or by exception) the resource is reset -- buffer
// drained, compressor rebound to the empty buffer -- and only then
// made available to the next writer.
//
// Two strategies:
//   EncoderPool   -- free list; every concurrent writer gets its own
//                    resource, created on first demand and kept.
//   SharedEncoder -- one resource behind a mutex held for the whole
//                    lease; writers are serialised.
// ============================================================

#include "../common/platform.hpp"
#include "../common/byte_buffer.hpp"
#include "../common/compress.hpp"
#include "../common/protocol.hpp"
#include <memory>
#include <mutex>
#include <vector>

class EncodingResource {
public:
    explicit EncodingResource(int level)
        : zip_(buf_, level) {
        packet_.reserve(GELF_MTU_SIZE);
    }

    EncodingResource(const EncodingResource&) = delete;
    EncodingResource& operator=(const EncodingResource&) = delete;

    gzip::GzipWriter& zip() { return zip_; }
    ByteBuffer& buffer() { return buf_; }
    // Scratch datagram, reused for every chunk
    std::vector<u8>& packet() { return packet_; }

    // Drain the accumulator and point the compressor at it again.
    void reset() {
        buf_.clear();
        zip_.reset(buf_);
    }

private:
    ByteBuffer           buf_;   // must be declared before zip_
    gzip::GzipWriter zip_;
    std::vector<u8>      packet_;
};

enum class PoolStrategy {
    POOLED,   // EncoderPool
    SHARED,   // SharedEncoder
};

const char* pool_strategy_str(PoolStrategy s);

class ResourcePool {
public:
    virtual ~ResourcePool() = default;

    // RAII lease for a checked-out resource
    class Lease {
    public:
        Lease(ResourcePool& pool, EncodingResource* res) : pool_(&pool), res_(res) {}
        ~Lease() { if (res_) pool_->release(res_); }

        Lease(Lease&& other) noexcept
            : pool_(other.pool_), res_(other.res_) {
            other.res_ = nullptr;
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        EncodingResource& resource() { return *res_; }
        EncodingResource* operator->() { return res_; }

    private:
        ResourcePool*     pool_;
        EncodingResource* res_;
    };

    // May block (SharedEncoder) until a resource is free
    Lease acquire() { return Lease(*this, checkout()); }

    // Number of resources owned by the pool
    virtual size_t created() const = 0;

    int level() const { return level_; }

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

protected:
    explicit ResourcePool(int level) : level_(level) {}

    virtual EncodingResource* checkout() = 0;
    virtual void checkin(EncodingResource* res) = 0;
    // Drop a resource that could not be reset; must also end the lease
    virtual void discard(EncodingResource* res) noexcept = 0;

private:
    // Reset, then hand back. A resource whose reset fails is not reused.
    void release(EncodingResource* res) noexcept;

    int level_;
};

class EncoderPool : public ResourcePool {
public:
    explicit EncoderPool(int level) : ResourcePool(level) {}

    size_t created() const override;

    // Resources currently sitting in the free list
    size_t idle() const;

protected:
    EncodingResource* checkout() override;
    void checkin(EncodingResource* res) override;
    void discard(EncodingResource* res) noexcept override;

private:
    mutable std::mutex                             mutex_;
    std::vector<std::unique_ptr<EncodingResource>> all_;
    std::vector<EncodingResource*>                 free_;
};

class SharedEncoder : public ResourcePool {
public:
    explicit SharedEncoder(int level)
        : ResourcePool(level), res_(std::make_unique<EncodingResource>(level)) {}

    size_t created() const override { return 1; }

protected:
    EncodingResource* checkout() override;
    void checkin(EncodingResource* res) override;
    void discard(EncodingResource* res) noexcept override;

private:
    std::mutex                        mutex_;  // held for the whole lease
    std::unique_ptr<EncodingResource> res_;
};

std::unique_ptr<ResourcePool> make_resource_pool(PoolStrategy strategy, int level);
