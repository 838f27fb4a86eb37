#pragma once

// ============================================================
// writer_pool.hpp -- Fixed set of workers fanning writes into
//   one shared Writer
//
// Callers hand a line to the pool; one of `capacity` worker threads
// picks it up from the shared queue, stages it in its own LineBuffer,
// flushes it into the target and answers through the request's
// future. Exceptions thrown by the target travel through the future.
// A write that succeeds reports every byte the caller handed over, not
// the target's own count (GelfClient's excludes trimmed whitespace).
//
//   WriterPool pool(4, gelf_client);
//   auto f = pool.submit(line.data(), line.size());
//   size_t n = f.get();
//
// Thread safety: submit()/write() from any thread; the target must
// tolerate concurrent write() calls.
// ============================================================

#include "../common/platform.hpp"
#include "../common/writer.hpp"
#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <future>
#include <stdexcept>

// Per-worker staging buffer in front of a Writer.
class LineBuffer {
public:
    explicit LineBuffer(Writer& target, size_t capacity = 4096)
        : target_(&target) {
        buf_.reserve(capacity);
    }

    void append(const void* data, size_t len) {
        const u8* p = static_cast<const u8*>(data);
        buf_.insert(buf_.end(), p, p + len);
    }

    // Hand everything staged to the target in one write(); returns the
    // number of bytes staged
    size_t flush() {
        if (buf_.empty()) return 0;
        size_t n = buf_.size();
        target_->write(buf_.data(), n);
        buf_.clear();
        return n;
    }

    // Drop staged bytes and (re)target; the allocation is kept
    void reset(Writer& target) {
        buf_.clear();
        target_ = &target;
    }

    size_t size() const { return buf_.size(); }

private:
    Writer*         target_;
    std::vector<u8> buf_;
};

class WriterPool : public Writer {
public:
    WriterPool(size_t capacity, Writer& target) : target_(target), stop_(false) {
        if (capacity == 0) capacity = 1;
        workers_.reserve(capacity);
        for (size_t i = 0; i < capacity; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~WriterPool() override { close(); }

    WriterPool(const WriterPool&) = delete;
    WriterPool& operator=(const WriterPool&) = delete;

    // Queue one write; the future yields `len` once the target accepted it
    std::future<size_t> submit(const void* data, size_t len) {
        WriteRequest req;
        const u8* p = static_cast<const u8*>(data);
        req.data.assign(p, p + len);
        std::future<size_t> res = req.result.get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("WriterPool is closed");
            requests_.push(std::move(req));
        }
        cv_.notify_one();
        return res;
    }

    using Writer::write;

    // Blocking: submit and wait for the answer
    size_t write(const void* data, size_t len) override {
        return submit(data, len).get();
    }

    // Finish queued requests and join the workers. Idempotent.
    void close() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    size_t size() const { return workers_.size(); }

private:
    struct WriteRequest {
        std::vector<u8>     data;
        std::promise<size_t> result;
    };

    void worker_loop() {
        LineBuffer buf(target_);
        for (;;) {
            WriteRequest req;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !requests_.empty(); });
                if (stop_ && requests_.empty()) return;
                req = std::move(requests_.front());
                requests_.pop();
            }
            try {
                buf.append(req.data.data(), req.data.size());
                req.result.set_value(buf.flush());
            } catch (...) {
                req.result.set_exception(std::current_exception());
            }
            buf.reset(target_);
        }
    }

    Writer&                  target_;
    std::vector<std::thread> workers_;
    std::queue<WriteRequest> requests_;
    std::mutex               mutex_;
    std::condition_variable  cv_;
    bool                     stop_;
};
