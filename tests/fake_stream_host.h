#pragma once

#include "stream_host.h"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rtcdrop {
namespace testing_support {

/**
 * One direction of an in-memory stream
 */
struct PipeBuffer {
    std::mutex mutex;
    std::condition_variable cv;
    std::string data;
    bool closed = false;

    void push(const std::string& bytes) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!closed) {
            data += bytes;
        }
        cv.notify_all();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        cv.notify_all();
    }
};

class PipeStream : public SignalingStream {
public:
    PipeStream(std::shared_ptr<PipeBuffer> in, std::shared_ptr<PipeBuffer> out, const std::string& remote_peer_id)
        : in_(std::move(in)), out_(std::move(out)), remote_peer_id_(remote_peer_id) {}

    ~PipeStream() override { close(); }

    // Two connected ends; stream A's writes are read by stream B and vice versa
    static std::pair<std::unique_ptr<PipeStream>, std::unique_ptr<PipeStream>> create_pair(
            const std::string& peer_a, const std::string& peer_b) {
        auto a_to_b = std::make_shared<PipeBuffer>();
        auto b_to_a = std::make_shared<PipeBuffer>();
        std::unique_ptr<PipeStream> a(new PipeStream(b_to_a, a_to_b, peer_b));
        std::unique_ptr<PipeStream> b(new PipeStream(a_to_b, b_to_a, peer_a));
        return std::make_pair(std::move(a), std::move(b));
    }

    StreamReadStatus read_line(std::string& line, std::string* error = nullptr) override {
        std::unique_lock<std::mutex> lock(in_->mutex);
        auto ready = [this]() { return in_->closed || in_->data.find('\n') != std::string::npos; };
        if (read_timeout_ms_ > 0) {
            if (!in_->cv.wait_for(lock, std::chrono::milliseconds(read_timeout_ms_), ready)) {
                if (error) *error = "read timed out";
                return StreamReadStatus::TIMED_OUT;
            }
        } else {
            in_->cv.wait(lock, ready);
        }

        size_t newline = in_->data.find('\n');
        if (newline != std::string::npos) {
            line = in_->data.substr(0, newline);
            in_->data.erase(0, newline + 1);
            return StreamReadStatus::OK;
        }
        if (!in_->data.empty()) {
            if (error) *error = "stream closed mid-line";
            return StreamReadStatus::ERROR;
        }
        return StreamReadStatus::END_OF_STREAM;
    }

    void set_read_timeout(int timeout_ms) override { read_timeout_ms_ = timeout_ms; }

    bool write(const std::string& data) override {
        pending_ += data;
        return true;
    }

    bool flush() override {
        {
            std::lock_guard<std::mutex> lock(out_->mutex);
            if (out_->closed) {
                return false;
            }
        }
        out_->push(pending_);
        pending_.clear();
        return true;
    }

    void close() override {
        in_->close();
        out_->close();
    }

    std::string remote_peer_id() const override { return remote_peer_id_; }

private:
    std::shared_ptr<PipeBuffer> in_;
    std::shared_ptr<PipeBuffer> out_;
    std::string remote_peer_id_;
    std::string pending_;
    int read_timeout_ms_ = 0;
};

class FakeStreamHost;

/**
 * Registry of fake hosts reachable from each other by peer id
 */
class FakeNetwork {
public:
    void add(FakeStreamHost* host);
    void remove(FakeStreamHost* host);
    FakeStreamHost* find(const std::string& peer_id);

private:
    std::mutex mutex_;
    std::unordered_map<std::string, FakeStreamHost*> hosts_;
};

class FakeStreamHost : public StreamHost {
public:
    FakeStreamHost(FakeNetwork& network, const std::string& peer_id) : network_(network), peer_id_(peer_id) {
        network_.add(this);
    }

    ~FakeStreamHost() override {
        network_.remove(this);
        join();
    }

    std::string local_peer_id() const override { return peer_id_; }

    void set_stream_handler(const std::string& protocol_id, StreamHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[protocol_id] = std::move(handler);
    }

    std::unique_ptr<SignalingStream> open_stream(const std::string& peer_id,
                                                 const std::string& protocol_id) override {
        FakeStreamHost* remote = network_.find(peer_id);
        if (!remote) {
            return nullptr;
        }
        auto ends = PipeStream::create_pair(peer_id_, peer_id);
        if (!remote->dispatch(protocol_id, std::move(ends.second))) {
            return nullptr;
        }
        return std::move(ends.first);
    }

    // Run the handler for an inbound stream on its own thread
    bool dispatch(const std::string& protocol_id, std::unique_ptr<SignalingStream> stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(protocol_id);
        if (it == handlers_.end()) {
            return false;
        }
        StreamHandler handler = it->second;
        threads_.emplace_back([handler](std::unique_ptr<SignalingStream> inbound) {
            handler(std::move(inbound));
        }, std::move(stream));
        return true;
    }

    void join() {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            threads.swap(threads_);
        }
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

private:
    FakeNetwork& network_;
    std::string peer_id_;
    std::mutex mutex_;
    std::unordered_map<std::string, StreamHandler> handlers_;
    std::vector<std::thread> threads_;
};

inline void FakeNetwork::add(FakeStreamHost* host) {
    std::lock_guard<std::mutex> lock(mutex_);
    hosts_[host->local_peer_id()] = host;
}

inline void FakeNetwork::remove(FakeStreamHost* host) {
    std::lock_guard<std::mutex> lock(mutex_);
    hosts_.erase(host->local_peer_id());
}

inline FakeStreamHost* FakeNetwork::find(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hosts_.find(peer_id);
    return it != hosts_.end() ? it->second : nullptr;
}

} // namespace testing_support
} // namespace rtcdrop
