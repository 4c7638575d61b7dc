#pragma once
#include <deque>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <functional>
#include <vector>
#include <chrono>
#include <algorithm>
#include "NetworkConnection.hpp"

// Upper bound for BLOCK_FOREVER waits so a broken test fails instead of hanging.
const int LOOPBACK_MAX_BLOCK_MS = 10000;

// One direction of an in-memory datagram link.
struct DatagramQueue {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::vector<char>> datagrams;
};

// Shared by a LoopbackConnection pair. Drop filters return true to lose a datagram.
struct LoopbackChannel {
    DatagramQueue to_receiver;
    DatagramQueue to_sender;

    std::mutex record_mutex;
    std::vector<std::vector<char>> sent_by_sender;     // including dropped ones
    std::vector<std::vector<char>> sent_by_receiver;
    std::function<bool(const std::vector<char>&)> drop_to_receiver;
    std::function<bool(const std::vector<char>&)> drop_to_sender;
};

class LoopbackConnection : public NetworkConnection {
public:
    LoopbackConnection(std::shared_ptr<LoopbackChannel> channel, bool sender_side)
        : channel(channel), sender_side(sender_side) {}

    bool open() override {
        return true;
    }

    ssize_t send(const void* packet, size_t len) override {
        const char* bytes = static_cast<const char*>(packet);
        std::vector<char> datagram(bytes, bytes + len);
        bool drop = false;
        {
            std::lock_guard<std::mutex> lock(channel->record_mutex);
            auto& record = sender_side ? channel->sent_by_sender : channel->sent_by_receiver;
            record.push_back(datagram);
            auto& filter = sender_side ? channel->drop_to_receiver : channel->drop_to_sender;
            drop = filter && filter(datagram);
        }
        if (!drop) {
            DatagramQueue& out = sender_side ? channel->to_receiver : channel->to_sender;
            std::lock_guard<std::mutex> lock(out.mutex);
            out.datagrams.push_back(datagram);
            out.cv.notify_one();
        }
        return static_cast<ssize_t>(len);
    }

    RecvResult receive(void* buffer, size_t len, int timeout_ms) override {
        DatagramQueue& in = sender_side ? channel->to_sender : channel->to_receiver;
        std::unique_lock<std::mutex> lock(in.mutex);
        int wait_ms = (timeout_ms == BLOCK_FOREVER) ? LOOPBACK_MAX_BLOCK_MS : timeout_ms;
        bool ready = in.cv.wait_for(lock, std::chrono::milliseconds(wait_ms),
                                    [&in] { return !in.datagrams.empty(); });
        if (!ready) {
            if (timeout_ms == BLOCK_FOREVER) return RecvResult::fatal(ERR_SOCKET);
            return RecvResult::timeout();
        }
        std::vector<char> datagram = in.datagrams.front();
        in.datagrams.pop_front();
        size_t n = std::min(len, datagram.size());
        std::copy(datagram.begin(), datagram.begin() + n, static_cast<char*>(buffer));
        return RecvResult::data(static_cast<ssize_t>(n));
    }

    bool close() override {
        return true;
    }

private:
    std::shared_ptr<LoopbackChannel> channel;
    bool sender_side;
};


// Single-threaded transport that replays a fixed list of receive events and
// records everything sent. An optional hook can react to sends by queueing replies.
struct ConnectionScript {
    struct Event {
        RecvStatus status;
        std::vector<char> bytes;
        ProtocolError error;
    };

    std::deque<Event> incoming;
    std::vector<std::vector<char>> sent;
    std::function<void(const std::vector<char>&, ConnectionScript&)> on_send;
    bool open_result = true;
    bool opened = false;
    int pinned_at = -1;     // number of datagrams sent when pinPeer() was called

    void data(const std::vector<char>& bytes) { incoming.push_back({RECV_DATA, bytes, ERR_NONE}); }
    void timeout() { incoming.push_back({RECV_TIMEOUT, {}, ERR_NONE}); }
    void fatal(ProtocolError error) { incoming.push_back({RECV_FATAL, {}, error}); }
};

class ScriptedConnection : public NetworkConnection {
public:
    ScriptedConnection(std::shared_ptr<ConnectionScript> script) : script(script) {}

    bool open() override {
        script->opened = script->open_result;
        return script->open_result;
    }

    ssize_t send(const void* packet, size_t len) override {
        const char* bytes = static_cast<const char*>(packet);
        std::vector<char> datagram(bytes, bytes + len);
        script->sent.push_back(datagram);
        if (script->on_send) script->on_send(datagram, *script);
        return static_cast<ssize_t>(len);
    }

    // An exhausted script times out, or fails when the caller would block forever.
    RecvResult receive(void* buffer, size_t len, int timeout_ms) override {
        if (script->incoming.empty()) {
            if (timeout_ms == BLOCK_FOREVER) return RecvResult::fatal(ERR_SOCKET);
            return RecvResult::timeout();
        }
        ConnectionScript::Event event = script->incoming.front();
        script->incoming.pop_front();
        if (event.status == RECV_TIMEOUT) return RecvResult::timeout();
        if (event.status == RECV_FATAL) return RecvResult::fatal(event.error);
        size_t n = std::min(len, event.bytes.size());
        std::copy(event.bytes.begin(), event.bytes.begin() + n, static_cast<char*>(buffer));
        return RecvResult::data(static_cast<ssize_t>(n));
    }

    bool close() override {
        script->opened = false;
        return true;
    }

    void pinPeer() override {
        script->pinned_at = static_cast<int>(script->sent.size());
    }

private:
    std::shared_ptr<ConnectionScript> script;
};
