#pragma once
#include <chrono>
#include <stdint.h>
#include <stdio.h>
#include <iostream>
#include <string>

// Megabits per second, 0 when no time has elapsed.
inline double throughputMbps(uint64_t bytes, double seconds) {
    if (seconds <= 0) return 0;
    return (bytes * 8.0 / 1e6) / seconds;
}

class TransferStats {
public:
    TransferStats(bool sender=true, std::ostream& stream=std::cout) : stream(stream) {
        senderText = sender ? "sent" : "received";
        reset();
    };
    ~TransferStats() = default;

    void reset() {
        data_bytes = 0;
        data_packets = 0;
        acks = 0;
        retransmissions = 0;
        timeouts = 0;
        out_of_order = 0;
        discarded = 0;
        ignored = 0;
        start_time = std::chrono::steady_clock::now();
        stop_time = start_time;
    }
    void start() {
        start_time = std::chrono::steady_clock::now();
        stop_time = start_time;
    }
    void stop() {
        stop_time = std::chrono::steady_clock::now();
    }
    void record_packet(uint32_t bytes) {
        data_packets++;
        data_bytes += bytes;
    }
    void record_ack() {
        acks++;
    }
    void record_retransmission() {
        retransmissions++;
    }
    void record_timeout() {
        timeouts++;
    }
    void record_out_of_order() {
        out_of_order++;
    }
    void record_discarded() {
        discarded++;
    }
    void record_ignored() {
        ignored++;
    }

    double elapsedSeconds() {
        return std::chrono::duration<double>(stop_time - start_time).count();
    }
    double mbps() {
        return throughputMbps(data_bytes, elapsedSeconds());
    }

    void report() {
        stream << "[STATISTICS] Throughput: " << mbps() << " Mbps, "
               << "Packets " << senderText << ": " << data_packets
               << " Bytes: " << data_bytes
               << " ACKS: " << acks
               << " Retransmissions: " << retransmissions
               << " Timeouts: " << timeouts
               << " Out-of-order: " << out_of_order
               << " Discarded: " << discarded
               << " Ignored: " << ignored
               << std::endl;
    }

    uint64_t data_bytes;
    uint32_t data_packets;
    uint32_t acks;
    uint32_t retransmissions;
    uint32_t timeouts;
    uint32_t out_of_order;
    uint32_t discarded;
    uint32_t ignored;

private:
    std::string senderText = "";
    std::ostream& stream;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point stop_time;
};
