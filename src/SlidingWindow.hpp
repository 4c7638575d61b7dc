#pragma once
#include <stdlib.h>
#include <string>
#include <sstream>
#include "DataWindow.hpp"

// Bounded set of in-flight packets keyed by sequence number.
// Members are always >= base(), the lowest unacknowledged sequence number,
// and only leave through advanceTo() (cumulative acknowledgment).
template <typename PacketType>
class SlidingWindow : public DataWindow<PacketType> {
public:
    SlidingWindow(size_t window_size, uint32_t base_seq=1) : window_size(window_size), base_seq(base_seq) {};
    ~SlidingWindow() {};

    PacketType* reserve(uint32_t seq_num) override {
        if (isFull() || seq_num < base_seq || contains(seq_num)) return nullptr;
        return &arr[seq_num];
    };

    bool contains(uint32_t seq_num) override {
        return arr.count(seq_num) != 0;
    };

    PacketType* get(uint32_t seq_num) override {
        auto it = arr.find(seq_num);
        if (it == arr.end()) return nullptr;
        return &it->second;
    };

    // Individual removal is refused, the window only shrinks cumulatively.
    bool erase(uint32_t seq_num) override {
        (void)seq_num;
        return false;
    }

    // Cumulative acknowledgment: drops every member <= seq_num.
    // Returns the number of packets removed.
    size_t advanceTo(uint32_t seq_num) {
        if (seq_num < base_seq) return 0;   // cannot advance backwards.
        size_t removed = 0;
        auto it = arr.begin();
        while (it != arr.end() && it->first <= seq_num) {
            it = arr.erase(it);
            removed++;
        }
        base_seq = seq_num + 1;
        return removed;
    };

    bool forEach(const std::function<bool(uint32_t, PacketType*)>& callback) override {
        for (auto& item : arr) {
            if (!callback(item.first, &item.second)) {
                return false;
            }
        }
        return true;
    }

    bool isFull() {
        return arr.size() >= window_size;
    }
    bool isEmpty() override {
        return arr.empty();
    }
    size_t size() override {
        return arr.size();
    }
    uint32_t base() {
        return base_seq;
    }

    void clear() override {
        arr.clear();
    }

    // "{3, 4, 5}" for log lines
    std::string toString() {
        std::ostringstream out;
        out << "{";
        bool first = true;
        for (auto& item : arr) {
            if (!first) out << ", ";
            out << item.first;
            first = false;
        }
        out << "}";
        return out.str();
    }

protected:
    size_t window_size;
    uint32_t base_seq;
    std::map<uint32_t, PacketType> arr;
};
