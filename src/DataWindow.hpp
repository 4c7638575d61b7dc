#pragma once
#include <stdint.h>
#include <stddef.h>
#include <map>
#include <functional>

template <typename DataType>
class DataWindow {
public:
    virtual ~DataWindow() {}

    // Returns nullptr if seq_num cannot be stored.
    virtual DataType* reserve(uint32_t seq_num) = 0;

    // API to access elements by sequence number
    virtual bool contains(uint32_t seq_num) = 0;
    virtual DataType* get(uint32_t seq_num) = 0;
    virtual bool erase(uint32_t seq_num) = 0;

    // Visits elements in ascending sequence order, stops early when the callback returns false.
    virtual bool forEach(const std::function<bool(uint32_t, DataType*)>& callback) = 0;

    virtual bool isEmpty() = 0;
    virtual size_t size() = 0;
    virtual void clear() = 0;
};


// Unbounded store where every sequence number is admitted at most once.
template <typename DataType>
class PacketMap: public DataWindow<DataType> {
protected:
    std::map<uint32_t, DataType> packetmap;
public:
    PacketMap() {};
    ~PacketMap() {};

    DataType* reserve(uint32_t seq_num) override {
        auto result = packetmap.insert(std::make_pair(seq_num, DataType()));
        if (!result.second) {
            return nullptr;     // already admitted
        }
        return &result.first->second;
    };

    bool contains(uint32_t seq_num) override {
        return packetmap.count(seq_num) != 0;
    };

    DataType* get(uint32_t seq_num) override {
        auto it = packetmap.find(seq_num);
        if (it == packetmap.end()) {
            return nullptr;
        }
        return &it->second;
    };

    bool erase(uint32_t seq_num) override {
        return packetmap.erase(seq_num) != 0;
    };

    bool forEach(const std::function<bool(uint32_t, DataType*)>& callback) override {
        for (auto& item : packetmap) {
            if (!callback(item.first, &item.second)) {
                return false;
            }
        }
        return true;
    }

    size_t size() override {
        return packetmap.size();
    }

    bool isEmpty() override {
        return packetmap.empty();
    };

    void clear() override {
        packetmap.clear();
    }
};
