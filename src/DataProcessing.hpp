#pragma once
#include <unistd.h>
#include <stdint.h>
#include <chrono>
#include <vector>
#include <type_traits>
#include "Protocol.hpp"

// --- Structure to track unacknowledged packets ---
struct PacketInfo {
    Packet packet;
    size_t data_size = 0;
    std::chrono::system_clock::time_point last_sent;

    inline size_t packet_size() {
        return data_size + sizeof(packet.header);
    }
};

class DataProvider {
// Interface to read data by offset, so chunks can be re-read for retransmission.
public:
    virtual ~DataProvider() {}
    // Total number of bytes available, -1 if it cannot be determined.
    virtual int64_t totalSize() = 0;
    // Returns bytes read, 0 past the end, -1 on error.
    virtual int getData(uint64_t offset, size_t size, char* buffer) = 0;
};

class DataProcessor {
//  Interface for sequentially processing data
public:
    virtual ~DataProcessor() {}
    virtual int processData(uint32_t seq_num, size_t size, const char* buffer) = 0;
    virtual bool flush() { return true; }
};

// Fans each chunk out to several processors owned elsewhere.
class TeeProcessor : public DataProcessor {
public:
    TeeProcessor(std::vector<DataProcessor*> processors) : processors(processors) {}

    int processData(uint32_t seq_num, size_t size, const char* buffer) override {
        int result = static_cast<int>(size);
        for (DataProcessor* processor : processors) {
            if (processor->processData(seq_num, size, buffer) < 0) {
                result = -1;
            }
        }
        return result;
    }

    bool flush() override {
        bool ok = true;
        for (DataProcessor* processor : processors) {
            ok = processor->flush() && ok;
        }
        return ok;
    }

private:
    std::vector<DataProcessor*> processors;
};
