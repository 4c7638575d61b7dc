#pragma once
#include "DataProcessing.hpp"
#include <iostream>

class FileReader : public DataProvider {
// Random access reads over a binary stream.
public:
    FileReader(std::istream& stream) : stream(stream) {}

    int64_t totalSize() override {
        stream.clear();
        std::streamoff current = stream.tellg();
        stream.seekg(0, std::ios::end);
        std::streamoff end = stream.tellg();
        stream.seekg(current < 0 ? 0 : current);
        if (end < 0 || !stream) return -1;
        return static_cast<int64_t>(end);
    }

    int getData(uint64_t offset, size_t size, char* buffer) override {
        int64_t total = totalSize();
        if (total < 0) return -1;
        if (offset >= (uint64_t)total) return 0;

        stream.clear();     // a previous short read leaves eofbit set
        stream.seekg(static_cast<std::streamoff>(offset));
        if (!stream) return -1;
        stream.read(buffer, size);
        if (stream.bad()) return -1;
        return static_cast<int>(stream.gcount());
    }
protected:
    std::istream& stream;
};


class FileWriter : public DataProcessor {
//  Interface for sequentially processing data
public:
    FileWriter(std::ostream& stream) : stream(stream) {}
    int processData(uint32_t seq_num, size_t size, const char* buffer) override {
        (void)seq_num;
        stream.write(buffer, size);
        if (!stream) return -1;
        return static_cast<int>(size);
    };
    bool flush() override {
        stream.flush();
        return static_cast<bool>(stream);
    }
protected:
    std::ostream& stream;
};

// https://stackoverflow.com/questions/11826554/standard-no-op-output-stream
// Stream that doesn't do anything
class NullStream : public std::ostream {
public:
    NullStream() : std::ostream(&noop) {}
private:
    class NullBuffer : public std::streambuf {
    public:
        int overflow(int c) { return c; }
    };
    NullBuffer noop;
};
