#pragma once
#include <string>
#include <vector>
#include "Protocol.hpp"

// Datagram builders and inspectors shared by the engine tests.
namespace packets {

inline std::vector<char> syn(uint32_t file_size) {
    return encodeHandshake(0, 0, FLAG_SYN, file_size);
}

inline std::vector<char> synAck(uint32_t file_size) {
    return encodeHandshake(0, 1, FLAG_SYN | FLAG_ACK, file_size);
}

inline std::vector<char> handshakeAck() {
    return encodePacket(1, 1, FLAG_ACK);
}

inline std::vector<char> ack(uint16_t ack_num) {
    return encodePacket(0, ack_num, FLAG_ACK);
}

inline std::vector<char> data(uint16_t seq_num, const std::string& payload) {
    return encodePacket(seq_num, 0, FLAG_NONE, std::vector<char>(payload.begin(), payload.end()));
}

inline std::vector<char> fin(uint16_t seq_num) {
    return encodePacket(seq_num, 0, FLAG_FIN);
}

inline std::vector<char> finAck(uint16_t ack_num) {
    return encodePacket(0, ack_num, FLAG_FIN | FLAG_ACK);
}

inline DecodedPacket decode(const std::vector<char>& bytes) {
    DecodedPacket packet;
    decodePacket(bytes.data(), bytes.size(), &packet);
    return packet;
}

inline bool isData(const std::vector<char>& bytes) {
    return bytes.size() >= (size_t)HEADER_SIZE && (decode(bytes).flags & FLAG_MASK) == FLAG_NONE;
}

inline bool isPureAck(const std::vector<char>& bytes) {
    return bytes.size() >= (size_t)HEADER_SIZE && (decode(bytes).flags & FLAG_MASK) == FLAG_ACK;
}

// Sequence numbers of the data packets in a send log.
inline std::vector<uint16_t> dataSeqs(const std::vector<std::vector<char>>& sent) {
    std::vector<uint16_t> seqs;
    for (const auto& bytes : sent) {
        if (isData(bytes)) seqs.push_back(decode(bytes).seq_num);
    }
    return seqs;
}

// ack_num of every pure ACK in a send log.
inline std::vector<uint16_t> ackNums(const std::vector<std::vector<char>>& sent) {
    std::vector<uint16_t> acks;
    for (const auto& bytes : sent) {
        if (isPureAck(bytes)) acks.push_back(decode(bytes).ack_num);
    }
    return acks;
}

// Deterministic file contents that differ from chunk to chunk.
inline std::string pattern(size_t size) {
    std::string out(size, '\0');
    for (size_t i = 0; i < size; i++) {
        out[i] = static_cast<char>('A' + (i * 7 + i / PAYLOAD_SIZE) % 26);
    }
    return out;
}

}  // namespace packets
