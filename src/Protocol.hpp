#pragma once

#include <stdint.h>
#include <vector>
#include <string>
#include <cstring>
#include <arpa/inet.h>
#include <sys/types.h>


const int HEADER_SIZE          = 6;      // seq_num, ack_num, flags
const int PAYLOAD_SIZE         = 994;    // bytes of payload in DATA packets
const int MAX_PACKET_SIZE      = HEADER_SIZE + PAYLOAD_SIZE;
const int FILE_SIZE_FIELD_SIZE = 4;
const int HANDSHAKE_PACKET_SIZE = HEADER_SIZE + FILE_SIZE_FIELD_SIZE;
const int CTRL_PACKET_SIZE     = HEADER_SIZE;   // control packets contain only header

const int WINDOW_SIZE          = 3;      // default sliding window size
const int TIMEOUT_MS           = 500;    // fixed receive timeout (ms)

const int DEFAULT_PORT         = 8088;
const int MIN_PORT             = 1024;
const int MAX_PORT             = 65535;
constexpr char DEFAULT_IP[]          = "127.0.0.1";
constexpr char DEFAULT_OUTPUT_FILE[] = "received_file";

// Data packets use 1..MAX_DATA_PACKETS, the FIN takes the next number.
const uint32_t MAX_DATA_PACKETS = 65534;
const uint64_t MAX_FILE_SIZE    = (uint64_t)MAX_DATA_PACKETS * PAYLOAD_SIZE;

// --- Control flag definitions (bitfield) ---
enum ControlFlag : uint16_t {
    FLAG_NONE = 0x0,
    FLAG_SYN  = 0x1,
    FLAG_ACK  = 0x2,
    FLAG_FIN  = 0x4
};
const uint16_t FLAG_MASK = FLAG_SYN | FLAG_ACK | FLAG_FIN;

// --- Status codes returned by codec, transport and engines ---
enum ProtocolError {
    ERR_NONE                 = 0,
    ERR_MALFORMED_HEADER     = 1,   // fewer than HEADER_SIZE bytes
    ERR_INCOMPLETE_FILE_SIZE = 2,   // handshake without its 4-byte size field
    ERR_CONNECTION_RESET     = 3,
    ERR_SOCKET               = 4,
    ERR_RETRIES_EXHAUSTED    = 5,
    ERR_FILE                 = 6
};

inline const char* protocolErrorString(int err) {
    switch (err < 0 ? -err : err) {
        case ERR_NONE:                 return "no error";
        case ERR_MALFORMED_HEADER:     return "malformed header";
        case ERR_INCOMPLETE_FILE_SIZE: return "incomplete file size data";
        case ERR_CONNECTION_RESET:     return "connection reset by peer";
        case ERR_SOCKET:               return "socket error";
        case ERR_RETRIES_EXHAUSTED:    return "retry limit reached";
        case ERR_FILE:                 return "file error";
    }
    return "unknown error";
}

// --- Retry policy ---
// max_attempts counts consecutive timeouts tolerated while waiting for the peer.
const uint32_t UNLIMITED_ATTEMPTS = 0;

struct RetryPolicy {
    int timeout_ms = TIMEOUT_MS;
    uint32_t max_attempts = UNLIMITED_ATTEMPTS;

    bool exhausted(uint32_t attempts) const {
        return max_attempts != UNLIMITED_ATTEMPTS && attempts >= max_attempts;
    }
};

// --- Packed packet layouts ---
#pragma pack(push, 1)
struct PacketHeader {
    uint16_t seq_num;      // sequence number (network order)
    uint16_t ack_num;      // acknowledgment number (network order)
    uint16_t flags;        // SYN/ACK/FIN bits (network order)
};
#pragma pack(pop)

#pragma pack(push, 1)
struct Packet {
    PacketHeader header;
    char data[PAYLOAD_SIZE];
};
#pragma pack(pop)

#pragma pack(push, 1)
struct HandshakePacket {
    PacketHeader header;
    uint32_t file_size;    // network order
};
#pragma pack(pop)

static_assert(sizeof(PacketHeader) == HEADER_SIZE, "PacketHeader must be 6 bytes on the wire");
static_assert(sizeof(Packet) == MAX_PACKET_SIZE, "Packet must be 1000 bytes on the wire");
static_assert(sizeof(HandshakePacket) == HANDSHAKE_PACKET_SIZE, "HandshakePacket must be 10 bytes on the wire");

struct DecodedPacket {
    uint16_t seq_num = 0;
    uint16_t ack_num = 0;
    uint16_t flags = FLAG_NONE;
    std::vector<char> payload;
};

struct DecodedHandshake {
    uint16_t seq_num = 0;
    uint16_t ack_num = 0;
    uint16_t flags = FLAG_NONE;
    uint32_t file_size = 0;
};

inline bool hasFlags(uint16_t flags, uint16_t required) {
    return (flags & required) == required;
}

inline std::string flagsToString(uint16_t flags) {
    std::string out;
    if (flags & FLAG_SYN) out += "SYN";
    if (flags & FLAG_ACK) out += out.empty() ? "ACK" : "|ACK";
    if (flags & FLAG_FIN) out += out.empty() ? "FIN" : "|FIN";
    return out.empty() ? "DATA" : out;
}

inline void writeHeader(char* buffer, uint16_t seq_num, uint16_t ack_num, uint16_t flags) {
    PacketHeader header;
    header.seq_num = htons(seq_num);
    header.ack_num = htons(ack_num);
    header.flags   = htons(flags);
    std::memcpy(buffer, &header, HEADER_SIZE);
}

inline void readHeader(const char* buffer, uint16_t* seq_num, uint16_t* ack_num, uint16_t* flags) {
    PacketHeader header;
    std::memcpy(&header, buffer, HEADER_SIZE);
    *seq_num = ntohs(header.seq_num);
    *ack_num = ntohs(header.ack_num);
    *flags   = ntohs(header.flags);
}

// Writes header + payload into buffer, which must hold HEADER_SIZE + payload_size bytes.
// Returns the encoded length. The payload length is not checked here.
inline size_t encodePacket(char* buffer, uint16_t seq_num, uint16_t ack_num, uint16_t flags,
                           const char* payload = nullptr, size_t payload_size = 0) {
    writeHeader(buffer, seq_num, ack_num, flags);
    if (payload_size > 0) {
        std::memcpy(buffer + HEADER_SIZE, payload, payload_size);
    }
    return HEADER_SIZE + payload_size;
}

inline std::vector<char> encodePacket(uint16_t seq_num, uint16_t ack_num, uint16_t flags,
                                      const std::vector<char>& payload = std::vector<char>()) {
    std::vector<char> bytes(HEADER_SIZE + payload.size());
    encodePacket(bytes.data(), seq_num, ack_num, flags, payload.data(), payload.size());
    return bytes;
}

inline ProtocolError decodePacket(const void* buffer, ssize_t length, DecodedPacket* out) {
    if (length < HEADER_SIZE) {
        return ERR_MALFORMED_HEADER;
    }
    const char* bytes = static_cast<const char*>(buffer);
    readHeader(bytes, &out->seq_num, &out->ack_num, &out->flags);
    out->payload.assign(bytes + HEADER_SIZE, bytes + length);
    return ERR_NONE;
}

inline size_t encodeHandshake(char* buffer, uint16_t seq_num, uint16_t ack_num, uint16_t flags,
                              uint32_t file_size) {
    writeHeader(buffer, seq_num, ack_num, flags);
    uint32_t net_file_size = htonl(file_size);
    std::memcpy(buffer + HEADER_SIZE, &net_file_size, FILE_SIZE_FIELD_SIZE);
    return HANDSHAKE_PACKET_SIZE;
}

inline std::vector<char> encodeHandshake(uint16_t seq_num, uint16_t ack_num, uint16_t flags,
                                         uint32_t file_size) {
    std::vector<char> bytes(HANDSHAKE_PACKET_SIZE);
    encodeHandshake(bytes.data(), seq_num, ack_num, flags, file_size);
    return bytes;
}

inline ProtocolError decodeHandshake(const void* buffer, ssize_t length, DecodedHandshake* out) {
    if (length < HEADER_SIZE) {
        return ERR_MALFORMED_HEADER;
    }
    if (length < HANDSHAKE_PACKET_SIZE) {
        return ERR_INCOMPLETE_FILE_SIZE;
    }
    const char* bytes = static_cast<const char*>(buffer);
    readHeader(bytes, &out->seq_num, &out->ack_num, &out->flags);
    uint32_t net_file_size;
    std::memcpy(&net_file_size, bytes + HEADER_SIZE, FILE_SIZE_FIELD_SIZE);
    out->file_size = ntohl(net_file_size);
    return ERR_NONE;
}
