#pragma once
#include "Statistics.hpp"
#include "Protocol.hpp"
#include "StreamSender.hpp"
#include "NetworkUtils.hpp"
#include <algorithm>
#include <chrono>

template<typename DataProviderType, typename NetworkConnectionType>
StreamSender<DataProviderType, NetworkConnectionType>::StreamSender(
        DataProviderType&& provider, NetworkConnectionType&& conn, bool debug, uint32_t window_size,
        RetryPolicy policy, std::ostream& log)
            : window(window_size), stats(true, log), policy(policy), log(log), debug(debug),
              window_size(window_size), conn(std::move(conn)), provider(std::move(provider)) {
    static_assert(std::is_base_of<DataProvider, DataProviderType>::value, "type parameter of this class must derive from DataProvider");
    static_assert(std::is_base_of<NetworkConnection, NetworkConnectionType>::value, "type parameter of this class must derive from NetworkConnection");
}

template<typename DataProviderType, typename NetworkConnectionType>
StreamSender<DataProviderType, NetworkConnectionType>::~StreamSender() {
    conn.close();
}

template<typename DataProviderType, typename NetworkConnectionType>
int StreamSender<DataProviderType, NetworkConnectionType>::stream() {
    int64_t size = provider.totalSize();
    if (size < 0) {
        std::cerr << "Could not determine the size of the source data" << std::endl;
        state = SENDER_CLOSED;
        return -ERR_FILE;
    }
    if ((uint64_t)size > MAX_FILE_SIZE) {
        std::cerr << "Source is " << size << " bytes, the sequence space allows at most "
                  << MAX_FILE_SIZE << std::endl;
        state = SENDER_CLOSED;
        return -ERR_FILE;
    }
    file_size = static_cast<uint32_t>(size);

    if (!conn.open()) {
        std::cerr << "Failed to open connection" << std::endl;
        state = SENDER_CLOSED;
        return -ERR_SOCKET;
    }

    int result = handshake();
    if (result != 0) return result;
    result = transfer();
    if (result != 0) return result;
    return closeConnection();
}

template<typename DataProviderType, typename NetworkConnectionType>
int StreamSender<DataProviderType, NetworkConnectionType>::handshake() {
    char syn_packet[HANDSHAKE_PACKET_SIZE];
    encodeHandshake(syn_packet, 0, 0, FLAG_SYN, file_size);

    state = SENDER_SYN_SENT;
    sendControl(syn_packet, sizeof(syn_packet));
    log << "\nConnection Establishment Phase:\n\nSYN packet is sent" << std::endl;
    if (debug)
        log << "    advertised file size: " << file_size << " bytes" << std::endl;

    char buffer[MAX_PACKET_SIZE];
    DecodedHandshake syn_ack;
    uint32_t attempts = 0;
    while (true) {
        RecvResult r = conn.receive(buffer, sizeof(buffer), policy.timeout_ms);
        if (r.status == RECV_TIMEOUT) {
            stats.record_timeout();
            if (policy.exhausted(++attempts)) {
                log << "\nConnection failed: no SYN-ACK after " << attempts << " attempts" << std::endl;
                state = SENDER_CLOSED;
                return -ERR_RETRIES_EXHAUSTED;
            }
            sendControl(syn_packet, sizeof(syn_packet));
            log << "Resending SYN packet" << std::endl;
            continue;
        }
        if (r.status == RECV_FATAL) {
            // Reset or socket fault while connecting is not retried.
            log << "\nConnection failed: " << protocolErrorString(r.error) << std::endl;
            state = SENDER_CLOSED;
            return -r.error;
        }

        ProtocolError err = decodeHandshake(buffer, r.length, &syn_ack);
        if (err != ERR_NONE) {
            if (debug) log << "Ignoring packet while waiting for SYN-ACK: " << protocolErrorString(err) << std::endl;
            stats.record_ignored();
            continue;
        }
        if (hasFlags(syn_ack.flags, FLAG_SYN | FLAG_ACK)) {
            break;
        }
        if (debug) log << "Ignoring " << flagsToString(syn_ack.flags) << " packet while waiting for SYN-ACK" << std::endl;
        stats.record_ignored();
    }
    log << "SYN-ACK packet is received" << std::endl;

    char ack_packet[CTRL_PACKET_SIZE];
    encodePacket(ack_packet, 1, syn_ack.seq_num + 1, FLAG_ACK);
    sendControl(ack_packet, sizeof(ack_packet));
    state = SENDER_ESTABLISHED;
    log << "ACK packet is sent\nConnection established\n\nData Transfer:\n" << std::endl;
    return 0;
}

template<typename DataProviderType, typename NetworkConnectionType>
int StreamSender<DataProviderType, NetworkConnectionType>::transfer() {
    stats.start();
    bool eof = false;
    int result = fillWindow(&eof);
    if (result != 0) return result;

    char buffer[MAX_PACKET_SIZE];
    uint32_t attempts = 0;
    while (!(eof && window.isEmpty())) {
        RecvResult r = conn.receive(buffer, sizeof(buffer), policy.timeout_ms);
        if (r.status != RECV_DATA) {
            // Transport faults during the transfer are handled like a lost ACK.
            if (r.status == RECV_FATAL)
                log << timestamp() << " -- receive failed: " << protocolErrorString(r.error) << std::endl;
            stats.record_timeout();
            if (policy.exhausted(++attempts)) {
                log << "\nTransfer aborted: no ACK after " << attempts << " timeouts" << std::endl;
                state = SENDER_CLOSED;
                return -ERR_RETRIES_EXHAUSTED;
            }
            log << timestamp() << " -- RTO occurred" << std::endl;
            retransmitWindow();
            continue;
        }

        DecodedPacket packet;
        ProtocolError err = decodePacket(buffer, r.length, &packet);
        if (err != ERR_NONE) {
            if (debug) log << "Ignoring packet: " << protocolErrorString(err) << std::endl;
            stats.record_ignored();
            continue;
        }
        attempts = 0;

        // Only pure ACKs move the window; a late SYN|ACK carries ack_num 1 as well.
        if ((packet.flags & FLAG_MASK) != FLAG_ACK) {
            if (debug) log << "Ignoring " << flagsToString(packet.flags) << " packet during transfer" << std::endl;
            stats.record_ignored();
            continue;
        }
        processACK(packet.ack_num);
        result = fillWindow(&eof);
        if (result != 0) return result;
    }
    stats.stop();
    log << "DATA Finished" << std::endl;
    return 0;
}

template<typename DataProviderType, typename NetworkConnectionType>
int StreamSender<DataProviderType, NetworkConnectionType>::fillWindow(bool* eof) {
    while (!*eof && !window.isFull()) {
        PacketInfo* info = nullptr;
        int result = preparePacket(next_seq, &info);
        if (result != 0) return result;
        if (info == nullptr) {
            *eof = true;    // No data left, done streaming!
            break;
        }
        sendPacket(info, false);
        next_seq++;
    }
    return 0;
}

template<typename DataProviderType, typename NetworkConnectionType>
int StreamSender<DataProviderType, NetworkConnectionType>::preparePacket(uint32_t seq_num, PacketInfo** info) {
    *info = nullptr;
    if (seq_num > MAX_DATA_PACKETS) {
        return 0;
    }

    char data[PAYLOAD_SIZE];
    uint64_t offset = (uint64_t)(seq_num - 1) * PAYLOAD_SIZE;
    int size = provider.getData(offset, PAYLOAD_SIZE, data);
    if (size < 0) {
        std::cerr << "Failed to read source data at offset " << offset << std::endl;
        state = SENDER_CLOSED;
        return -ERR_FILE;
    }
    if (size == 0) {
        return 0;
    }

    PacketInfo* slot = window.reserve(seq_num);
    if (slot == nullptr) {
        std::cerr << "FATAL ERROR: window refused seq " << seq_num << " base=" << window.base() << std::endl;
        state = SENDER_CLOSED;
        return -ERR_SOCKET;
    }
    slot->data_size = size;
    encodePacket(reinterpret_cast<char*>(&slot->packet), seq_num, 0, FLAG_NONE, data, size);
    *info = slot;
    return 0;
}

template<typename DataProviderType, typename NetworkConnectionType>
void StreamSender<DataProviderType, NetworkConnectionType>::sendPacket(PacketInfo* info, bool retransmit) {
    ssize_t sent = conn.send(&info->packet, info->packet_size());
    info->last_sent = std::chrono::system_clock::now();
    uint16_t seq_num = ntohs(info->packet.header.seq_num);

    if (retransmit) {
        stats.record_retransmission();
        log << formatTimestamp(info->last_sent) << " -- retransmitting packet with seq = " << seq_num << std::endl;
    } else {
        stats.record_packet(info->data_size);
        log << formatTimestamp(info->last_sent) << " -- packet with seq = " << seq_num
            << " is sent, sliding window = " << window.toString() << std::endl;
    }
    if (sent < 0) {
        std::cerr << "Sending packet " << seq_num << " failed, waiting for timeout" << std::endl;
    } else if (debug) {
        log << "    Len: " << sent << std::endl;
    }
}

template<typename DataProviderType, typename NetworkConnectionType>
void StreamSender<DataProviderType, NetworkConnectionType>::processACK(uint16_t ack_num) {
    stats.record_ack();
    log << timestamp() << " -- ACK for packet = " << ack_num << " is received" << std::endl;

    if (ack_num < window.base()) {
        if (debug) log << "    stale ACK, base is " << window.base() << std::endl;
        stats.record_ignored();
        return;
    }
    // Never acknowledge past what has been sent.
    uint32_t highest_sent = next_seq - 1;
    size_t removed = window.advanceTo(std::min<uint32_t>(ack_num, highest_sent));
    if (debug)
        log << "    released " << removed << ", sliding window = " << window.toString() << std::endl;
}

template<typename DataProviderType, typename NetworkConnectionType>
void StreamSender<DataProviderType, NetworkConnectionType>::retransmitWindow() {
    window.forEach([this](uint32_t seq_num, PacketInfo* info) {
        (void)seq_num;
        sendPacket(info, true);
        return true;
    });
}

template<typename DataProviderType, typename NetworkConnectionType>
int StreamSender<DataProviderType, NetworkConnectionType>::closeConnection() {
    char fin_packet[CTRL_PACKET_SIZE];
    encodePacket(fin_packet, next_seq, 0, FLAG_FIN);

    state = SENDER_CLOSING;
    sendControl(fin_packet, sizeof(fin_packet));
    log << "\n\nConnection Teardown:\n\nFIN packet is sent" << std::endl;

    char buffer[MAX_PACKET_SIZE];
    uint32_t attempts = 0;
    while (true) {
        RecvResult r = conn.receive(buffer, sizeof(buffer), policy.timeout_ms);
        if (r.status != RECV_DATA) {
            stats.record_timeout();
            if (policy.exhausted(++attempts)) {
                log << "\nTeardown aborted: no FIN-ACK after " << attempts << " attempts" << std::endl;
                state = SENDER_CLOSED;
                return -ERR_RETRIES_EXHAUSTED;
            }
            sendControl(fin_packet, sizeof(fin_packet));
            if (debug) log << "Resending FIN packet" << std::endl;
            continue;
        }

        DecodedPacket packet;
        if (decodePacket(buffer, r.length, &packet) == ERR_NONE
                && hasFlags(packet.flags, FLAG_FIN | FLAG_ACK)) {
            break;
        }
        stats.record_ignored();
    }
    log << "FIN-ACK packet is received" << std::endl;
    state = SENDER_CLOSED;
    log << "Connection Closes\n" << std::endl;
    return 0;
}

template<typename DataProviderType, typename NetworkConnectionType>
ssize_t StreamSender<DataProviderType, NetworkConnectionType>::sendControl(const char* packet, size_t len) {
    ssize_t sent = conn.send(packet, len);
    if (sent < 0 && debug) {
        log << "Sending control packet failed, waiting for timeout" << std::endl;
    }
    return sent;
}

template<typename DataProviderType, typename NetworkConnectionType>
int StreamSender<DataProviderType, NetworkConnectionType>::teardown() {
    conn.close();
    if (report_stats) {
        stats.report();
    }
    return 0;
}
