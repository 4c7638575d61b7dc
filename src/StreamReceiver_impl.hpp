#pragma once
#include <stdio.h>
#include "StreamReceiver.hpp"
#include "NetworkConnection.hpp"
#include "NetworkUtils.hpp"

template<typename DataProcessorType, typename NetworkConnectionType>
StreamReceiver<DataProcessorType, NetworkConnectionType>::StreamReceiver(
        DataProcessorType&& processor, NetworkConnectionType&& conn, bool debug, int32_t discard_seq,
        RetryPolicy policy, std::ostream& log) :
            conn(std::move(conn)), processor(std::move(processor)),
            stats(false, log), policy(policy), log(log), debug(debug), discard_seq(discard_seq) {
    static_assert(std::is_base_of<DataProcessor, DataProcessorType>::value, "type parameter of this class must derive from DataProcessor");
    static_assert(std::is_base_of<NetworkConnection, NetworkConnectionType>::value, "type parameter of this class must derive from NetworkConnection");
}

template<typename DataProcessorType, typename NetworkConnectionType>
StreamReceiver<DataProcessorType, NetworkConnectionType>::~StreamReceiver() {
    conn.close();
}

template<typename DataProcessorType, typename NetworkConnectionType>
int StreamReceiver<DataProcessorType, NetworkConnectionType>::receiveData() {
    if (!conn.open()) {
        std::cerr << "Failed to open connection" << std::endl;
        state = RECEIVER_CLOSED;
        return -ERR_SOCKET;
    }

    int result = handshake();
    if (result != 0) return result;
    result = receiveLoop();
    if (result != 0) return result;
    return deliver();
}

template<typename DataProcessorType, typename NetworkConnectionType>
int StreamReceiver<DataProcessorType, NetworkConnectionType>::handshake() {
    state = RECEIVER_LISTENING;
    char buffer[MAX_PACKET_SIZE];

    DecodedHandshake syn;
    while (true) {
        RecvResult r = conn.receive(buffer, sizeof(buffer), BLOCK_FOREVER);
        if (r.status == RECV_TIMEOUT) {
            continue;   // interrupted wait
        }
        if (r.status == RECV_FATAL) {
            log << "\nConnection failed: " << protocolErrorString(r.error) << std::endl;
            state = RECEIVER_CLOSED;
            return -r.error;
        }
        ProtocolError err = decodeHandshake(buffer, r.length, &syn);
        if (err != ERR_NONE) {
            if (debug) log << "Ignoring packet while listening: " << protocolErrorString(err) << std::endl;
            stats.record_ignored();
            continue;
        }
        if (syn.flags & FLAG_SYN) {
            break;
        }
        stats.record_ignored();
    }
    log << "\nSYN packet is received" << std::endl;
    conn.pinPeer();
    file_size = syn.file_size;
    if (debug)
        log << "    advertised file size: " << file_size << " bytes" << std::endl;

    char syn_ack[HANDSHAKE_PACKET_SIZE];
    encodeHandshake(syn_ack, 0, syn.seq_num + 1, FLAG_SYN | FLAG_ACK, syn.file_size);
    conn.send(syn_ack, sizeof(syn_ack));
    log << "SYN-ACK packet is sent" << std::endl;
    state = RECEIVER_AWAITING_ACK;

    while (true) {
        RecvResult r = conn.receive(buffer, sizeof(buffer), BLOCK_FOREVER);
        if (r.status == RECV_TIMEOUT) {
            continue;
        }
        if (r.status == RECV_FATAL) {
            log << "\nConnection failed: " << protocolErrorString(r.error) << std::endl;
            state = RECEIVER_CLOSED;
            return -r.error;
        }
        DecodedPacket packet;
        if (decodePacket(buffer, r.length, &packet) != ERR_NONE) {
            stats.record_ignored();
            continue;
        }
        if (packet.flags & FLAG_SYN) {
            // The sender is still retrying, our SYN-ACK was lost.
            if (debug) log << "Duplicate SYN, resending SYN-ACK" << std::endl;
            conn.send(syn_ack, sizeof(syn_ack));
            continue;
        }
        if (packet.flags & FLAG_ACK) {
            break;
        }
        stats.record_ignored();
    }
    log << "ACK packet is received\nConnection established" << std::endl;

    expected_seq = 1;
    received.clear();
    stats.start();
    state = RECEIVER_ESTABLISHED;
    return 0;
}

template<typename DataProcessorType, typename NetworkConnectionType>
int StreamReceiver<DataProcessorType, NetworkConnectionType>::receiveLoop() {
    char buffer[MAX_PACKET_SIZE];
    uint32_t attempts = 0;

    while (state == RECEIVER_ESTABLISHED) {
        RecvResult r = conn.receive(buffer, sizeof(buffer), policy.timeout_ms);
        if (r.status != RECV_DATA) {
            // Nothing to do on a timeout, the sender drives retransmission.
            if (r.status == RECV_FATAL)
                log << timestamp() << " -- receive failed: " << protocolErrorString(r.error) << std::endl;
            stats.record_timeout();
            log << timestamp() << " -- RTO occurred" << std::endl;
            if (policy.exhausted(++attempts)) {
                log << "\nTransfer aborted: sender silent for " << attempts << " timeouts" << std::endl;
                state = RECEIVER_CLOSED;
                return -ERR_RETRIES_EXHAUSTED;
            }
            continue;
        }
        attempts = 0;

        DecodedPacket packet;
        ProtocolError err = decodePacket(buffer, r.length, &packet);
        if (err != ERR_NONE) {
            log << timestamp() << " -- dropping packet: " << protocolErrorString(err) << std::endl;
            stats.record_ignored();
            continue;
        }
        processPacket(packet);
    }
    return 0;
}

template<typename DataProcessorType, typename NetworkConnectionType>
void StreamReceiver<DataProcessorType, NetworkConnectionType>::processPacket(const DecodedPacket& packet) {
    std::string now = timestamp();
    uint32_t seq_num = packet.seq_num;

    if (discard_seq != NO_DISCARD && seq_num == (uint32_t)discard_seq) {
        discard_seq = NO_DISCARD;   // only the first occurrence is dropped
        stats.record_discarded();
        if (debug) log << now << " -- discarding packet " << seq_num << " to simulate loss" << std::endl;
        return;
    }

    if (packet.flags & FLAG_FIN) {
        acceptFIN(packet);
        return;
    }
    if (packet.flags & (FLAG_SYN | FLAG_ACK)) {
        if (debug) log << now << " -- ignoring stray " << flagsToString(packet.flags) << " packet" << std::endl;
        stats.record_ignored();
        return;
    }

    if (seq_num == expected_seq) {
        std::vector<char>* slot = received.reserve(seq_num);
        if (slot == nullptr) {
            std::cerr << "FATAL ERROR: seq " << seq_num << " already stored" << std::endl;
            stats.record_ignored();
            return;
        }
        *slot = packet.payload;
        stats.record_packet(packet.payload.size());
        log << now << " -- packet " << seq_num << " is received" << std::endl;

        sendControl(0, packet.seq_num, FLAG_ACK);
        stats.record_ack();
        log << now << " -- sending ack for the received " << seq_num << std::endl;
        expected_seq++;
    } else {
        // Go-back-N: no ACK, nothing stored, expected_seq unchanged.
        stats.record_out_of_order();
        log << now << " -- out-of-order packet " << seq_num << " is received" << std::endl;
        if (debug) log << "    expected " << expected_seq << std::endl;
    }
}

template<typename DataProcessorType, typename NetworkConnectionType>
void StreamReceiver<DataProcessorType, NetworkConnectionType>::acceptFIN(const DecodedPacket& packet) {
    log << "\nFIN packet is received" << std::endl;
    sendControl(0, packet.seq_num + 1, FLAG_FIN | FLAG_ACK);
    log << "FIN-ACK packet is sent" << std::endl;
    state = RECEIVER_CLOSED;
}

template<typename DataProcessorType, typename NetworkConnectionType>
int StreamReceiver<DataProcessorType, NetworkConnectionType>::deliver() {
    // Ascending order, a missing sequence number just leaves its chunk out.
    bool ok = received.forEach([this](uint32_t seq_num, std::vector<char>* data) {
        return processor.processData(seq_num, data->size(), data->data()) >= 0;
    });
    ok = processor.flush() && ok;

    stats.stop();
    char line[64];
    snprintf(line, sizeof(line), "%.2f", stats.mbps());
    log << "\nThe throughput is " << line << " Mbps\nConnection Closes\n" << std::endl;

    if (!ok) {
        std::cerr << "Failed to write received data" << std::endl;
        return -ERR_FILE;
    }
    return 0;
}

template<typename DataProcessorType, typename NetworkConnectionType>
ssize_t StreamReceiver<DataProcessorType, NetworkConnectionType>::sendControl(
        uint16_t seq_num, uint16_t ack_num, uint16_t flags) {
    char packet[CTRL_PACKET_SIZE];
    encodePacket(packet, seq_num, ack_num, flags);
    ssize_t sent = conn.send(packet, sizeof(packet));
    if (sent < 0 && debug) {
        log << "Sending " << flagsToString(flags) << " failed" << std::endl;
    }
    return sent;
}

template<typename DataProcessorType, typename NetworkConnectionType>
int StreamReceiver<DataProcessorType, NetworkConnectionType>::teardown() {
    conn.close();
    if (report_stats) {
        stats.report();
    }
    return 0;
}
