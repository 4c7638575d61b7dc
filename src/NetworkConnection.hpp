// Abstraction for the datagram transport (UDP socket or an in-memory test channel)
#pragma once
#include <stdio.h>
#include <sys/types.h>
#include "Protocol.hpp"

const int BLOCK_FOREVER = -1;   // timeout_ms value for an unbounded receive

enum RecvStatus {
    RECV_DATA,      // length bytes were written to the buffer
    RECV_TIMEOUT,   // nothing arrived within timeout_ms
    RECV_FATAL      // transport fault, see error
};

struct RecvResult {
    RecvStatus status;
    ssize_t length;
    ProtocolError error;

    static RecvResult data(ssize_t length) { return {RECV_DATA, length, ERR_NONE}; }
    static RecvResult timeout() { return {RECV_TIMEOUT, 0, ERR_NONE}; }
    static RecvResult fatal(ProtocolError error) { return {RECV_FATAL, -1, error}; }
};

class NetworkConnection {
public:
    virtual ~NetworkConnection() {}
    virtual bool open() = 0;
    virtual ssize_t send(const void* packet, size_t len) = 0;
    virtual RecvResult receive(void* buffer, size_t len, int timeout_ms) = 0;
    virtual bool close() = 0;
    // Send only to the peer of the most recent datagram from now on, until close().
    virtual void pinPeer() {}
};
