#pragma once

#include <memory>
#include <string>
#include <iostream>
#include "Statistics.hpp"
#include "DataProcessing.hpp"
#include "SlidingWindow.hpp"
#include "NetworkUtils.hpp"
#include "Protocol.hpp"
#include "NetworkConnection.hpp"

// - class StreamSender
//   - Client role. Protocol logic lives here, reading is delegated to the DataProvider
//     and datagrams go through the NetworkConnection.
//   - stream()
//     - handshake(): SYN (with file size) until SYN|ACK, then ACK
//     - transfer(): keep the window full, process cumulative ACKs,
//       retransmit the whole window on every receive timeout
//     - closeConnection(): FIN until FIN|ACK
//   - teardown()
//     - Release the socket, print statistics

enum SenderState {
    SENDER_IDLE,
    SENDER_SYN_SENT,
    SENDER_ESTABLISHED,
    SENDER_CLOSING,
    SENDER_CLOSED
};

class StreamSenderInterface {
public:
    virtual ~StreamSenderInterface() {};
    virtual int stream() = 0;
    virtual int teardown() = 0;
};

template<typename DataProviderType, typename NetworkConnectionType>
class StreamSender : public StreamSenderInterface {
private:
    SlidingWindow<PacketInfo> window;
    TransferStats stats;
    RetryPolicy policy;
    std::ostream& log;

    bool debug = false;
    bool report_stats = false;
    SenderState state = SENDER_IDLE;
    uint32_t next_seq = 1;  // next sequence number to send
    uint32_t window_size;
    uint32_t file_size = 0;

    int handshake();
    int transfer();
    int closeConnection();
    int fillWindow(bool* eof);
    int preparePacket(uint32_t seq_num, PacketInfo** info);
    void sendPacket(PacketInfo* info, bool retransmit);
    void processACK(uint16_t ack_num);
    void retransmitWindow();
    ssize_t sendControl(const char* packet, size_t len);
public:
    StreamSender(
        DataProviderType&& provider, NetworkConnectionType&& conn,
        bool debug, uint32_t window_size=WINDOW_SIZE,
        RetryPolicy policy=RetryPolicy(), std::ostream& log=std::cout
    );
    ~StreamSender();

    int stream() override;
    int teardown() override;

    void enableStatistics(bool enable) { report_stats = enable; }

    SenderState getState() { return state; }
    uint32_t nextSeq() { return next_seq; }
    uint32_t getFileSize() { return file_size; }
    SlidingWindow<PacketInfo>& getWindow() { return window; }
    TransferStats& getStats() { return stats; }

    NetworkConnectionType conn;
    DataProviderType provider;
};

#include "StreamSender_impl.hpp"  // Include template definitions
