#pragma once
#include <vector>
#include <iostream>
#include "DataWindow.hpp"
#include "DataProcessing.hpp"
#include "Statistics.hpp"
#include "Protocol.hpp"
#include "NetworkConnection.hpp"

// - class StreamReceiver
//   - receiveData()
//     - handshake(): wait for SYN, answer SYN|ACK echoing the file size, wait for ACK
//     - receiveLoop(): go-back-N admission. Only expected_seq is stored and ACKed,
//       anything else is dropped without an ACK
//     - FIN is answered with FIN|ACK
//     - deliver(): hand the stored chunks to the DataProcessor in order, report throughput
//   - teardown()

enum ReceiverState {
    RECEIVER_LISTENING,
    RECEIVER_AWAITING_ACK,
    RECEIVER_ESTABLISHED,
    RECEIVER_CLOSED
};

const int32_t NO_DISCARD = -1;

// Small abstraction to allow us to hold a reference to any (templated) StreamReceiver
class StreamReceiverInterface {
public:
    virtual ~StreamReceiverInterface() {};
    virtual int receiveData() = 0;
    virtual int teardown() = 0;
};

template<typename DataProcessorType, typename NetworkConnectionType>
class StreamReceiver : public StreamReceiverInterface {

public:
    StreamReceiver(
        DataProcessorType&& processor, NetworkConnectionType&& conn,
        bool debug, int32_t discard_seq=NO_DISCARD,
        RetryPolicy policy=RetryPolicy(), std::ostream& log=std::cout
    );
    ~StreamReceiver();

    int receiveData() override;
    int teardown() override;

    void enableStatistics(bool enable) { report_stats = enable; }

    ReceiverState getState() { return state; }
    uint32_t expectedSeq() { return expected_seq; }
    uint32_t getFileSize() { return file_size; }
    int32_t discardSeq() { return discard_seq; }
    PacketMap<std::vector<char>>& getReceived() { return received; }
    TransferStats& getStats() { return stats; }

    NetworkConnectionType conn;
    DataProcessorType processor;

protected:
    PacketMap<std::vector<char>> received;
    TransferStats stats;
    RetryPolicy policy;
    std::ostream& log;

    bool debug = false;
    bool report_stats = false;
    ReceiverState state = RECEIVER_LISTENING;
    uint32_t expected_seq = 1;
    uint32_t file_size = 0;
    int32_t discard_seq;

    int handshake();
    int receiveLoop();
    void processPacket(const DecodedPacket& packet);
    void acceptFIN(const DecodedPacket& packet);
    int deliver();
    ssize_t sendControl(uint16_t seq_num, uint16_t ack_num, uint16_t flags);
};

#include "StreamReceiver_impl.hpp"
