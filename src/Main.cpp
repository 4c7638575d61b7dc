#include <memory>
#include <fstream>
#include <vector>
#include <string>
#include <cstdlib>
#include "StreamSender.hpp"
#include "StreamReceiver.hpp"
#include "FileData.hpp"
#include "UDPNetworkConnection.hpp"
#include "ZmqDataProcessor.hpp"
#include "Options.hpp"

std::unique_ptr<StreamSenderInterface> senderFactory(const Options& opts, std::istream& istream) {
    auto sender = new StreamSender<FileReader, UDPStreamSender>(
        FileReader(istream), UDPStreamSender(opts.port, opts.ip), opts.debug, opts.windowsize
    );
    sender->enableStatistics(opts.stats);
    return std::unique_ptr<StreamSenderInterface>(sender);
}

// With no extra sinks the file is written directly, otherwise every chunk goes to all sinks.
std::unique_ptr<StreamReceiverInterface> receiverFactory(const Options& opts, std::ostream& ostream,
                                                         std::vector<DataProcessor*> sinks) {
    std::unique_ptr<StreamReceiverInterface> ptr;

    if (sinks.empty()) {
        auto receiver = new StreamReceiver<FileWriter, UDPStreamReceiver>(
            FileWriter(ostream), UDPStreamReceiver(opts.port, opts.ip), opts.debug, opts.discard
        );
        receiver->enableStatistics(opts.stats);
        ptr.reset(receiver);
    } else {
        auto receiver = new StreamReceiver<TeeProcessor, UDPStreamReceiver>(
            TeeProcessor(sinks), UDPStreamReceiver(opts.port, opts.ip), opts.debug, opts.discard
        );
        receiver->enableStatistics(opts.stats);
        ptr.reset(receiver);
    }
    return ptr;
}

int main(int argc, char* argv[]) {
    Options opts;
    if (parseArgs(argc, argv, &opts) != 0) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (opts.client) {
        // Fail before any network activity if the file is unusable.
        std::ifstream fstream(opts.filename, std::ios::binary);
        if (!fstream.is_open()) {
            std::cerr << "Cannot open file " << opts.filename << std::endl;
            return EXIT_FAILURE;
        }
        auto sender = senderFactory(opts, fstream);
        int result = sender->stream();
        sender->teardown();
        if (result != 0) {
            std::cerr << "Transfer failed: " << protocolErrorString(result) << std::endl;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (opts.discard != NO_DISCARD && opts.debug) {
        std::cout << "Will discard the first packet with seq = " << opts.discard << std::endl;
    }

    std::ofstream fstream(opts.output, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!fstream.is_open()) {
        std::cerr << "Cannot open output file " << opts.output << std::endl;
        return EXIT_FAILURE;
    }

    FileWriter writer(fstream);
    std::unique_ptr<ZMQDataProcessor> publisher;
    std::vector<DataProcessor*> sinks;
    if (!opts.publish.empty()) {
        publisher.reset(new ZMQDataProcessor(opts.publish));
        if (!publisher->isConnected()) {
            return EXIT_FAILURE;
        }
        sinks = {&writer, publisher.get()};
    }

    auto receiver = receiverFactory(opts, fstream, sinks);
    int result = receiver->receiveData();
    receiver->teardown();
    if (result != 0) {
        std::cerr << "Transfer failed: " << protocolErrorString(result) << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
