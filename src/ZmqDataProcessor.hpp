#ifndef ZMQDATAPROCESSOR_H
#define ZMQDATAPROCESSOR_H


#pragma once

#include <iostream>
#include <string>
#include <zmqpp/zmqpp.hpp>
#include "DataProcessing.hpp"

// Publishes each delivered chunk on a ZeroMQ PUB socket as a
// two-frame message: [sequence number, payload bytes].
class ZMQDataProcessor : public DataProcessor {
public:
	// Connects to endpoint, e.g. a subscriber or forwarder bound to "tcp://127.0.0.1:5555".
	ZMQDataProcessor(const std::string& endpoint)
		: endpoint(endpoint), publisher(context, zmqpp::socket_type::publish)
	{
		try {
			publisher.connect(endpoint);
			connected = true;
		} catch (const zmqpp::zmq_internal_exception& e) {
			std::cerr << "Failed to connect ZeroMQ publisher socket to " << endpoint << ": " << e.what() << std::endl;
		}
	}

	int processData(uint32_t seq_num, size_t size, const char* buffer) override {
		if (!connected) {
			return -1;
		}
		try {
			zmqpp::message message;
			message << seq_num;
			message.add_raw(buffer, size);
			if (!publisher.send(message)) {
				std::cerr << "ZeroMQ publisher dropped chunk " << seq_num << std::endl;
				return -1;
			}
		} catch (const zmqpp::zmq_internal_exception& e) {
			std::cerr << "Failed to send message: " << e.what() << std::endl;
			return -1;
		}
		published++;
		return static_cast<int>(size);
	}

	bool isConnected() {
		return connected;
	}
	uint32_t publishedCount() {
		return published;
	}

private:
	std::string endpoint;
	zmqpp::context context;
	zmqpp::socket publisher;
	bool connected = false;
	uint32_t published = 0;
};

#endif //ZMQDATAPROCESSOR_H
