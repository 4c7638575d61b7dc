#pragma once
#include <iostream>
#include <string>
#include <cstdlib>
#include <climits>
#include "Protocol.hpp"
#include "NetworkUtils.hpp"
#include "StreamReceiver.hpp"

struct Options {
    bool server = false;
    bool client = false;
    std::string ip = DEFAULT_IP;
    int port = DEFAULT_PORT;
    std::string filename = "";
    int windowsize = WINDOW_SIZE;
    int32_t discard = NO_DISCARD;
    std::string output = DEFAULT_OUTPUT_FILE;
    std::string publish = "";
    bool debug = false;
    bool stats = false;
};

inline void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " (-s | -c) [-i ip] [-p port] [-f file] [-w window] [-d seq]\n"
              << "          [-o output] [--publish endpoint] [--debug] [--statistics]\n"
              << "  -s, --server        receive a file\n"
              << "  -c, --client        send a file\n"
              << "  -i, --ip <addr>     server address, dotted decimal (default " << DEFAULT_IP << ")\n"
              << "  -p, --port <n>      server port in [" << MIN_PORT << ", " << MAX_PORT << "] (default " << DEFAULT_PORT << ")\n"
              << "  -f, --file <path>   file to transfer (client)\n"
              << "  -w, --window <n>    sliding window size (default " << WINDOW_SIZE << ")\n"
              << "  -d, --discard <seq> drop the first packet with this seq once (server)\n"
              << "  -o, --output <path> where the server writes the file (default " << DEFAULT_OUTPUT_FILE << ")\n"
              << "  --publish <ep>      also publish received chunks on a ZeroMQ endpoint (server)\n"
              << "  --debug             per-packet detail in the log\n"
              << "  --statistics        print transfer counters when done\n"
              << std::endl;
}

inline bool parseInt(const std::string& text, int* value) {
    char* end = nullptr;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
        return false;
    }
    *value = static_cast<int>(parsed);
    return true;
}

// Returns 0 on success, 1 on a usage error.
inline int parseArgs(int argc, char* argv[], Options* opts) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool takes_value = (arg == "-i" || arg == "--ip" || arg == "-p" || arg == "--port"
                            || arg == "-f" || arg == "--file" || arg == "-w" || arg == "--window"
                            || arg == "-d" || arg == "--discard" || arg == "-o" || arg == "--output"
                            || arg == "--publish");
        if (takes_value && i + 1 >= argc) {
            std::cerr << arg << " requires a value" << std::endl;
            return 1;
        }

        if (arg == "-s" || arg == "--server") {
            opts->server = true;
        } else if (arg == "-c" || arg == "--client") {
            opts->client = true;
        } else if (arg == "--debug") {
            opts->debug = true;
        } else if (arg == "--statistics") {
            opts->stats = true;
        } else if (arg == "-i" || arg == "--ip") {
            opts->ip = argv[++i];
        } else if (arg == "-p" || arg == "--port") {
            if (!parseInt(argv[++i], &opts->port)) {
                std::cerr << "Port must be an integer" << std::endl;
                return 1;
            }
        } else if (arg == "-f" || arg == "--file") {
            opts->filename = argv[++i];
        } else if (arg == "-w" || arg == "--window") {
            if (!parseInt(argv[++i], &opts->windowsize)) {
                std::cerr << "Window size must be an integer" << std::endl;
                return 1;
            }
        } else if (arg == "-d" || arg == "--discard") {
            int discard = 0;
            if (!parseInt(argv[++i], &discard) || discard < 0 || discard > 65535) {
                std::cerr << "Discard must be a sequence number in [0, 65535]" << std::endl;
                return 1;
            }
            opts->discard = discard;
        } else if (arg == "-o" || arg == "--output") {
            opts->output = argv[++i];
        } else if (arg == "--publish") {
            opts->publish = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return 1;
        } else {
            std::cerr << "Unknown argument " << arg << std::endl;
            return 1;
        }
    }

    if (opts->server == opts->client) {
        std::cerr << "Please specify either server (-s) or client (-c) mode" << std::endl;
        return 1;
    }
    if (!isValidIPv4(opts->ip)) {
        std::cerr << "Invalid IP address " << opts->ip << ", must be in dotted decimal format like 10.0.1.2" << std::endl;
        return 1;
    }
    if (opts->port < MIN_PORT || opts->port > MAX_PORT) {
        std::cerr << "Port must be in the range [" << MIN_PORT << ", " << MAX_PORT << "]" << std::endl;
        return 1;
    }
    if (opts->windowsize < 1) {
        std::cerr << "Window size must be at least 1" << std::endl;
        return 1;
    }
    if (opts->client && opts->filename.empty()) {
        std::cerr << "Please specify file to transmit" << std::endl;
        return 1;
    }
    if (opts->client && opts->discard != NO_DISCARD) {
        std::cerr << "Discard (-d) only applies to server mode" << std::endl;
        return 1;
    }
    return 0;
}
