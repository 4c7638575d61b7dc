#pragma once
#include <cstring>
#include <stdint.h>
#include <stdio.h>
#include <iostream>
#include <chrono>
#include <ctime>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <string>

// Returns -1 on failure.
inline int createUDPSocket() {
    int sockfd = socket(AF_INET, SOCK_DGRAM, 0);
    if(sockfd < 0) {
        perror("socket creation failed");
        return -1;
    }
    // Set non-blocking mode. Waiting is done with select().
    int flags = fcntl(sockfd, F_GETFL, 0);
    if (flags < 0 || fcntl(sockfd, F_SETFL, flags | O_NONBLOCK) < 0) {
        perror("fcntl O_NONBLOCK failed");
        ::close(sockfd);
        return -1;
    }
    return sockfd;
}

inline bool isValidIPv4(const std::string& ip) {
    in_addr addr;
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

inline bool setupAddress(sockaddr_in* addr, int port, const std::string& ip) {
    std::memset(addr, 0, sizeof(*addr));
    addr->sin_family = AF_INET;
    addr->sin_port   = htons(port);
    if (ip.empty()) {
        addr->sin_addr.s_addr = INADDR_ANY;
        return true;
    }
    return inet_pton(AF_INET, ip.c_str(), &addr->sin_addr) == 1;
}

// Wall clock as HH:MM:SS.mmm for log lines.
inline std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    std::time_t secs = system_clock::to_time_t(tp);
    std::tm local;
    localtime_r(&secs, &local);
    long millis = (long)(duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000);
    char buf[16];
    snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03ld", local.tm_hour, local.tm_min, local.tm_sec, millis);
    return buf;
}

inline std::string timestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}
