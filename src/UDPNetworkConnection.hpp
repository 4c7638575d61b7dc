#pragma once
#include <cstring>
#include <cerrno>
#include <string>
#include <stdio.h>
#include <sys/select.h>
#include "NetworkUtils.hpp"
#include "NetworkConnection.hpp"


class UDPNetworkConnection : public NetworkConnection {
public:
    UDPNetworkConnection() {
        std::memset(&peer_addr, 0, sizeof(peer_addr));
    }
    UDPNetworkConnection(const UDPNetworkConnection&) = delete;
    UDPNetworkConnection& operator=(const UDPNetworkConnection&) = delete;
    UDPNetworkConnection(UDPNetworkConnection&& other) noexcept
            : sockfd(other.sockfd), port(other.port), peer_addr(other.peer_addr), has_peer(other.has_peer),
              peer_pinned(other.peer_pinned) {
        other.sockfd = -1;
    }
    ~UDPNetworkConnection() override {
        close();
    }

// NetworkConnection Interface
    // open() implemented by UDPStreamSender and UDPStreamReceiver

    ssize_t send(const void* packet, size_t len) override {
        if (!has_peer) {
            std::cerr << "No peer address to send to" << std::endl;
            return -1;
        }
        ssize_t sent = sendto(sockfd, packet, len, 0, (const sockaddr*)&peer_addr, sizeof(peer_addr));
        if (sent < 0) {
            perror("sendto failed");
        }
        return sent;
    }

    RecvResult receive(void* buffer, size_t len, int timeout_ms) override {
        if (sockfd < 0) {
            return RecvResult::fatal(ERR_SOCKET);
        }
        int ret;
        if (timeout_ms != BLOCK_FOREVER) {
            timeval tv = {timeout_ms / 1000, (timeout_ms % 1000) * 1000};
            ret = ready(&tv);
        } else {
            ret = ready(nullptr);
        }
        if (ret < 0) {
            if (errno == EINTR) return RecvResult::timeout();
            perror("select failed");
            return RecvResult::fatal(ERR_SOCKET);
        }
        if (ret == 0) {
            return RecvResult::timeout();
        }

        sockaddr_in from_addr;
        socklen_t from_len = sizeof(from_addr);
        ssize_t n = recvfrom(sockfd, buffer, len, 0, (sockaddr*)&from_addr, &from_len);
        if (n < 0) {
            return errnoResult();
        }
        onReceived(from_addr);
        return RecvResult::data(n);
    }

    bool close() override {
        peer_pinned = false;
        if (sockfd < 0) return true;
        int success = ::close(sockfd);  // :: scope resolution to call std close()
        sockfd = -1;
        return success == 0;
    }

    int getPort() {
        return port;
    }

protected:
    int sockfd = -1;
    int port = -1;
    sockaddr_in peer_addr;
    bool has_peer = false;
    bool peer_pinned = false;

    virtual void onReceived(const sockaddr_in& from_addr) {
        (void)from_addr;
    }

    // timeout == nullptr waits indefinitely.
    // Returns 1 when readable, 0 on timeout, -1 when select() fails (errno is set).
    int ready(timeval* timeout) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(sockfd, &readfds);
        int ret = select(sockfd+1, &readfds, nullptr, nullptr, timeout);
        if (ret < 0) return -1;
        return (ret > 0 && FD_ISSET(sockfd, &readfds)) ? 1 : 0;
    }

    static RecvResult errnoResult() {
        switch (errno) {
            case EAGAIN:
#if EAGAIN != EWOULDBLOCK
            case EWOULDBLOCK:
#endif
            case EINTR:
                return RecvResult::timeout();
            case ECONNREFUSED:
            case ECONNRESET:
                return RecvResult::fatal(ERR_CONNECTION_RESET);
            default:
                perror("recvfrom failed");
                return RecvResult::fatal(ERR_SOCKET);
        }
    }
};

// Client side. The socket is connected to the receiver so that an ICMP
// port-unreachable surfaces as ECONNREFUSED on the next receive.
class UDPStreamSender : public UDPNetworkConnection {
public:
    UDPStreamSender(int receiver_port, const std::string& receiver_ip) : receiver_ip(receiver_ip) {
        port = receiver_port;
    }
    UDPStreamSender(UDPStreamSender&& other) = default;

// NetworkConnection Interface
    bool open() override {
        if (sockfd >= 0) return true;
        if (!setupAddress(&peer_addr, port, receiver_ip)) {
            std::cerr << "Invalid receiver IP address: " << receiver_ip << std::endl;
            return false;
        }
        sockfd = createUDPSocket();
        if (sockfd < 0) {
            return false;
        }
        if (connect(sockfd, (sockaddr*)&peer_addr, sizeof(peer_addr)) < 0) {
            perror("connect failed");
            close();
            return false;
        }
        has_peer = true;
        return true;
    }

    ssize_t send(const void* packet, size_t len) override {
        ssize_t sent = ::send(sockfd, packet, len, 0);
        if (sent < 0 && errno != ECONNREFUSED) {
            perror("send failed");
        }
        return sent;
    }

protected:
    std::string receiver_ip;
};


// Server side. Replies go to whoever sent the most recent datagram until
// pinPeer() fixes the current peer for the rest of the connection.
class UDPStreamReceiver : public UDPNetworkConnection {
public:
    UDPStreamReceiver(int receiver_port, const std::string& receiver_ip="") : receiver_ip(receiver_ip) {
        port = receiver_port;
    }
    UDPStreamReceiver(UDPStreamReceiver&& other) = default;

// NetworkConnection Interface
    void pinPeer() override {
        if (has_peer) peer_pinned = true;
    }

    // Port 0 binds an ephemeral port, getPort() reports it afterwards.
    bool open() override {
        if (sockfd >= 0) return true;
        sockaddr_in local_addr;
        if (!setupAddress(&local_addr, port, receiver_ip)) {
            std::cerr << "Invalid address or Address not supported: " << receiver_ip << std::endl;
            return false;
        }
        sockfd = createUDPSocket();
        if (sockfd < 0) {
            return false;
        }
        int reuse = 1;
        setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        if(bind(sockfd, (sockaddr*)&local_addr, sizeof(local_addr)) < 0) {
            perror("bind failed");
            close();
            return false;
        }
        socklen_t addr_len = sizeof(local_addr);
        if (getsockname(sockfd, (sockaddr*)&local_addr, &addr_len) == 0) {
            port = ntohs(local_addr.sin_port);
        }
        return true;
    }

protected:
    std::string receiver_ip;

    void onReceived(const sockaddr_in& from_addr) override {
        if (peer_pinned) return;
        peer_addr = from_addr;
        has_peer = true;
    }
};
