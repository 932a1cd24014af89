#include "test_support.hpp"
#include <retrieve/error.hpp>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>

static std::pair<int, int> make_socketpair() {
    int fds[2];
    retrieve::check_error(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    return {fds[0], fds[1]};
}

static void send_all(int fd, const std::string& bytes) {
    std::size_t sent = 0;
    while(sent < bytes.size()) {
        ssize_t n = ::send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        retrieve::check_error(static_cast<int>(n));
        sent += static_cast<std::size_t>(n);
    }
}

static std::string drain_fd(int fd) {
    std::string data;
    char buf[4096];
    while(true) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
        if(n <= 0) break;
        data.append(buf, static_cast<std::size_t>(n));
    }
    return data;
}

retrieve::testing::socket_pair::socket_pair() {
    auto [client_fd, server] = make_socketpair();
    client = std::make_unique<retrieve::socket>(client_fd);
    server_fd = server;
}

retrieve::testing::socket_pair::~socket_pair() {
    if(server_fd >= 0) ::close(server_fd);
}

void retrieve::testing::socket_pair::send(const std::string& bytes) {
    send_all(server_fd, bytes);
}

void retrieve::testing::socket_pair::finish() {
    ::shutdown(server_fd, SHUT_WR);
}

std::string retrieve::testing::socket_pair::drain() {
    return drain_fd(server_fd);
}

retrieve::testing::fake_network::~fake_network() {
    for(int fd : server_ends) {
        ::close(fd);
    }
}

void retrieve::testing::fake_network::respond(std::string bytes, bool close_after) {
    scripts.push_back({std::move(bytes), close_after});
}

retrieve::connector retrieve::testing::fake_network::connector() {
    return [this](const std::string& host, std::uint16_t port, std::chrono::milliseconds)
            -> std::unique_ptr<retrieve::stream> {
        auto [client_fd, server_fd] = make_socketpair();
        server_ends.push_back(server_fd);
        endpoints.emplace_back(host, port);
        if(!scripts.empty()) {
            script next = std::move(scripts.front());
            scripts.pop_front();
            send_all(server_fd, next.response);
            if(next.close_after) ::shutdown(server_fd, SHUT_WR);
        }
        return std::make_unique<retrieve::socket>(client_fd);
    };
}

std::size_t retrieve::testing::fake_network::connection_count() const {
    return server_ends.size();
}

const std::pair<std::string, std::uint16_t>&
retrieve::testing::fake_network::endpoint(std::size_t connection) const {
    return endpoints.at(connection);
}

std::string retrieve::testing::fake_network::received(std::size_t connection) {
    return drain_fd(server_ends.at(connection));
}

void retrieve::testing::fake_network::send(std::size_t connection, const std::string& bytes) {
    send_all(server_ends.at(connection), bytes);
}

bool retrieve::testing::fake_network::client_closed(std::size_t connection) {
    int fd = server_ends.at(connection);
    char buf[4096];
    while(true) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
        if(n == 0) return true;
        // Closing with unread input resets a unix socket
        if(n < 0) return errno == ECONNRESET;
    }
}
