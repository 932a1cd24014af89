#include <retrieve/socket.hpp>
#include <retrieve/error.hpp>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <boost/scope_exit.hpp>
#include <fmt/format.h>

retrieve::socket::socket(int connected) : sockfd(connected) {
}

retrieve::socket::~socket() {
    close();
}

void retrieve::socket::set_timeout(std::chrono::milliseconds timeout) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    retrieve::check_error(::setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)));
    retrieve::check_error(::setsockopt(sockfd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)));
}

std::size_t retrieve::socket::recv_some(char* dst, std::size_t size) {
    if(sockfd < 0) throw retrieve::client_error("Socket closed.");
    ssize_t n;
    do {
        n = ::recv(sockfd, dst, size, 0);
    } while(n < 0 && errno == EINTR);
    if(n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        throw retrieve::timeout_error("Read timed out");
    }
    retrieve::check_error(static_cast<int>(n));
    BOOST_LOG_TRIVIAL(trace) << "        recv'd " << n << " from fd #" << sockfd;
    return static_cast<std::size_t>(n);
}

void retrieve::socket::send_all(const char* start, std::size_t size) {
    if(sockfd < 0) throw retrieve::client_error("Socket closed.");
    while(size > 0) {
        ssize_t sent = ::send(sockfd, start, size, MSG_NOSIGNAL);
        if(sent < 0 && errno == EINTR) continue;
        if(sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            throw retrieve::timeout_error("Write timed out");
        }
        retrieve::check_error(static_cast<int>(sent));
        start += sent;
        size -= static_cast<std::size_t>(sent);
    }
}

bool retrieve::socket::wait_readable(std::chrono::milliseconds timeout) {
    if(sockfd < 0) throw retrieve::client_error("Socket closed.");
    pollfd pfd{sockfd, POLLIN, 0};
    int ready;
    do {
        ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while(ready < 0 && errno == EINTR);
    retrieve::check_error(ready);
    return ready > 0;
}

void retrieve::socket::close() {
    if(sockfd < 0) return;
    ::close(sockfd);
    BOOST_LOG_TRIVIAL(trace) << "        closed fd #" << sockfd;
    sockfd = -1;
}

bool retrieve::socket::is_open() const {
    return sockfd >= 0;
}

std::unique_ptr<retrieve::stream> retrieve::tcp_connect(const std::string& host, std::uint16_t port,
                                                        std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &found);
    if(rc != 0) {
        throw retrieve::client_error(fmt::format("Could not resolve {}: {}", host, ::gai_strerror(rc)));
    }
    BOOST_SCOPE_EXIT(found) {
        ::freeaddrinfo(found);
    } BOOST_SCOPE_EXIT_END

    int last_errno = 0;
    for(addrinfo* ai = found; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if(fd < 0) {
            last_errno = errno;
            continue;
        }
        auto sock = std::make_unique<retrieve::socket>(fd);
        sock->set_timeout(timeout);
        if(::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            return sock;
        }
        last_errno = errno;
    }
    if(last_errno == EAGAIN || last_errno == EINPROGRESS) {
        throw retrieve::timeout_error(fmt::format("Timed out connecting to {} port {}", host, port));
    }
    throw std::system_error(last_errno, std::generic_category(),
                            fmt::format("Could not connect to {} port {}", host, port));
}
