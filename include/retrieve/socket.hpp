#ifndef RETRIEVE_SOCKET_HPP_INCLUDED
#define RETRIEVE_SOCKET_HPP_INCLUDED
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
namespace retrieve {
    const std::string crlf = "\r\n";

    // A raw, blocking byte connection
    class stream {
        public:
        virtual ~stream() = default;
        // Returns 0 once the peer has closed its side
        virtual std::size_t recv_some(char* dst, std::size_t size) = 0;
        virtual void send_all(const char* start, std::size_t size) = 0;
        virtual void flush() {}
        // Waits until recv_some would not block; false on timeout
        virtual bool wait_readable(std::chrono::milliseconds timeout) = 0;
        virtual void close() = 0;
        virtual bool is_open() const = 0;
    };

    class socket : public stream {
        int sockfd;

        public:
        explicit socket(int connected);
        socket(const socket&) = delete;
        socket& operator=(const socket&) = delete;
        ~socket() override;

        // Applies SO_RCVTIMEO and SO_SNDTIMEO
        void set_timeout(std::chrono::milliseconds timeout);

        std::size_t recv_some(char* dst, std::size_t size) override;
        void send_all(const char* start, std::size_t size) override;
        bool wait_readable(std::chrono::milliseconds timeout) override;
        void close() override;
        bool is_open() const override;
    };

    std::unique_ptr<stream> tcp_connect(const std::string& host, std::uint16_t port,
                                        std::chrono::milliseconds timeout);
}
#endif
