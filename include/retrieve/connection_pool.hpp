#ifndef RETRIEVE_CONNECTION_POOL_HPP_INCLUDED
#define RETRIEVE_CONNECTION_POOL_HPP_INCLUDED
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <retrieve/pushback_stream.hpp>
namespace retrieve {
    using connector = std::function<std::unique_ptr<stream>(const std::string& host, std::uint16_t port,
                                                             std::chrono::milliseconds timeout)>;

    // Live connections keyed by host and port.
    // Not synchronized: a pool shared between threads needs external locking.
    class connection_pool {
        using key = std::pair<std::string, std::uint16_t>;
        std::map<key, std::shared_ptr<pushback_stream>> connections;

        public:
        connection_pool() = default;
        connection_pool(const connection_pool&) = delete;
        connection_pool& operator=(const connection_pool&) = delete;
        ~connection_pool();

        // Reuses the open connection for host:port, replacing a closed one
        std::shared_ptr<pushback_stream> acquire(const std::string& host, std::uint16_t port,
                                                 const connector& connect, std::chrono::milliseconds timeout);
        // Closes and forgets the connection for host:port
        void evict(const std::string& host, std::uint16_t port);
        void close_all();

        bool contains(const std::string& host, std::uint16_t port) const;
        std::size_t size() const;
    };
}
#endif
