#include <retrieve/connection_pool.hpp>
#include <boost/log/trivial.hpp>

retrieve::connection_pool::~connection_pool() {
    close_all();
}

std::shared_ptr<retrieve::pushback_stream> retrieve::connection_pool::acquire(
        const std::string& host, std::uint16_t port, const connector& connect, std::chrono::milliseconds timeout) {
    auto& entry = connections[{host, port}];
    if(entry) {
        BOOST_LOG_TRIVIAL(debug) << "* Using open connection to " << host << " port " << port;
        if(entry->is_open()) return entry;
        BOOST_LOG_TRIVIAL(debug) << "* Socket was closed.  Reopening.";
    } else {
        BOOST_LOG_TRIVIAL(debug) << "* About to connect to " << host << " port " << port;
    }
    try {
        entry = std::make_shared<pushback_stream>(connect(host, port, timeout));
    } catch (...) {
        connections.erase({host, port});
        throw;
    }
    BOOST_LOG_TRIVIAL(debug) << "* Connected to " << host << " port " << port;
    return entry;
}

void retrieve::connection_pool::evict(const std::string& host, std::uint16_t port) {
    auto found = connections.find({host, port});
    if(found == connections.end()) return;
    BOOST_LOG_TRIVIAL(debug) << "* Closing connection to " << host << " port " << port;
    found->second->close();
    connections.erase(found);
}

void retrieve::connection_pool::close_all() {
    for(auto& [endpoint, connection] : connections) {
        BOOST_LOG_TRIVIAL(debug) << "* Closing connection to " << endpoint.first << " port " << endpoint.second;
        connection->close();
    }
    connections.clear();
}

bool retrieve::connection_pool::contains(const std::string& host, std::uint16_t port) const {
    return connections.count({host, port}) > 0;
}

std::size_t retrieve::connection_pool::size() const {
    return connections.size();
}
