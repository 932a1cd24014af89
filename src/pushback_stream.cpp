#include <retrieve/pushback_stream.hpp>
#include <retrieve/error.hpp>
#include <algorithm>
#include <boost/log/trivial.hpp>

retrieve::pushback_stream::pushback_stream(std::unique_ptr<stream> secondary)
    : secondary(std::move(secondary)) {
}

std::string retrieve::pushback_stream::read(std::size_t n, bool partial) {
    std::string result = buffer.substr(0, n);
    buffer.erase(0, result.size());
    if(result.size() == n || !secondary->is_open()) {
        return result;
    }
    if(partial && !result.empty()) {
        return result;
    }
    while(result.size() < n) {
        std::size_t got = secondary->recv_some(scratch.data(), std::min(n - result.size(), buffer_size));
        if(got == 0) {
            close();
            if(result.empty()) {
                throw retrieve::premature_close("Unexpected end of response.");
            }
            break;
        }
        result.append(scratch.data(), got);
        if(partial) break;
    }
    return result;
}

void retrieve::pushback_stream::push(std::string_view bytes) {
    buffer.insert(0, bytes.data(), bytes.size());
}

std::size_t retrieve::pushback_stream::buffered() const {
    return buffer.size();
}

void retrieve::pushback_stream::write(std::string_view bytes) {
    if(!secondary->is_open()) throw retrieve::client_error("Socket closed.");
    secondary->send_all(bytes.data(), bytes.size());
}

void retrieve::pushback_stream::flush() {
    if(!secondary->is_open()) throw retrieve::client_error("Socket closed.");
    secondary->flush();
}

bool retrieve::pushback_stream::wait_readable(std::chrono::milliseconds timeout) {
    if(!buffer.empty()) return true;
    if(!secondary->is_open()) throw retrieve::client_error("Socket closed.");
    return secondary->wait_readable(timeout);
}

void retrieve::pushback_stream::close() {
    try {
        secondary->close();
    } catch (const std::exception& err) {
        BOOST_LOG_TRIVIAL(debug) << "* Ignoring error while closing stream: " << err.what();
    }
}

bool retrieve::pushback_stream::is_open() const {
    return secondary->is_open();
}
