#ifndef RETRIEVE_PUSHBACK_STREAM_HPP_INCLUDED
#define RETRIEVE_PUSHBACK_STREAM_HPP_INCLUDED
#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <retrieve/socket.hpp>
namespace retrieve {
    // Buffered wrapper over a stream. Bytes a parser could not use yet are
    // pushed back and replayed by the next read.
    class pushback_stream {
        static constexpr std::size_t buffer_size = 16 * 1024;
        using byte_buf = std::array<char, buffer_size>;

        std::unique_ptr<stream> secondary;
        std::string buffer;
        byte_buf scratch;

        public:
        explicit pushback_stream(std::unique_ptr<stream> secondary);

        // Reads up to n bytes, buffered bytes first. A partial read returns
        // whatever is buffered, or the result of a single read from the
        // secondary stream when nothing is buffered. A full read blocks until
        // n bytes arrive or the secondary stream ends.
        // Throws premature_close when the secondary stream ends with nothing read.
        // Returns an empty string once both buffer and stream are exhausted.
        std::string read(std::size_t n, bool partial = false);
        void push(std::string_view bytes);
        std::size_t buffered() const;

        void write(std::string_view bytes);
        void flush();
        // True immediately when bytes are buffered
        bool wait_readable(std::chrono::milliseconds timeout);

        void close();
        bool is_open() const;
    };
}
#endif
