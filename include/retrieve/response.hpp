#ifndef RETRIEVE_RESPONSE_HPP_INCLUDED
#define RETRIEVE_RESPONSE_HPP_INCLUDED
#include <cstddef>
#include <string>
#include <retrieve/header_map.hpp>
namespace retrieve {
    class pushback_stream;

    struct response {
        std::string http_version;
        // Kept as text: callers compare against "200", "301", ...
        std::string status;
        std::string reason;
        header_map headers;
        std::string body;
    };

    bool status_class(const response& r, char digit);

    enum class parse_result {
        need_more,
        done,
        error
    };

    // Incremental HTTP/1.1 response parser. Each state may need several
    // step() calls before it completes, since bytes arrive in arbitrary pieces.
    class response_parser {
        static constexpr std::size_t read_size = 16 * 1024;
        static constexpr std::size_t max_line_length = 16 * 1024;

        public:
        enum class state { status_line, headers, body, complete };

        private:
        enum class framing { none, chunked, content_length, until_close };

        pushback_stream& stream;
        response& target;
        bool expect_body;
        state current = state::status_line;
        framing body_framing = framing::none;
        std::string pending;
        std::size_t remaining = 0;
        std::string error_message;

        bool fill();
        parse_result fail(std::string message);
        parse_result line_too_long();
        parse_result parse_status_line();
        parse_result parse_header();
        parse_result parse_chunk();
        parse_result parse_fixed_length();
        parse_result parse_until_close();
        parse_result choose_framing();

        public:
        // expect_body is false for responses to HEAD
        response_parser(pushback_stream& stream, response& target, bool expect_body = true);

        parse_result step();
        state current_state() const;
        const std::string& error() const;

        // Steps until the response is complete; throws parse_error
        void run();
    };
}
#endif
