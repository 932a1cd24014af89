#include <retrieve/response.hpp>
#include <retrieve/error.hpp>
#include <retrieve/pushback_stream.hpp>
#include <algorithm>
#include <cctype>
#include <string_view>
#include <boost/log/trivial.hpp>
#include <fmt/format.h>

static const std::string_view header_separators = "()<>@,;:\\\"/[]?={} \t\r\n";

static std::size_t find_crlf(const std::string& data, std::size_t from = 0) {
    auto found = std::search(data.begin() + from, data.end(), retrieve::crlf.begin(), retrieve::crlf.end());
    return found == data.end() ? std::string::npos : static_cast<std::size_t>(found - data.begin());
}

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static bool no_line_breaks(std::string_view text) {
    return text.find_first_of("\r\n") == std::string_view::npos;
}

// HTTP/<digit>.<digit> SP <3 digits> SP <reason>
static bool parse_start_line(std::string_view line, retrieve::response& target) {
    if(line.size() < 13 || line.substr(0, 5) != "HTTP/") return false;
    if(!is_digit(line[5]) || line[6] != '.' || !is_digit(line[7]) || line[8] != ' ') return false;
    if(!is_digit(line[9]) || !is_digit(line[10]) || !is_digit(line[11]) || line[12] != ' ') return false;
    if(!no_line_breaks(line.substr(13))) return false;
    target.http_version = std::string{line.substr(5, 3)};
    target.status = std::string{line.substr(9, 3)};
    target.reason = std::string{line.substr(13)};
    return true;
}

// token ":" OWS value
static bool parse_header_line(std::string_view line, std::string& name, std::string& value) {
    auto colon = line.find(':');
    if(colon == 0 || colon == std::string_view::npos) return false;
    auto token = line.substr(0, colon);
    if(token.find_first_of(header_separators) != std::string_view::npos) return false;
    auto rest = line.substr(colon + 1);
    auto value_start = rest.find_first_not_of(" \t");
    rest = value_start == std::string_view::npos ? std::string_view{} : rest.substr(value_start);
    if(!no_line_breaks(rest)) return false;
    name = std::string{token};
    value = std::string{rest};
    return true;
}

// <hex digits> [OWS]; false on anything else
static bool parse_chunk_size_line(std::string_view line, std::size_t& size) {
    auto digits_end = std::min(line.find_first_not_of("0123456789abcdefABCDEF"), line.size());
    if(digits_end == 0 || digits_end > 15) return false;
    if(line.find_first_not_of(" \t", digits_end) != std::string_view::npos) return false;
    size = std::stoull(std::string{line.substr(0, digits_end)}, nullptr, 16);
    return true;
}

bool retrieve::status_class(const response& r, char digit) {
    return r.status.size() == 3 && r.status.front() == digit;
}

retrieve::response_parser::response_parser(pushback_stream& stream, response& target, bool expect_body)
    : stream(stream), target(target), expect_body(expect_body) {
}

retrieve::response_parser::state retrieve::response_parser::current_state() const {
    return current;
}

const std::string& retrieve::response_parser::error() const {
    return error_message;
}

// Appends more input to pending; false once the stream has ended
bool retrieve::response_parser::fill() {
    std::string data;
    try {
        data = stream.read(read_size, true);
    } catch (const retrieve::premature_close&) {
        if(pending.empty()) throw;
        return false;
    }
    if(data.empty()) {
        if(pending.empty()) throw retrieve::premature_close("Unexpected end of response.");
        return false;
    }
    pending += data;
    return true;
}

retrieve::parse_result retrieve::response_parser::fail(std::string message) {
    BOOST_LOG_TRIVIAL(error) << "* " << message;
    error_message = std::move(message);
    return parse_result::error;
}

retrieve::parse_result retrieve::response_parser::line_too_long() {
    return fail(fmt::format("HTTP line longer than {} bytes.", max_line_length));
}

// Blank lines may precede the start line, but then the start line is misplaced
retrieve::parse_result retrieve::response_parser::parse_status_line() {
    if(!fill()) return fail("Response missing HTTP start line.");
    std::size_t line_start = 0;
    std::size_t line_end;
    while((line_end = find_crlf(pending, line_start)) == line_start) {
        line_start += crlf.size();
    }
    if(line_end == std::string::npos) {
        if(pending.size() - line_start > max_line_length) return line_too_long();
        return parse_result::need_more;
    }
    if(line_end - line_start > max_line_length) return line_too_long();
    std::string_view line{pending.data() + line_start, line_end - line_start};
    if(!parse_start_line(line, target)) {
        return fail("Response missing HTTP start line.");
    }
    if(line_start != 0) {
        return fail("HTTP start line was invalid.");
    }
    BOOST_LOG_TRIVIAL(trace) << "< " << std::string{line};
    stream.push(std::string_view{pending}.substr(line_end + crlf.size()));
    pending.clear();
    return parse_result::done;
}

retrieve::parse_result retrieve::response_parser::parse_header() {
    if(!fill()) return fail("Expected HTTP header, got end of response.");
    auto line_end = find_crlf(pending);
    if(line_end == std::string::npos) {
        if(pending.size() > max_line_length) return line_too_long();
        return parse_result::need_more;
    }
    if(line_end > max_line_length) return line_too_long();
    if(line_end == 0) {
        stream.push(std::string_view{pending}.substr(crlf.size()));
        pending.clear();
        return parse_result::done;
    }
    std::string name, value;
    if(!parse_header_line(std::string_view{pending}.substr(0, line_end), name, value)) {
        return fail(fmt::format("Expected HTTP header, got something else: '{}'", pending.substr(0, line_end)));
    }
    BOOST_LOG_TRIVIAL(trace) << "< " << name << ": " << value;
    target.headers.append(name, value);
    stream.push(std::string_view{pending}.substr(line_end + crlf.size()));
    pending.clear();
    return parse_result::need_more;
}

retrieve::parse_result retrieve::response_parser::choose_framing() {
    if(!expect_body || status_class(target, '1') || target.status == "204" || target.status == "304") {
        body_framing = framing::none;
    } else if(target.headers.contains_token("Transfer-Encoding", "chunked")) {
        body_framing = framing::chunked;
    } else if(auto length = target.headers.get("Content-Length")) {
        if(length->empty() || length->size() > 18 ||
           !std::all_of(length->begin(), length->end(), [](unsigned char c) { return std::isdigit(c); })) {
            return fail(fmt::format("Invalid Content-Length: '{}'", *length));
        }
        remaining = static_cast<std::size_t>(std::stoull(*length));
        body_framing = framing::content_length;
    } else {
        body_framing = framing::until_close;
    }
    return parse_result::done;
}

retrieve::parse_result retrieve::response_parser::parse_chunk() {
    if(!fill()) return fail("Could not determine chunk size.");
    auto line_end = find_crlf(pending);
    if(line_end == std::string::npos) {
        if(pending.size() > max_line_length) return line_too_long();
        return parse_result::need_more;
    }
    std::size_t chunk_size = 0;
    if(!parse_chunk_size_line(std::string_view{pending}.substr(0, line_end), chunk_size)) {
        return fail("Could not determine chunk size.");
    }
    stream.push(std::string_view{pending}.substr(line_end + crlf.size()));
    pending.clear();

    std::string chunk;
    while(chunk.size() < chunk_size) {
        std::string data = stream.read(chunk_size - chunk.size());
        if(data.empty()) throw retrieve::premature_close("Unexpected end of response.");
        chunk += data;
    }
    target.body += chunk;

    std::string terminator;
    try {
        terminator = stream.read(crlf.size());
    } catch (const retrieve::premature_close&) {
        // Reported below as a missing terminator
    }
    if(terminator != crlf) {
        return fail(fmt::format("Expected CRLF after chunk (size: {}), got: '{}'", chunk_size, terminator));
    }
    return chunk_size == 0 ? parse_result::done : parse_result::need_more;
}

retrieve::parse_result retrieve::response_parser::parse_fixed_length() {
    if(remaining == 0) return parse_result::done;
    std::string data = stream.read(std::min(remaining, read_size));
    if(data.empty()) throw retrieve::premature_close("Unexpected end of response.");
    remaining -= data.size();
    target.body += data;
    return remaining == 0 ? parse_result::done : parse_result::need_more;
}

// No length given: the body ends when the server closes the connection
retrieve::parse_result retrieve::response_parser::parse_until_close() {
    std::string data;
    try {
        data = stream.read(read_size, true);
    } catch (const retrieve::premature_close&) {
        return parse_result::done;
    }
    if(data.empty()) return parse_result::done;
    target.body += data;
    return parse_result::need_more;
}

retrieve::parse_result retrieve::response_parser::step() {
    parse_result result = parse_result::done;
    switch(current) {
    case state::status_line:
        result = parse_status_line();
        if(result == parse_result::done) current = state::headers;
        break;
    case state::headers:
        result = parse_header();
        if(result == parse_result::done) {
            result = choose_framing();
            if(result == parse_result::done) current = state::body;
        }
        break;
    case state::body:
        switch(body_framing) {
        case framing::none:           result = parse_result::done; break;
        case framing::chunked:        result = parse_chunk(); break;
        case framing::content_length: result = parse_fixed_length(); break;
        case framing::until_close:    result = parse_until_close(); break;
        }
        if(result == parse_result::done) current = state::complete;
        break;
    case state::complete:
        break;
    }
    return result;
}

void retrieve::response_parser::run() {
    while(current != state::complete) {
        if(step() == parse_result::error) {
            throw retrieve::parse_error(error_message);
        }
    }
}
