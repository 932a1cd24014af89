#include <retrieve/request.hpp>
#include <retrieve/options.hpp>
#include <retrieve/uri.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <fmt/format.h>

#ifndef RETRIEVE_VERSION
#define RETRIEVE_VERSION "0.0.0"
#endif

static const std::string user_agent = "retrieve/" RETRIEVE_VERSION;

bool retrieve::valid_method(std::string_view method) {
    static const std::string_view tchar_extra = "!#$%&'*+-.^_`|~";
    return !method.empty() && std::all_of(method.begin(), method.end(), [](unsigned char c) {
        return std::isalnum(c) || tchar_extra.find(static_cast<char>(c)) != std::string_view::npos;
    });
}

std::string retrieve::escape_cookie(std::string_view s) {
    std::string escaped;
    escaped.reserve(s.size());
    for(unsigned char c : s) {
        if(c == ' ') {
            escaped += '+';
        } else if(std::isalnum(c) || c == '_' || c == '.' || c == '-') {
            escaped += static_cast<char>(c);
        } else {
            escaped += fmt::format("%{:02X}", static_cast<unsigned>(c));
        }
    }
    return escaped;
}

retrieve::request retrieve::make_request(const uri& target, std::string_view method,
                                         const options& opts, bool with_body) {
    request req;
    std::transform(method.begin(), method.end(), std::back_inserter(req.method),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    req.target = target.request_target();
    if(with_body) req.body = opts.body;

    // Computed fields ignore caller values; the others may be replaced once
    std::set<std::string> replaceable = {"user-agent"};
    req.headers.set("User-Agent", user_agent);
    req.headers.set("Host", target.normalized_authority());
    req.headers.set("Content-Length", std::to_string(req.body.size()));
    if(opts.connections) {
        req.headers.set("Connection", "Keep-Alive");
        replaceable.insert("connection");
    }
    if(opts.decode_content) {
        req.headers.set("Accept-Encoding", "gzip");
        replaceable.insert("accept-encoding");
    }

    for(const auto& [name, value] : opts.headers.items()) {
        auto key = to_lower(name);
        if(key == "host" || key == "content-length") continue;
        if(replaceable.erase(key) > 0) {
            req.headers.set(name, value);
        } else {
            req.headers.append(name, value);
        }
    }

    for(const auto& [name, values] : opts.cookies) {
        for(const auto& value : values) {
            req.headers.append("Cookie", fmt::format("{}={}", escape_cookie(name), escape_cookie(value)));
        }
    }
    return req;
}

std::string retrieve::encode_request(const request& req) {
    std::string bytes = fmt::format("{} {} HTTP/1.1\r\n", req.method, req.target);
    for(const auto& [name, value] : req.headers.items()) {
        bytes += fmt::format("{}: {}\r\n", name, value);
    }
    bytes += "\r\n";
    bytes += req.body;
    return bytes;
}
