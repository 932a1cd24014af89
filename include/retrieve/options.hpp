#ifndef RETRIEVE_OPTIONS_HPP_INCLUDED
#define RETRIEVE_OPTIONS_HPP_INCLUDED
#include <chrono>
#include <string>
#include <vector>
#include <retrieve/connection_pool.hpp>
#include <retrieve/header_map.hpp>
#include <retrieve/redirect.hpp>
#include <retrieve/request.hpp>
namespace retrieve {
    enum class file_mode {
        read,
        write,
        read_write,
        append,
        create,
        exclusive,
        truncate
    };

    // Settings for one open() call. Each client reads the fields it knows.
    struct options {
        std::string method = "GET";
        header_map headers;
        cookie_map cookies;
        // Accepted for callers that keep a jar; not consulted yet
        cookie_map* cookie_store = nullptr;
        redirect_policy redirect = true;
        unsigned max_redirects = 20;
        // Caller-owned pool kept across calls. Without one every connection
        // opened by the call is closed when it returns.
        connection_pool* connections = nullptr;
        std::chrono::milliseconds timeout = std::chrono::seconds{20};
        std::string body;
        // Ask for gzip and decode gzip bodies
        bool decode_content = false;
        // Opens the raw stream for host:port; TCP when empty
        retrieve::connector connector;

        std::vector<file_mode> mode = {file_mode::read};
    };
}
#endif
