#ifndef RETRIEVE_REQUEST_HPP_INCLUDED
#define RETRIEVE_REQUEST_HPP_INCLUDED
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <retrieve/header_map.hpp>
namespace retrieve {
    struct uri;
    struct options;

    // Cookie name to one or more values; each value becomes its own Cookie line
    using cookie_map = std::map<std::string, std::vector<std::string>>;

    struct request {
        std::string method;
        std::string target;
        header_map headers;
        std::string body;
    };

    request make_request(const uri& target, std::string_view method, const options& opts, bool with_body = true);
    std::string encode_request(const request& req);

    bool valid_method(std::string_view method);
    // Percent-escapes everything but [ a-zA-Z0-9_.-], then turns spaces into '+'
    std::string escape_cookie(std::string_view s);
}
#endif
