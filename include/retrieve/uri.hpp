#ifndef RETRIEVE_URI_HPP_INCLUDED
#define RETRIEVE_URI_HPP_INCLUDED
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace retrieve {
    // RFC 3986 URI reference, split into its components.
    // Components are kept exactly as written (no percent-decoding).
    struct uri {
        std::string scheme;
        bool has_authority = false;
        std::string userinfo;
        std::string host;
        std::optional<std::uint16_t> port;
        std::string path;
        std::optional<std::string> query;
        std::optional<std::string> fragment;

        // Throws retrieve::invalid_uri for text that is not a URI reference
        static uri parse(std::string_view text);

        std::string authority() const;
        std::string normalized_authority() const;
        std::uint16_t inferred_port() const;
        // Path and query, as sent on an HTTP request line
        std::string request_target() const;
        std::string str() const;

        // Resolves a (possibly relative) reference against this URI
        uri resolve(const uri& reference) const;
        uri resolve(std::string_view reference) const;
    };

    std::uint16_t default_port(std::string_view scheme);

    bool operator==(const uri& lhs, const uri& rhs);
    bool operator!=(const uri& lhs, const uri& rhs);
}
#endif
