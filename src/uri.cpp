#include <retrieve/uri.hpp>
#include <retrieve/error.hpp>
#include <retrieve/header_map.hpp>
#include <string>
#include <boost/url.hpp>
#include <fmt/format.h>

namespace urls = boost::urls;

template<typename Text>
static std::string to_std(const Text& t) {
    return std::string(t.data(), t.size());
}

// Components stay percent-encoded, as written
static retrieve::uri from_view(urls::url_view view, std::string_view text) {
    retrieve::uri u;
    u.scheme = to_std(view.scheme());
    u.has_authority = view.has_authority();
    if(view.has_userinfo()) u.userinfo = to_std(view.encoded_userinfo());
    u.host = to_std(view.encoded_host());
    if(view.has_port() && !view.port().empty()) {
        auto port_text = to_std(view.port());
        if(port_text.size() > 5 || std::stoul(port_text) > 65535) {
            throw retrieve::invalid_uri(fmt::format("Port out of range in '{}'", text));
        }
        u.port = static_cast<std::uint16_t>(std::stoul(port_text));
    }
    u.path = to_std(view.encoded_path());
    if(view.has_query()) u.query = to_std(view.encoded_query());
    if(view.has_fragment()) u.fragment = to_std(view.encoded_fragment());
    return u;
}

retrieve::uri retrieve::uri::parse(std::string_view text) {
    std::string owned{text};
    auto parsed = urls::parse_uri_reference(owned);
    if(parsed.has_error()) {
        throw invalid_uri(fmt::format("Invalid URI '{}': {}", text, parsed.error().message()));
    }
    return from_view(*parsed, text);
}

std::uint16_t retrieve::default_port(std::string_view scheme) {
    auto s = retrieve::to_lower(scheme);
    if     (s == "http")  return 80;
    else if(s == "https") return 443;
    else if(s == "ftp")   return 21;
    else return 0;
}

std::string retrieve::uri::authority() const {
    if(!has_authority) return {};
    std::string result;
    if(!userinfo.empty()) result += userinfo + "@";
    result += host;
    if(port) result += fmt::format(":{}", *port);
    return result;
}

std::string retrieve::uri::normalized_authority() const {
    if(!has_authority) return {};
    std::string result;
    if(!userinfo.empty()) result += userinfo + "@";
    result += retrieve::to_lower(host);
    if(port && *port != default_port(scheme)) result += fmt::format(":{}", *port);
    return result;
}

std::uint16_t retrieve::uri::inferred_port() const {
    return port ? *port : default_port(scheme);
}

std::string retrieve::uri::request_target() const {
    std::string target = path.empty() ? "/" : path;
    if(query) target += "?" + *query;
    return target;
}

std::string retrieve::uri::str() const {
    std::string result;
    if(!scheme.empty()) result += scheme + ":";
    if(has_authority) result += "//" + authority();
    result += path;
    if(query) result += "?" + *query;
    if(fragment) result += "#" + *fragment;
    return result;
}

retrieve::uri retrieve::uri::resolve(const uri& reference) const {
    const std::string base_text = str();
    const std::string ref_text = reference.str();
    auto base = urls::parse_uri_reference(base_text);
    auto ref = urls::parse_uri_reference(ref_text);
    if(base.has_error() || ref.has_error()) {
        throw invalid_uri(fmt::format("Cannot resolve '{}' against '{}'", ref_text, base_text));
    }
    urls::url resolved;
    auto result = urls::resolve(*base, *ref, resolved);
    if(result.has_error()) {
        throw invalid_uri(fmt::format("Cannot resolve '{}' against '{}': {}", ref_text, base_text,
                                      result.error().message()));
    }
    return uri::parse(to_std(resolved.buffer()));
}

retrieve::uri retrieve::uri::resolve(std::string_view reference) const {
    return resolve(uri::parse(reference));
}

bool retrieve::operator==(const uri& lhs, const uri& rhs) {
    return lhs.str() == rhs.str();
}

bool retrieve::operator!=(const uri& lhs, const uri& rhs) {
    return !(lhs == rhs);
}
