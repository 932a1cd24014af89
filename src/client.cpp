#include <retrieve/client.hpp>
#include <retrieve/error.hpp>
#include <retrieve/file_client.hpp>
#include <retrieve/header_map.hpp>
#include <retrieve/http_client.hpp>
#include <retrieve/resource.hpp>
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <fmt/format.h>

retrieve::client::client(resource& target) : target(target) {
}

retrieve::resource& retrieve::client::bound_resource() const {
    return target;
}

void retrieve::client::set_metadata(const std::string& key, metadata_value value) {
    target.meta[key] = std::move(value);
}

void retrieve::client::set_uri(const uri& u) {
    target.current = u;
}

void retrieve::client::set_permanent_uri(const uri& u) {
    target.permanent = u;
}

bool retrieve::client::can_write() const {
    return false;
}

std::size_t retrieve::client::write(std::string_view) {
    throw retrieve::unsupported_operation(
        fmt::format("Undefined method 'write' for {}", target.current_uri().str()));
}

// Scheme names must match ^[^:/?#]+$
bool retrieve::valid_scheme_name(std::string_view scheme) {
    return !scheme.empty() && scheme.find_first_of(":/?#") == std::string_view::npos;
}

retrieve::client_registry& retrieve::client_registry::instance() {
    static client_registry registry;
    return registry;
}

void retrieve::client_registry::add(std::string scheme, client_factory make) {
    if(!valid_scheme_name(scheme)) {
        throw std::invalid_argument(fmt::format("Invalid scheme: '{}'", scheme));
    }
    if(!make) {
        throw std::invalid_argument(fmt::format("Missing client constructor for scheme '{}'", scheme));
    }
    std::lock_guard<std::mutex> lock(entries_mutex);
    BOOST_LOG_TRIVIAL(debug) << "* Registered client for scheme " << scheme;
    entries.push_back({std::move(scheme), std::move(make)});
}

std::optional<retrieve::client_factory> retrieve::client_registry::resolve(std::string_view scheme) const {
    std::lock_guard<std::mutex> lock(entries_mutex);
    auto found = std::find_if(entries.begin(), entries.end(), [&](const entry& e) {
        return retrieve::iequals(e.scheme, scheme);
    });
    if(found == entries.end()) return std::nullopt;
    return found->make;
}

void retrieve::register_default_clients() {
    static std::once_flag registered;
    std::call_once(registered, []() {
        auto& registry = client_registry::instance();
        registry.add<http_client>();
        registry.add<file_client>();
    });
}
