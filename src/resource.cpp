#include <retrieve/resource.hpp>
#include <retrieve/error.hpp>
#include <fmt/format.h>

retrieve::resource::resource(std::string_view text) : resource(uri::parse(text)) {
}

retrieve::resource::resource(uri location) : current(location), permanent(std::move(location)) {
}

// Out of line so that client is complete where bound is destroyed
retrieve::resource::~resource() = default;

const retrieve::uri& retrieve::resource::current_uri() const {
    return current;
}

const retrieve::uri& retrieve::resource::permanent_uri() const {
    return permanent;
}

const retrieve::metadata_map& retrieve::resource::metadata() const {
    return meta;
}

std::optional<std::string> retrieve::resource::metadata_text(const std::string& key) const {
    auto found = meta.find(key);
    if(found == meta.end()) return std::nullopt;
    if(auto text = std::get_if<std::string>(&found->second)) return *text;
    return std::nullopt;
}

std::optional<std::int64_t> retrieve::resource::metadata_number(const std::string& key) const {
    auto found = meta.find(key);
    if(found == meta.end()) return std::nullopt;
    if(auto number = std::get_if<std::int64_t>(&found->second)) return *number;
    return std::nullopt;
}

const retrieve::header_map* retrieve::resource::headers() const {
    auto found = meta.find("headers");
    if(found == meta.end()) return nullptr;
    return std::get_if<header_map>(&found->second);
}

retrieve::client& retrieve::resource::bound_client() {
    if(!bound) {
        auto make = client_registry::instance().resolve(current.scheme);
        if(!make) {
            throw retrieve::no_client_error(
                fmt::format("No client registered for scheme '{}' ({})", current.scheme, current.str()));
        }
        bound = (*make)(*this);
    }
    return *bound;
}

retrieve::resource& retrieve::resource::open(const options& opts) {
    bound_client().open(opts);
    return *this;
}

std::string retrieve::resource::read() {
    return bound_client().read(std::nullopt);
}

std::string retrieve::resource::read(std::size_t n) {
    return bound_client().read(n);
}

std::size_t retrieve::resource::write(std::string_view contents) {
    return bound_client().write(contents);
}

bool retrieve::resource::can_write() {
    return bound_client().can_write();
}

void retrieve::resource::close() {
    bound_client().close();
}

bool retrieve::resource::is_open() const {
    return bound && bound->is_open();
}
