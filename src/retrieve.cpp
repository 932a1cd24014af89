#include <retrieve/retrieve.hpp>

std::unique_ptr<retrieve::resource> retrieve::open(std::string_view location, const options& opts) {
    register_default_clients();
    auto r = std::make_unique<resource>(location);
    r->open(opts);
    return r;
}
