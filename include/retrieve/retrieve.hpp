#ifndef RETRIEVE_RETRIEVE_HPP_INCLUDED
#define RETRIEVE_RETRIEVE_HPP_INCLUDED
#include <memory>
#include <string_view>
#include <utility>
#include <retrieve/error.hpp>
#include <retrieve/options.hpp>
#include <retrieve/resource.hpp>
namespace retrieve {
    // Opens the resource named by location with the default clients registered
    std::unique_ptr<resource> open(std::string_view location, const options& opts = {});

    // Block form: the resource is closed when with_resource returns or throws
    template<typename F>
    void open(std::string_view location, const options& opts, F&& with_resource) {
        register_default_clients();
        resource r{location};
        r.open(opts, std::forward<F>(with_resource));
    }
}
#endif
