#ifndef RETRIEVE_RESOURCE_HPP_INCLUDED
#define RETRIEVE_RESOURCE_HPP_INCLUDED
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <retrieve/client.hpp>
#include <retrieve/metadata.hpp>
#include <retrieve/options.hpp>
#include <retrieve/uri.hpp>
namespace retrieve {
    // A URI together with the client servicing it and whatever the client
    // reported about it.
    class resource {
        friend class client;

        uri current;
        uri permanent;
        metadata_map meta;
        std::unique_ptr<client> bound;

        public:
        // Throws invalid_uri
        explicit resource(std::string_view text);
        explicit resource(uri location);
        resource(const resource&) = delete;
        resource& operator=(const resource&) = delete;
        ~resource();

        const uri& current_uri() const;
        // Changes only through leading runs of permanent redirects
        const uri& permanent_uri() const;

        const metadata_map& metadata() const;
        std::optional<std::string> metadata_text(const std::string& key) const;
        std::optional<std::int64_t> metadata_number(const std::string& key) const;
        const header_map* headers() const;

        // Resolved by scheme on first use; throws no_client_error
        client& bound_client();

        resource& open(const options& opts = {});

        // Closes the resource once with_resource returns or throws
        template<typename F>
        void open(const options& opts, F&& with_resource) {
            open(opts);
            try {
                std::forward<F>(with_resource)(*this);
            } catch (...) {
                if(is_open()) close();
                throw;
            }
            if(is_open()) close();
        }

        std::string read();
        std::string read(std::size_t n);
        // Throws unsupported_operation when the client cannot write
        std::size_t write(std::string_view contents);
        bool can_write();
        void close();
        bool is_open() const;
    };
}
#endif
