#ifndef RETRIEVE_CLIENT_HPP_INCLUDED
#define RETRIEVE_CLIENT_HPP_INCLUDED
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include <retrieve/metadata.hpp>
namespace retrieve {
    class resource;
    struct options;
    struct uri;

    // Services one URI scheme on behalf of a resource. Implementations set
    // the resource's metadata; callers never do.
    class client {
        resource& target;

        protected:
        void set_metadata(const std::string& key, metadata_value value);
        void set_uri(const uri& u);
        void set_permanent_uri(const uri& u);

        public:
        explicit client(resource& target);
        client(const client&) = delete;
        client& operator=(const client&) = delete;
        virtual ~client() = default;

        resource& bound_resource() const;

        virtual void open(const options& opts) = 0;
        // Everything that is left when n is empty
        virtual std::string read(std::optional<std::size_t> n) = 0;
        virtual void close() = 0;
        virtual bool is_open() const = 0;

        // Optional capabilities
        virtual bool can_write() const;
        virtual std::size_t write(std::string_view contents);
    };

    using client_factory = std::function<std::unique_ptr<client>(resource&)>;

    // Process-wide, append-only scheme table
    class client_registry {
        struct entry {
            std::string scheme;
            client_factory make;
        };
        std::vector<entry> entries;
        mutable std::mutex entries_mutex;

        public:
        static client_registry& instance();

        // Throws std::invalid_argument for a malformed scheme or an empty factory
        void add(std::string scheme, client_factory make);

        template<typename Client>
        void add() {
            static_assert(std::is_base_of_v<client, Client>, "clients must derive from retrieve::client");
            static_assert(std::is_constructible_v<Client, resource&>, "clients must be constructible from a resource");
            add(Client::scheme(), [](resource& r) -> std::unique_ptr<client> {
                return std::make_unique<Client>(r);
            });
        }

        std::optional<client_factory> resolve(std::string_view scheme) const;
    };

    bool valid_scheme_name(std::string_view scheme);
    // Registers the http and file clients once
    void register_default_clients();
}
#endif
