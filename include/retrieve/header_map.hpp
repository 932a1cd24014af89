#ifndef RETRIEVE_HEADER_MAP_HPP_INCLUDED
#define RETRIEVE_HEADER_MAP_HPP_INCLUDED
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace retrieve {
    // Ordered header fields with case-insensitive names. Each field keeps the
    // casing it was last written with.
    class header_map {
        struct field {
            std::string key;   // lower-cased
            std::string name;  // as written
            std::string value;
        };
        std::vector<field> fields;

        public:
        using value_type = std::pair<std::string, std::string>;

        header_map() = default;
        header_map(std::initializer_list<value_type> init);

        // Replaces every field with this name, in place of the first one
        void set(std::string_view name, std::string_view value);
        // Adds another field line, keeping existing ones
        void append(std::string_view name, std::string_view value);
        void remove(std::string_view name);

        std::optional<std::string> get(std::string_view name) const;
        std::vector<std::string> get_all(std::string_view name) const;
        bool has(std::string_view name) const;
        bool contains_token(std::string_view name, std::string_view token) const;

        std::size_t size() const;
        bool empty() const;
        // (name, value) pairs in order, names as written
        std::vector<value_type> items() const;
    };

    std::string to_lower(std::string_view s);
    bool iequals(std::string_view lhs, std::string_view rhs);
    std::ostream& operator<<(std::ostream& out, const header_map& headers);
}
#endif
