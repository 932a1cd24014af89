#ifndef RETRIEVE_METADATA_HPP_INCLUDED
#define RETRIEVE_METADATA_HPP_INCLUDED
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <retrieve/header_map.hpp>
namespace retrieve {
    using metadata_value = std::variant<std::string, std::int64_t, header_map>;
    using metadata_map = std::map<std::string, metadata_value>;
}
#endif
