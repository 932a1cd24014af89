#include <retrieve/header_map.hpp>
#include <algorithm>
#include <cctype>
#include <ostream>

std::string retrieve::to_lower(std::string_view s) {
    std::string result{s};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool retrieve::iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
        std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
        });
}

retrieve::header_map::header_map(std::initializer_list<value_type> init) {
    for(const auto& [name, value] : init) {
        set(name, value);
    }
}

void retrieve::header_map::set(std::string_view name, std::string_view value) {
    auto key = to_lower(name);
    auto first = std::find_if(fields.begin(), fields.end(), [&](const field& f) { return f.key == key; });
    if(first == fields.end()) {
        fields.push_back({key, std::string{name}, std::string{value}});
        return;
    }
    first->name = std::string{name};
    first->value = std::string{value};
    fields.erase(std::remove_if(first + 1, fields.end(), [&](const field& f) { return f.key == key; }),
                 fields.end());
}

void retrieve::header_map::append(std::string_view name, std::string_view value) {
    fields.push_back({to_lower(name), std::string{name}, std::string{value}});
}

void retrieve::header_map::remove(std::string_view name) {
    auto key = to_lower(name);
    fields.erase(std::remove_if(fields.begin(), fields.end(), [&](const field& f) { return f.key == key; }),
                 fields.end());
}

std::optional<std::string> retrieve::header_map::get(std::string_view name) const {
    auto key = to_lower(name);
    auto found = std::find_if(fields.rbegin(), fields.rend(), [&](const field& f) { return f.key == key; });
    if(found == fields.rend()) return std::nullopt;
    return found->value;
}

std::vector<std::string> retrieve::header_map::get_all(std::string_view name) const {
    auto key = to_lower(name);
    std::vector<std::string> values;
    for(const auto& f : fields) {
        if(f.key == key) values.push_back(f.value);
    }
    return values;
}

bool retrieve::header_map::has(std::string_view name) const {
    return get(name).has_value();
}

// Whether any value for the name lists token as one of its comma-separated
// elements, case-insensitively
bool retrieve::header_map::contains_token(std::string_view name, std::string_view token) const {
    for(const auto& value : get_all(name)) {
        std::string_view rest = value;
        while(!rest.empty()) {
            auto comma = std::min(rest.find(','), rest.size());
            auto element = rest.substr(0, comma);
            auto first = element.find_first_not_of(" \t");
            if(first != std::string_view::npos) {
                element = element.substr(first, element.find_last_not_of(" \t") - first + 1);
                if(iequals(element, token)) return true;
            }
            rest.remove_prefix(std::min(comma + 1, rest.size()));
        }
    }
    return false;
}

std::size_t retrieve::header_map::size() const {
    return fields.size();
}

bool retrieve::header_map::empty() const {
    return fields.empty();
}

std::vector<retrieve::header_map::value_type> retrieve::header_map::items() const {
    std::vector<value_type> result;
    result.reserve(fields.size());
    for(const auto& f : fields) {
        result.emplace_back(f.name, f.value);
    }
    return result;
}

std::ostream& retrieve::operator<<(std::ostream& out, const header_map& headers) {
    out << "{";
    bool first = true;
    for(const auto& [name, value] : headers.items()) {
        if(!first) out << ", ";
        out << '"' << name << "\" => \"" << value << '"';
        first = false;
    }
    return out << "}";
}
