#ifndef RETRIEVE_CONTENT_CODING_HPP_INCLUDED
#define RETRIEVE_CONTENT_CODING_HPP_INCLUDED
#include <string>
#include <string_view>
namespace retrieve {
    std::string gzip_encode(std::string_view body);
    // Throws parse_error on corrupt input
    std::string gzip_decode(std::string_view body);
}
#endif
