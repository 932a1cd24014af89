#include <retrieve/content_coding.hpp>
#include <retrieve/error.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <fmt/format.h>
#include <ios>

namespace io = boost::iostreams;

std::string retrieve::gzip_encode(std::string_view body) {
    std::string encoded;
    {
        io::filtering_ostream out;
        out.push(io::gzip_compressor{});
        out.push(io::back_inserter(encoded));
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
    }
    return encoded;
}

std::string retrieve::gzip_decode(std::string_view body) {
    std::string decoded;
    try {
        io::filtering_istream in;
        in.push(io::gzip_decompressor{});
        in.push(io::array_source{body.data(), body.size()});
        io::copy(in, io::back_inserter(decoded));
    } catch (const std::ios_base::failure& err) {
        throw retrieve::parse_error(fmt::format("Could not decode gzip body: {}", err.what()));
    }
    return decoded;
}
