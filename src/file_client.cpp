#include <retrieve/file_client.hpp>
#include <retrieve/error.hpp>
#include <retrieve/options.hpp>
#include <retrieve/resource.hpp>
#include <cerrno>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <fmt/format.h>

namespace fs = boost::filesystem;

static std::string file_type_name(fs::file_type type) {
    switch(type) {
    case fs::regular_file:   return "file";
    case fs::directory_file: return "directory";
    case fs::symlink_file:   return "link";
    case fs::block_file:     return "block_special";
    case fs::character_file: return "character_special";
    case fs::fifo_file:      return "fifo";
    case fs::socket_file:    return "socket";
    default:                 return "unknown";
    }
}

retrieve::file_client::file_client(resource& target) : client(target) {
    const uri& location = target.current_uri();
    if(location.query.value_or("") != "" || location.authority() != "") {
        throw std::invalid_argument(fmt::format("Resource cannot be handled by client: '{}'", location.str()));
    }
    file_path = location.path;
}

void retrieve::file_client::open(const options& opts) {
    bool reading = false, writing = false, append = false;
    bool create = false, exclusive = false, truncate = false;
    for(file_mode flag : opts.mode) {
        switch(flag) {
        case file_mode::read:       reading = true; break;
        case file_mode::write:      writing = true; break;
        case file_mode::read_write: reading = writing = true; break;
        case file_mode::append:     append = writing = true; break;
        case file_mode::create:     create = true; break;
        case file_mode::exclusive:  exclusive = true; break;
        case file_mode::truncate:   truncate = true; break;
        default:
            throw std::invalid_argument("Invalid mode flag");
        }
    }
    if(!reading && !writing) {
        throw std::invalid_argument("Mode must include read, write, read_write or append");
    }

    const bool exists = fs::exists(file_path);
    if(exists && create && exclusive) {
        throw std::system_error(EEXIST, std::generic_category(), file_path.string());
    }
    if(!exists) {
        if(!create) throw std::system_error(ENOENT, std::generic_category(), file_path.string());
        std::ofstream touch{file_path.string()};
        if(!touch) throw std::system_error(errno, std::generic_category(), file_path.string());
    }

    // Opening for output without in, app or trunc would truncate
    std::ios::openmode how = std::ios::binary;
    if(reading || (writing && !append && !truncate)) how |= std::ios::in;
    if(writing) how |= std::ios::out;
    if(append) how |= std::ios::app;
    if(truncate) how |= std::ios::trunc;

    if(file.is_open()) file.close();
    file.clear();
    file.open(file_path.string(), how);
    if(!file.is_open()) {
        throw std::system_error(errno, std::generic_category(), file_path.string());
    }
    opened = true;
    BOOST_LOG_TRIVIAL(debug) << "* Opened " << file_path;
}

std::string retrieve::file_client::read(std::optional<std::size_t> n) {
    if(!opened) throw retrieve::usage_error("Missing stream.");
    process_metadata();
    std::string data;
    if(n) {
        data.resize(*n);
        file.read(&data[0], static_cast<std::streamsize>(*n));
        data.resize(static_cast<std::size_t>(file.gcount()));
    } else {
        data.assign(std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{});
    }
    // Hitting the end of the file must not block later writes
    file.clear();
    return data;
}

bool retrieve::file_client::can_write() const {
    return true;
}

std::size_t retrieve::file_client::write(std::string_view contents) {
    if(!opened) throw retrieve::usage_error("Missing stream.");
    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file.flush();
    if(!file) {
        file.clear();
        throw std::system_error(EIO, std::generic_category(), file_path.string());
    }
    return contents.size();
}

void retrieve::file_client::close() {
    if(!opened) throw retrieve::usage_error("Missing stream.");
    file.close();
    opened = false;
}

bool retrieve::file_client::is_open() const {
    return opened;
}

void retrieve::file_client::process_metadata() {
    if(!bound_resource().metadata().empty()) return;
    fs::file_status status = fs::status(file_path);
    set_metadata("file_type", file_type_name(status.type()));
    set_metadata("file_mode", static_cast<std::int64_t>(status.permissions()));
    set_metadata("modified_time", static_cast<std::int64_t>(fs::last_write_time(file_path)));
    if(status.type() == fs::regular_file) {
        set_metadata("file_size", static_cast<std::int64_t>(fs::file_size(file_path)));
    }
}
