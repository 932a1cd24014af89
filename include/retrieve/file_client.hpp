#ifndef RETRIEVE_FILE_CLIENT_HPP_INCLUDED
#define RETRIEVE_FILE_CLIENT_HPP_INCLUDED
#include <fstream>
#include <string>
#include <boost/filesystem.hpp>
#include <retrieve/client.hpp>
namespace retrieve {
    // Local files named by file: URIs
    class file_client : public client {
        boost::filesystem::path file_path;
        std::fstream file;
        bool opened = false;

        void process_metadata();

        public:
        static std::string scheme() { return "file"; }

        // Throws std::invalid_argument for URIs with a query or an authority
        explicit file_client(resource& target);

        void open(const options& opts) override;
        std::string read(std::optional<std::size_t> n) override;
        void close() override;
        bool is_open() const override;

        bool can_write() const override;
        std::size_t write(std::string_view contents) override;
    };
}
#endif
