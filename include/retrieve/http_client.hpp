#ifndef RETRIEVE_HTTP_CLIENT_HPP_INCLUDED
#define RETRIEVE_HTTP_CLIENT_HPP_INCLUDED
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <retrieve/client.hpp>
#include <retrieve/connection_pool.hpp>
#include <retrieve/redirect.hpp>
#include <retrieve/response.hpp>
namespace retrieve {
    // HTTP/1.1 over a plain byte stream. Blocking; one response per open().
    class http_client : public client {
        std::optional<response> current_response;
        std::string remaining_body;
        std::size_t body_offset = 0;
        redirect_chain redirects;

        connection_pool private_pool;
        connection_pool* connections = nullptr;
        std::shared_ptr<pushback_stream> sock;
        std::string host;
        std::uint16_t port = 0;

        response send_request(const std::string& method, const options& opts, bool with_body);
        response read_response(pushback_stream& s, const std::string& method, const options& opts);
        response handle_redirect(response received, const std::string& method, const options& opts);
        void update_permanent_uri();
        void process_metadata(const response& r);

        public:
        static std::string scheme() { return "http"; }

        // Throws std::invalid_argument when the URI has no authority
        explicit http_client(resource& target);

        void open(const options& opts) override;
        std::string read(std::optional<std::size_t> n) override;
        void close() override;
        bool is_open() const override;

        const redirect_chain& redirect_history() const;
    };
}
#endif
