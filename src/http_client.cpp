#include <retrieve/http_client.hpp>
#include <retrieve/content_coding.hpp>
#include <retrieve/error.hpp>
#include <retrieve/options.hpp>
#include <retrieve/request.hpp>
#include <retrieve/resource.hpp>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <boost/scope_exit.hpp>
#include <fmt/format.h>

retrieve::http_client::http_client(resource& target) : client(target) {
    if(!target.current_uri().has_authority || target.current_uri().host.empty()) {
        throw std::invalid_argument(
            fmt::format("Resource cannot be handled by client: '{}'", target.current_uri().str()));
    }
}

void retrieve::http_client::open(const options& opts) {
    if(!retrieve::valid_method(opts.method)) {
        throw std::invalid_argument(fmt::format("Invalid request method: '{}'", opts.method));
    }
    current_response.reset();
    redirects.clear();
    connections = opts.connections ? opts.connections : &private_pool;

    const bool private_connections = opts.connections == nullptr;
    BOOST_SCOPE_EXIT(this_, private_connections) {
        if(private_connections) {
            this_->private_pool.close_all();
        } else {
            BOOST_LOG_TRIVIAL(debug) << "* No connections closed.  Connections must be closed manually.";
        }
    } BOOST_SCOPE_EXIT_END

    current_response = send_request(opts.method, opts, true);
    remaining_body = current_response->body;
    body_offset = 0;
}

retrieve::response retrieve::http_client::send_request(const std::string& method, const options& opts,
                                                       bool with_body) {
    const uri& target = bound_resource().current_uri();
    host = target.host;
    port = target.inferred_port();
    sock = connections->acquire(host, port, opts.connector ? opts.connector : connector{tcp_connect},
                                opts.timeout);

    request req = make_request(target, method, opts, with_body);
    std::string bytes = encode_request(req);
    BOOST_LOG_TRIVIAL(trace) << "> " << req.method << " " << req.target << " HTTP/1.1";
    for(const auto& [name, value] : req.headers.items()) {
        BOOST_LOG_TRIVIAL(trace) << "> " << name << ": " << value;
    }
    response received;
    try {
        sock->write(bytes);
        sock->flush();
        received = read_response(*sock, req.method, opts);
    } catch (...) {
        // The stream may still hold part of this response, or all of it later
        connections->evict(host, port);
        throw;
    }
    process_metadata(received);
    if(received.headers.contains_token("Connection", "close")) {
        connections->evict(host, port);
    }
    if(status_class(received, '2')) {
        update_permanent_uri();
    } else if(status_class(received, '3')) {
        return handle_redirect(std::move(received), req.method, opts);
    }
    return received;
}

retrieve::response retrieve::http_client::read_response(pushback_stream& s, const std::string& method,
                                                        const options& opts) {
    if(!s.wait_readable(opts.timeout)) {
        BOOST_LOG_TRIVIAL(error) << "* Timeout waiting for the server to respond.";
        throw retrieve::timeout_error("Timeout waiting for the server to respond.");
    }
    response received;
    response_parser parser{s, received, method != "HEAD"};
    parser.run();
    if(opts.decode_content && received.headers.contains_token("Content-Encoding", "gzip")) {
        received.body = gzip_decode(received.body);
    }
    if(received.body.empty()) {
        BOOST_LOG_TRIVIAL(debug) << "* No response body.";
    } else {
        BOOST_LOG_TRIVIAL(debug) << "* Response body omitted from log (" << received.body.size() << " bytes).";
    }
    return received;
}

retrieve::response retrieve::http_client::handle_redirect(response received, const std::string& method,
                                                          const options& opts) {
    const redirect_action action = action_for(received.status);
    if(action == redirect_action::none || !opts.redirect.should_follow(received)) {
        return received;
    }
    if(redirects.size() >= opts.max_redirects) {
        BOOST_LOG_TRIVIAL(error) << "* Giving up after " << redirects.size() << " redirects.";
        throw retrieve::too_many_redirects(fmt::format("More than {} redirects.", opts.max_redirects));
    }
    const uri& requested = bound_resource().current_uri();
    uri next = redirect_target(requested, received);
    if(!retrieve::iequals(next.scheme, scheme()) || next.host.empty()) {
        throw retrieve::client_error(fmt::format("Cannot follow redirect to '{}'", next.str()));
    }
    BOOST_LOG_TRIVIAL(debug) << "* Following " << received.status << " redirect to " << next.str();
    redirects.push_back({requested, std::move(received)});
    set_uri(next);
    if(action == redirect_action::reissue_as_get) {
        return send_request("GET", opts, false);
    }
    return send_request(method, opts, true);
}

void retrieve::http_client::update_permanent_uri() {
    if(auto permanent = permanent_uri_for(redirects)) {
        set_permanent_uri(*permanent);
    }
}

void retrieve::http_client::process_metadata(const response& r) {
    set_metadata("http_version", r.http_version);
    set_metadata("status", r.status);
    set_metadata("reason", r.reason);
    set_metadata("headers", r.headers);
}

std::string retrieve::http_client::read(std::optional<std::size_t> n) {
    if(!current_response) {
        throw retrieve::usage_error("No response available.");
    }
    std::string data = remaining_body.substr(body_offset, n ? *n : std::string::npos);
    body_offset += data.size();
    return data;
}

// A caller's pool keeps the connection; a private one has already closed it
void retrieve::http_client::close() {
    if(!current_response) {
        throw retrieve::usage_error("No stream to close.");
    }
    sock.reset();
    current_response.reset();
    remaining_body.clear();
    body_offset = 0;
}

bool retrieve::http_client::is_open() const {
    return current_response.has_value();
}

const retrieve::redirect_chain& retrieve::http_client::redirect_history() const {
    return redirects;
}
