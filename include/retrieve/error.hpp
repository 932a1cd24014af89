#ifndef RETRIEVE_ERROR_HPP_INCLUDED
#define RETRIEVE_ERROR_HPP_INCLUDED
#include <stdexcept>
namespace retrieve {
    void check_error(int return_val);

    // Base of every failure raised while talking to a server
    struct client_error : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };
    struct parse_error : public client_error {
        using client_error::client_error;
    };
    struct premature_close : public client_error {
        using client_error::client_error;
    };
    struct timeout_error : public client_error {
        using client_error::client_error;
    };
    struct too_many_redirects : public client_error {
        using client_error::client_error;
    };

    struct invalid_uri : public std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };
    struct no_client_error : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };
    struct usage_error : public std::logic_error {
        using std::logic_error::logic_error;
    };
    struct unsupported_operation : public std::logic_error {
        using std::logic_error::logic_error;
    };
}
#endif
