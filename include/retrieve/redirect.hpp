#ifndef RETRIEVE_REDIRECT_HPP_INCLUDED
#define RETRIEVE_REDIRECT_HPP_INCLUDED
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <retrieve/response.hpp>
#include <retrieve/uri.hpp>
namespace retrieve {
    // Follow every redirect, none, or ask a predicate per response
    class redirect_policy {
        enum class mode { always, never, ask };
        mode how;
        std::function<bool(const response&)> decide;

        public:
        redirect_policy(bool follow = true) : how(follow ? mode::always : mode::never) {}

        template<typename F,
                 typename = std::enable_if_t<std::is_invocable_r_v<bool, F, const response&>>>
        redirect_policy(F predicate) : how(mode::ask), decide(std::move(predicate)) {}

        bool should_follow(const response& r) const;
    };

    enum class redirect_action {
        none,
        reissue,
        reissue_as_get
    };

    redirect_action action_for(const std::string& status);

    struct redirect_step {
        uri requested;
        response received;
    };
    using redirect_chain = std::vector<redirect_step>;

    // Location of a redirect response, resolved against the URI it answered.
    // Throws parse_error when there is no Location.
    uri redirect_target(const uri& requested, const response& received);

    // Target of the last redirect in the chain's leading run of 301s
    std::optional<uri> permanent_uri_for(const redirect_chain& chain);
}
#endif
