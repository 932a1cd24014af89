#include <retrieve/redirect.hpp>
#include <retrieve/error.hpp>
#include <fmt/format.h>

bool retrieve::redirect_policy::should_follow(const response& r) const {
    switch(how) {
    case mode::always: return true;
    case mode::never:  return false;
    case mode::ask:    return decide(r);
    }
    return false;
}

retrieve::redirect_action retrieve::action_for(const std::string& status) {
    if(status == "301" || status == "302" || status == "307") return redirect_action::reissue;
    else if(status == "303") return redirect_action::reissue_as_get;
    // 300 leaves the choice to the caller, 305 needs a proxy
    else return redirect_action::none;
}

retrieve::uri retrieve::redirect_target(const uri& requested, const response& received) {
    auto location = received.headers.get("Location");
    if(!location || location->empty()) {
        throw retrieve::parse_error(fmt::format("Redirect ({}) without a Location header.", received.status));
    }
    try {
        return requested.resolve(*location);
    } catch (const retrieve::invalid_uri& err) {
        throw retrieve::parse_error(fmt::format("Invalid Location header: {}", err.what()));
    }
}

std::optional<retrieve::uri> retrieve::permanent_uri_for(const redirect_chain& chain) {
    std::optional<uri> permanent;
    for(const auto& step : chain) {
        if(step.received.status != "301") break;
        permanent = redirect_target(step.requested, step.received);
    }
    return permanent;
}
