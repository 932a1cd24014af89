#include <retrieve/retrieve.hpp>
#include <retrieve/worker_pool.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace logging = boost::log;

struct fetch_result {
    std::optional<std::string> status_line;
    std::string body;
    std::string error;
};

// One per worker thread, so each thread reuses its own connections
struct fetcher {
    retrieve::connection_pool connections;

    void operator()(std::string location, retrieve::options opts, fetch_result* result) {
        opts.connections = &connections;
        try {
            auto r = retrieve::open(location, opts);
            if(auto status = r->metadata_text("status")) {
                result->status_line = fmt::format("{} {} {} ({})", r->metadata_text("http_version").value_or(""),
                                                  *status, r->metadata_text("reason").value_or(""),
                                                  r->current_uri().str());
            }
            result->body = r->read();
            r->close();
        } catch (const std::exception& err) {
            BOOST_LOG_TRIVIAL(error) << location << ": " << err.what();
            result->error = err.what();
        }
    }
};

static void usage() {
    std::cerr << "usage: retrieve-fetch [-v|-vv] [-I] [--no-redirect] [-j N] URI...\n";
}

int main(int argc, char** argv) {
    // Ignore "broken pipe" signals (ie unexpected socket closures)
    signal(SIGPIPE, SIG_IGN);

    auto level = logging::trivial::info;
    retrieve::options opts;
    std::size_t n_threads = 4;
    std::vector<std::string> locations;
    for(int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if(arg == "-v")                 level = logging::trivial::debug;
        else if(arg == "-vv")           level = logging::trivial::trace;
        else if(arg == "-I")            opts.method = "HEAD";
        else if(arg == "--no-redirect") opts.redirect = false;
        else if(arg == "--gzip")        opts.decode_content = true;
        else if(arg == "-j" && i + 1 < argc) n_threads = std::strtoul(argv[++i], nullptr, 10);
        else if(!arg.empty() && arg.front() == '-') { usage(); return 2; }
        else locations.push_back(arg);
    }
    if(locations.empty() || n_threads == 0) {
        usage();
        return 2;
    }
    logging::core::get()->set_filter(logging::trivial::severity >= level);

    retrieve::register_default_clients();
    std::vector<fetch_result> results(locations.size());
    {
        retrieve::worker_pool<fetcher> workers{std::min(n_threads, locations.size())};
        for(std::size_t i = 0; i < locations.size(); i++) {
            workers.post_task(locations[i], opts, &results[i]);
        }
        workers.finish_all();
    }

    int exit_code = 0;
    for(std::size_t i = 0; i < locations.size(); i++) {
        const auto& result = results[i];
        if(!result.error.empty()) {
            std::cerr << locations[i] << ": " << result.error << "\n";
            exit_code = 1;
            continue;
        }
        if(result.status_line) std::cerr << *result.status_line << "\n";
        std::cout << result.body;
    }
    return exit_code;
}
