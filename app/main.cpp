#include "mcpfs/config.hpp"
#include "mcpfs/error.hpp"
#include "mcpfs/log.hpp"
#include "mcpfs/server.hpp"

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {

/// Waits for SIGINT/SIGTERM on a dedicated thread and turns the first one
/// into a server shutdown. Both signals must already be blocked.
class SignalWatcher {
public:
    explicit SignalWatcher(mcpfs::McpServer& server) : server_(server) {
        thread_ = std::thread([this] { run(); });
    }

    ~SignalWatcher() {
        done_ = true;
        ::pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

private:
    void run() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        int sig = 0;
        while (::sigwait(&set, &sig) == 0) {
            if (done_) return;
            mcpfs::log::get("main")->info("received signal {}, shutting down", sig);
            server_.shutdown();
            return;
        }
    }

    mcpfs::McpServer& server_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // anonymous namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::error_code ec;
    const std::string start_dir = std::filesystem::current_path(ec).string();
    if (ec) {
        std::cerr << "Error: cannot determine working directory: " << ec.message() << "\n";
        return 1;
    }

    mcpfs::Config config;
    try {
        config = mcpfs::parse_config(args, mcpfs::process_env(), start_dir);
    } catch (const mcpfs::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << mcpfs::usage_text();
        return 1;
    }
    if (config.show_help) {
        std::cerr << mcpfs::usage_text();
        return 0;
    }

    mcpfs::log::init(config.log_level, [](int status) { std::exit(status); });
    auto logger = mcpfs::log::get("main");
    logger->info("starting {} mode with {} allowed directories",
                 mcpfs::mode_name(config.mode), config.allowed_dirs.size());

    ::signal(SIGPIPE, SIG_IGN);
    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    ::pthread_sigmask(SIG_BLOCK, &blocked, nullptr);

    try {
        mcpfs::McpServer::Options opts;
        opts.config = config;
        opts.start_dir = start_dir;
        mcpfs::McpServer server(std::move(opts));

        SignalWatcher watcher(server);
        server.serve();
    } catch (const mcpfs::ConfigError& e) {
        logger->error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        mcpfs::log::fatal(*logger, "{}", e.what());
        return 1;
    }
    return 0;
}
