#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "fmt/format.h"

#include "socketwrapper.hpp"

#include "announcer.hpp"
#include "api_server.hpp"
#include "config.hpp"
#include "console.hpp"
#include "device_registry.hpp"
#include "logging.hpp"
#include "media_renderer.hpp"
#include "tts.hpp"

#include "http/webserver.hpp"

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

int main(int argc, char** argv)
{
    config::gateway_config cfg;
    std::string local_ip;
    try {
        cfg = config::load_gateway_config((argc > 1) ? argv[1] : "");
        logging::set_level(cfg.log_level);
        local_ip = config::resolve_local_ip(cfg.local_ip);
    } catch(std::exception& e) {
        logging::error("{}", e.what());
        return EXIT_FAILURE;
    }
    logging::info("Local IP: {}", local_ip);

    sigset_t sigset;
    std::atomic<bool> run_condition {true};
    block_signals(&sigset);
    std::vector<uint16_t> server_ports {cfg.media.port};
    if(cfg.api.enabled)
        server_ports.push_back(cfg.api.port);

    std::future<int> signal_handler = std::async(std::launch::async, [&run_condition, &sigset, server_ports]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        run_condition.store(false);
        fmt::print("Shutting down...\n");

        // Stop waiting for accept in the file and api servers
        for(uint16_t port : server_ports)
        {
            try {
                net::tcp_connection<net::ip_version::v4> sock {"127.0.0.1", port};
            } catch(std::runtime_error& err) {}
        }

        return signum;
    });

    upnp::device_registry registry;
    upnp::media_renderer control {cfg.control};
    std::unique_ptr<tts::command_producer> producer;
    try {
        producer = std::make_unique<tts::command_producer>(cfg.tts.command, cfg.media.root, cfg.tts.extension);
    } catch(std::exception& e) {
        logging::error("{}", e.what());
        run_condition.store(false);
        kill(getpid(), SIGTERM);
        signal_handler.get();
        return EXIT_FAILURE;
    }

    announce::announcer announcer {registry, control, *producer, fmt::format("http://{}:{}", local_ip, cfg.media.port)};
    announcer.set_allowed_sender(cfg.allowed_sender);

    const char* user = std::getenv("USER");
    console::front_end cli {announcer, cfg.discovery, (user != nullptr) ? user : ""};

    std::vector<std::thread> worker;
    worker.emplace_back([&cfg, &run_condition]() {
        try {
            http::serve_directory(cfg.media.root, "0.0.0.0", cfg.media.port, run_condition);
        } catch(std::exception& e) {
            logging::error("File server error: {}", e.what());
            kill(getpid(), SIGTERM);
        }
    });

    if(cfg.api.enabled)
    {
        worker.emplace_back([&announcer, &cfg, &run_condition]() {
            try {
                api::serve_api(announcer, "0.0.0.0", cfg.api.port, run_condition);
            } catch(std::exception& e) {
                logging::error("API server error: {}", e.what());
                kill(getpid(), SIGTERM);
            }
        });
    }

    cli.handle_line("/rescan");
    cli.print_usage();
    std::fflush(stdout);
    logging::info("Gateway ready");

    worker.emplace_back([&cli, &run_condition]() {
        cli.run(STDIN_FILENO, run_condition);
    });

    // Wait for signal and shut down all threads
    signal_handler.get();
    for(auto& t : worker)
        t.join();

    return EXIT_SUCCESS;
}
