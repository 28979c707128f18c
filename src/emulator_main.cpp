#include <atomic>
#include <csignal>
#include <cstdlib>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "fmt/format.h"

#include "config.hpp"
#include "logging.hpp"
#include "ssdp_responder.hpp"
#include "virtual_renderer.hpp"

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

int main(int argc, char** argv)
{
    sigset_t sigset;
    std::atomic<bool> run_condition {true};
    std::atomic<bool> failed {false};
    block_signals(&sigset);

    config::emulator_config cfg;
    std::string local_ip;
    std::vector<std::unique_ptr<emulator::virtual_renderer>> renderers;
    std::unique_ptr<emulator::ssdp_responder> responder;
    try {
        cfg = config::load_emulator_config((argc > 1) ? argv[1] : "");
        logging::set_level(cfg.log_level);
        if(cfg.speakers.empty())
            throw std::runtime_error {"No speakers configured"};

        local_ip = config::resolve_local_ip(cfg.local_ip);
        logging::info("Local IP: {}", local_ip);

        std::vector<emulator::advertised_device> advertised;
        for(size_t i = 0; i < cfg.speakers.size(); ++i)
        {
            uint16_t port = static_cast<uint16_t>(cfg.base_port + i);
            renderers.push_back(std::make_unique<emulator::virtual_renderer>(cfg.speakers[i], port, cfg.verify, "0.0.0.0", cfg.player));
            advertised.push_back(emulator::advertised_device {cfg.speakers[i], port});
        }
        responder = std::make_unique<emulator::ssdp_responder>(std::move(advertised), local_ip, cfg.discovery);
    } catch(std::exception& e) {
        logging::error("{}", e.what());
        return EXIT_FAILURE;
    }

    fmt::print("Virtual speakers:\n");
    for(const auto& renderer : renderers)
        fmt::print("  - {} on port {}\n", renderer->name(), renderer->port());

    std::future<int> signal_handler = std::async(std::launch::async, [&run_condition, &sigset, &renderers]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        run_condition.store(false);
        logging::info("Shutting down");

        for(const auto& renderer : renderers)
            renderer->wake();

        return signum;
    });

    std::vector<std::thread> worker;
    worker.reserve(renderers.size() + 1);
    for(auto& renderer : renderers)
    {
        worker.emplace_back([&renderer, &run_condition]() {
            logging::info("[{}] HTTP server starting on port {}", renderer->name(), renderer->port());
            renderer->serve(run_condition);
        });
    }
    worker.emplace_back([&responder, &run_condition, &failed]() {
        try {
            responder->serve(run_condition);
        } catch(std::exception& e) {
            // The discovery socket is gone, the emulator is of no use anymore
            logging::error("{}", e.what());
            failed.store(true);
            kill(getpid(), SIGTERM);
        }
    });

    logging::info("Emulator ready");

    signal_handler.get();
    for(auto& t : worker)
        t.join();

    return failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}
