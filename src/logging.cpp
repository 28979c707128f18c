#include "logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <mutex>
#include <stdexcept>

namespace logging
{

static std::atomic<int> current_level {static_cast<int>(level::info)};
static std::mutex write_mutex;

static constexpr const char* level_names[] = {"debug", "info", "warn", "error"};

void set_level(level lvl)
{
    current_level.store(static_cast<int>(lvl));
}

level get_level()
{
    return static_cast<level>(current_level.load());
}

level parse_level(std::string_view name)
{
    for(int i = 0; i < 4; ++i)
    {
        if(name == level_names[i])
            return static_cast<level>(i);
    }
    throw std::invalid_argument {fmt::format("Unknown log level \"{}\"", name)};
}

void write(level lvl, std::string_view message)
{
    using namespace std::chrono;

    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local {};
    localtime_r(&t, &local);

    std::lock_guard<std::mutex> lock {write_mutex};
    fmt::print(stderr, "[{:02}:{:02}:{:02}.{:03}] [{}] {}\n", local.tm_hour, local.tm_min, local.tm_sec, ms,
        level_names[static_cast<int>(lvl)], message);
}

} // namespace logging
