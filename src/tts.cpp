#include "tts.hpp"

#include "logging.hpp"
#include "utils.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include "fmt/format.h"

namespace tts
{

command_producer::command_producer(std::string command_template, std::string output_dir, std::string extension)
    : m_command {std::move(command_template)},
      m_output_dir {std::move(output_dir)},
      m_extension {std::move(extension)}
{
    if(m_command.find("{output}") == std::string::npos || m_command.find("{text}") == std::string::npos)
        throw std::invalid_argument {"Text to speech command needs {output} and {text} placeholders"};

    std::filesystem::create_directories(m_output_dir);
}

std::string command_producer::produce_audio(const std::string& text)
{
    using namespace std::chrono;

    // Nanosecond timestamps keep concurrent announcements apart
    auto stamp = duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
    std::string path = (std::filesystem::path {m_output_dir} / fmt::format("{}.{}", stamp, m_extension)).string();

    std::string cmd = fmt::format(fmt::runtime(m_command),
        fmt::arg("output", utils::shell_quote(path)),
        fmt::arg("text", utils::shell_quote(text)));
    logging::debug("[tts] {}", cmd);

    utils::run_command(cmd);

    std::error_code ec;
    if(!std::filesystem::exists(path, ec))
        throw std::runtime_error {fmt::format("Text to speech command did not create {}", path)};

    return path;
}

} // namespace tts
