#ifndef ZONE_ANNOUNCE_TTS_HPP
#define ZONE_ANNOUNCE_TTS_HPP

#include <string>

#include "announcer.hpp"

namespace tts
{

#define TTS_COMMAND "espeak-ng -w {output} {text}"

// Renders text by running an external command such as "espeak-ng -w {output} {text}"
class command_producer : public announce::audio_producer
{
public:

    /// The template needs an {output} and a {text} placeholder, text gets shell-quoted
    command_producer(std::string command_template, std::string output_dir, std::string extension);

    std::string produce_audio(const std::string& text) override;

private:

    std::string m_command;

    std::string m_output_dir;

    std::string m_extension;

};

} // namespace tts

#endif
