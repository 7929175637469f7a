#pragma once

#include "audio_chunk.hpp"
#include "config.hpp"
#include "stt/transcriber.hpp"

#include <optional>
#include <string>
#include <string_view>

// Message formats of the Deepgram live transcription API.
namespace deepgram {

inline constexpr std::string_view kKeepAlive = R"({"type":"KeepAlive"})";
inline constexpr std::string_view kFinalize = R"({"type":"Finalize"})";
inline constexpr std::string_view kCloseStream = R"({"type":"CloseStream"})";

std::string listen_url(const Settings& settings, const CaptureFormat& format);

// Results messages become a ProviderResult; metadata, speech-start and
// utterance-end messages, and anything unparsable, yield nothing.
std::optional<ProviderResult> parse_message(std::string_view payload);

// Error description from an error message, empty if it isn't one.
std::string parse_error(std::string_view payload);

} // namespace deepgram
