#include "stt/deepgram_protocol.hpp"

#include <cctype>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace deepgram {

namespace {

std::string url_encode(std::string_view s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += std::format("%{:02X}", c);
        }
    }
    return out;
}

} // namespace

std::string listen_url(const Settings& settings, const CaptureFormat& format) {
    std::string url = settings.url;
    url += url.find('?') == std::string::npos ? '?' : '&';
    url += std::format("encoding=linear16&sample_rate={}&channels={}", format.sample_rate,
                       format.channels);
    url += "&language=" + url_encode(settings.language);
    url += "&model=" + url_encode(settings.model);
    url += settings.interim_results ? "&interim_results=true" : "&interim_results=false";
    url += "&punctuate=true";
    return url;
}

std::optional<ProviderResult> parse_message(std::string_view payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    if (j.value("type", "") != "Results") return std::nullopt;

    try {
        auto& alternatives = j.at("channel").at("alternatives");
        if (!alternatives.is_array() || alternatives.empty()) return std::nullopt;

        return ProviderResult{
            .text = alternatives[0].value("transcript", ""),
            .is_final = j.value("is_final", false),
            .from_finalize = j.value("from_finalize", false),
        };
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string parse_error(std::string_view payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return {};

    auto type = j.value("type", "");
    if (type != "Error" && !j.contains("err_code")) return {};

    if (j.contains("description") && j["description"].is_string()) {
        return j["description"].get<std::string>();
    }
    if (j.contains("err_msg") && j["err_msg"].is_string()) {
        return j["err_msg"].get<std::string>();
    }
    return "provider error";
}

} // namespace deepgram
