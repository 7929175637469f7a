#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

void apply_env(Config& cfg) {
    if (!trim(cfg.transcriber.api_key).empty()) return;
    const char* key = std::getenv("DEEPGRAM_API_KEY");
    if (key) cfg.transcriber.api_key = key;
}

} // namespace

std::expected<Settings, Error> Config::settings() const {
    Settings s{
        .api_key = trim(transcriber.api_key),
        .language = trim(transcriber.language),
        .model = trim(transcriber.model),
        .url = trim(transcriber.url),
        .interim_results = transcriber.interim_results,
        .keepalive_seconds = transcriber.keepalive_seconds,
        .connect_timeout_ms = transcriber.connect_timeout_ms,
    };

    std::string missing;
    auto need = [&missing](const std::string& v, const char* name) {
        if (!v.empty()) return;
        if (!missing.empty()) missing += ", ";
        missing += name;
    };
    need(s.api_key, "api_key");
    need(s.language, "language");
    need(s.model, "model");
    need(s.url, "url");

    if (!missing.empty()) {
        return std::unexpected(Error{ErrorKind::ConfigIncomplete, "missing " + missing});
    }
    return s;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        apply_env(cfg);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("transcriber")) {
            auto& t = j["transcriber"];
            if (t.contains("provider")) cfg.transcriber.provider = t["provider"].get<std::string>();
            if (t.contains("url")) cfg.transcriber.url = t["url"].get<std::string>();
            if (t.contains("api_key")) cfg.transcriber.api_key = t["api_key"].get<std::string>();
            if (t.contains("language")) cfg.transcriber.language = t["language"].get<std::string>();
            if (t.contains("model")) cfg.transcriber.model = t["model"].get<std::string>();
            if (t.contains("interim_results")) cfg.transcriber.interim_results = t["interim_results"].get<bool>();
            if (t.contains("keepalive_seconds")) cfg.transcriber.keepalive_seconds = t["keepalive_seconds"].get<uint32_t>();
            if (t.contains("connect_timeout_ms")) cfg.transcriber.connect_timeout_ms = t["connect_timeout_ms"].get<uint32_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("device")) cfg.audio.device = a["device"].get<std::string>();
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("channels")) cfg.audio.channels = a["channels"].get<uint32_t>();
            if (a.contains("chunk_ms")) cfg.audio.chunk_ms = a["chunk_ms"].get<uint32_t>();
            if (a.contains("queue_seconds")) cfg.audio.queue_seconds = a["queue_seconds"].get<uint32_t>();
        }

        if (j.contains("reconnect")) {
            auto& r = j["reconnect"];
            if (r.contains("base_ms")) cfg.reconnect.base_ms = r["base_ms"].get<uint32_t>();
            if (r.contains("cap_ms")) cfg.reconnect.cap_ms = r["cap_ms"].get<uint32_t>();
            if (r.contains("jitter")) cfg.reconnect.jitter = std::clamp(r["jitter"].get<double>(), 0.0, 1.0);
            if (r.contains("max_attempts")) cfg.reconnect.max_attempts = r["max_attempts"].get<uint32_t>();
        }

        if (j.contains("ui")) {
            auto& u = j["ui"];
            if (u.contains("theme")) cfg.ui.theme = u["theme"].get<std::string>();
            if (u.contains("refresh_ms")) cfg.ui.refresh_ms = u["refresh_ms"].get<uint32_t>();
            if (u.contains("auto_scroll")) cfg.ui.auto_scroll = u["auto_scroll"].get<bool>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    apply_env(cfg);
    return cfg;
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}

Config Config::load_default() {
    auto path = default_path();
    if (!path.empty() && fs::exists(path)) {
        return load(path);
    }
    Config cfg;
    apply_env(cfg);
    return cfg;
}
