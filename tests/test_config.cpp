#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "fortis_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        std::ofstream(path) << content;
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Restores DEEPGRAM_API_KEY on scope exit.
struct EnvGuard {
    std::string saved;
    bool had = false;

    explicit EnvGuard(const char* value) {
        if (const char* v = std::getenv("DEEPGRAM_API_KEY")) {
            saved = v;
            had = true;
        }
        if (value) setenv("DEEPGRAM_API_KEY", value, 1);
        else unsetenv("DEEPGRAM_API_KEY");
    }

    ~EnvGuard() {
        if (had) setenv("DEEPGRAM_API_KEY", saved.c_str(), 1);
        else unsetenv("DEEPGRAM_API_KEY");
    }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.transcriber.provider == "deepgram");
        REQUIRE(cfg.transcriber.url == "wss://api.deepgram.com/v1/listen");
        REQUIRE(cfg.transcriber.language == "en-US");
        REQUIRE(cfg.transcriber.model == "nova-2");
        REQUIRE(cfg.transcriber.keepalive_seconds == 3);
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.channels == 1);
        REQUIRE(cfg.audio.chunk_ms == 100);
        REQUIRE(cfg.audio.queue_capacity() == 40);
        REQUIRE(cfg.audio.ring_buffer_bytes() == 16000 * sizeof(int16_t));
        REQUIRE(cfg.reconnect.base_ms == 1000);
        REQUIRE(cfg.reconnect.cap_ms == 30000);
        REQUIRE(cfg.reconnect.jitter == 0.2);
        REQUIRE(cfg.reconnect.max_attempts == 10);
        REQUIRE(cfg.ui.theme == "blue");
        REQUIRE(cfg.history.enabled);
    }

    SECTION("LoadFullConfig") {
        EnvGuard env(nullptr);
        TmpFile f(R"({
            "transcriber": {
                "url": "wss://10.0.0.1:9090/listen",
                "api_key": "abc123",
                "language": "de",
                "model": "base",
                "interim_results": false,
                "keepalive_seconds": 5,
                "connect_timeout_ms": 2500
            },
            "audio": { "device": "alsa_input.usb", "sample_rate": 48000, "channels": 2,
                       "chunk_ms": 50, "queue_seconds": 2 },
            "reconnect": { "base_ms": 500, "cap_ms": 8000, "jitter": 0.1, "max_attempts": 4 },
            "ui": { "theme": "green", "refresh_ms": 50, "auto_scroll": false },
            "history": { "enabled": false }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcriber.url == "wss://10.0.0.1:9090/listen");
        REQUIRE(cfg.transcriber.api_key == "abc123");
        REQUIRE(cfg.transcriber.language == "de");
        REQUIRE(cfg.transcriber.model == "base");
        REQUIRE_FALSE(cfg.transcriber.interim_results);
        REQUIRE(cfg.transcriber.keepalive_seconds == 5);
        REQUIRE(cfg.transcriber.connect_timeout_ms == 2500);
        REQUIRE(cfg.audio.device == "alsa_input.usb");
        REQUIRE(cfg.audio.sample_rate == 48000);
        REQUIRE(cfg.audio.channels == 2);
        REQUIRE(cfg.audio.queue_capacity() == 40);
        REQUIRE(cfg.audio.format().chunk_samples() == 48000 * 2 * 50 / 1000);
        REQUIRE(cfg.reconnect.base_ms == 500);
        REQUIRE(cfg.reconnect.cap_ms == 8000);
        REQUIRE(cfg.reconnect.jitter == 0.1);
        REQUIRE(cfg.reconnect.max_attempts == 4);
        REQUIRE(cfg.ui.theme == "green");
        REQUIRE(cfg.ui.refresh_ms == 50);
        REQUIRE_FALSE(cfg.ui.auto_scroll);
        REQUIRE_FALSE(cfg.history.enabled);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "transcriber": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcriber.language == "fr");
        REQUIRE(cfg.transcriber.model == "nova-2");
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.ui.theme == "blue");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcriber.provider == "deepgram");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/fortis_test_nonexistent_config_file.json");
        REQUIRE(cfg.transcriber.model == "nova-2");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("JitterIsClamped") {
        TmpFile f(R"({ "reconnect": { "jitter": 3.5 } })");
        REQUIRE(Config::load(f.path).reconnect.jitter == 1.0);

        TmpFile g(R"({ "reconnect": { "jitter": -1 } })");
        REQUIRE(Config::load(g.path).reconnect.jitter == 0.0);
    }

    SECTION("ApiKeyFallsBackToEnvironment") {
        EnvGuard env("from-env");
        TmpFile f(R"({ "transcriber": { "model": "nova-3" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcriber.api_key == "from-env");
    }

    SECTION("FileKeyWinsOverEnvironment") {
        EnvGuard env("from-env");
        TmpFile f(R"({ "transcriber": { "api_key": "from-file" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcriber.api_key == "from-file");
    }

    SECTION("SettingsRequireKeyLanguageModel") {
        Config cfg;
        auto s = cfg.settings();
        REQUIRE_FALSE(s);
        REQUIRE(s.error().kind == ErrorKind::ConfigIncomplete);
        REQUIRE(s.error().message.find("api_key") != std::string::npos);
        REQUIRE(describe(s.error()).starts_with("settings required"));

        cfg.transcriber.api_key = "k";
        cfg.transcriber.language = "  ";
        s = cfg.settings();
        REQUIRE_FALSE(s);
        REQUIRE(s.error().message.find("language") != std::string::npos);

        cfg.transcriber.language = "en";
        s = cfg.settings();
        REQUIRE(s);
        REQUIRE(s->api_key == "k");
        REQUIRE(s->language == "en");
        REQUIRE(s->model == "nova-2");
    }
}
