#pragma once

#include "audio_chunk.hpp"
#include "error.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <string>

// What a transcription session needs to open. Produced from Config.
struct Settings {
    std::string api_key;
    std::string language;
    std::string model;
    std::string url;
    bool interim_results = true;
    uint32_t keepalive_seconds = 3;
    uint32_t connect_timeout_ms = 10000;
};

struct Config {
    struct Transcriber {
        std::string provider = "deepgram";
        std::string url = "wss://api.deepgram.com/v1/listen";
        std::string api_key;  // falls back to $DEEPGRAM_API_KEY
        std::string language = "en-US";
        std::string model = "nova-2";
        bool interim_results = true;
        uint32_t keepalive_seconds = 3;
        uint32_t connect_timeout_ms = 10000;
    } transcriber;

    struct Audio {
        std::string device;  // node name; empty = default source
        uint32_t sample_rate = 16000;
        uint32_t channels = 1;
        uint32_t chunk_ms = 100;
        uint32_t queue_seconds = 4;

        CaptureFormat format() const { return {sample_rate, channels, chunk_ms}; }

        // Computed (no independent config keys).
        size_t queue_capacity() const {
            return chunk_ms == 0 ? 1 : std::max<size_t>(1, queue_seconds * 1000 / chunk_ms);
        }
        size_t ring_buffer_bytes() const {
            // One second of headroom between the callback and the framer.
            return static_cast<size_t>(sample_rate) * channels * sizeof(int16_t);
        }
    } audio;

    struct Reconnect {
        uint32_t base_ms = 1000;
        uint32_t cap_ms = 30000;
        double jitter = 0.2;
        uint32_t max_attempts = 10;
    } reconnect;

    struct Ui {
        std::string theme = "blue";
        uint32_t refresh_ms = 100;
        bool auto_scroll = true;
    } ui;

    struct History {
        bool enabled = true;
    } history;

    // ConfigIncomplete when the key, language or model is missing.
    std::expected<Settings, Error> settings() const;

    static Config load(const std::string& path);
    static Config load_default();
    static std::string default_path();
};
