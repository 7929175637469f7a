#include "config.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/pipewire_registry.hpp"
#include "platform/platform_paths.hpp"
#include "storage/transcript_archive.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <print>
#include <string>

static int list_devices() {
    PipeWireRegistry registry;
    if (!registry.start()) return 1;

    auto devices = registry.list_devices();
    if (!devices) {
        std::println(stderr, "{}", describe(devices.error()));
        return 1;
    }
    if (devices->empty()) {
        std::println("No input devices found");
        return 0;
    }
    for (auto& d : *devices) {
        std::println("{} {}  {}  ({} ch)", d.is_default ? '*' : ' ', d.id, d.name, d.channels);
    }
    return 0;
}

static int print_history(int limit) {
    auto data = platform::data_dir();
    auto db_path = (data.empty() ? std::string("/tmp/fortis") : data) + "/history.db";

    TranscriptArchive archive;
    if (!archive.open(db_path)) return 1;

    auto entries = archive.recent(limit);
    // Oldest first reads naturally on a terminal.
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        std::println("[{}] {}", it->timestamp, it->text);
    }
    return 0;
}

// The terminal belongs to the renderer while the UI runs.
static bool redirect_stderr(const std::string& path) {
    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);

    if (!std::freopen(path.c_str(), "a", stderr)) {
        std::println("Cannot open log file {}: {}", path, std::strerror(errno));
        return false;
    }
    std::setvbuf(stderr, nullptr, _IOLBF, 0);
    return true;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool show_devices = false;
    int history_limit = 0;
    std::string config_path;
    std::string log_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--log" || arg == "-l") {
            if (i + 1 < argc) log_path = argv[++i];
        } else if (arg == "--list-devices") {
            show_devices = true;
        } else if (arg == "--history") {
            history_limit = 10;
            if (i + 1 < argc && std::isdigit(static_cast<unsigned char>(argv[i + 1][0]))) {
                history_limit = std::atoi(argv[++i]);
            }
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: fortis [options]");
            std::println("Options:");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -l, --log PATH      Log file (default {})", platform::log_path());
            std::println("      --list-devices  List input devices and exit");
            std::println("      --history [N]   Print the last N archived segments and exit");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 2;
        }
    }

    if (show_devices) return list_devices();
    if (history_limit > 0) return print_history(history_limit);

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (log_path.empty()) log_path = platform::log_path();
    if (!redirect_stderr(log_path)) return 1;

    if (verbose) {
        std::println(stderr, "[fortis] Starting ({} @ {}, {} Hz, {} ms chunks)",
                     config.transcriber.provider, config.transcriber.url,
                     config.audio.sample_rate, config.audio.chunk_ms);
    }

    LinuxEventLoop loop(std::move(config), config_path, verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        std::println("fortis: failed to start, see {}", log_path);
        return 1;
    }

    loop.run();
    return 0;
}
