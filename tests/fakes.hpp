#pragma once

#include "platform/audio_capture.hpp"
#include "platform/device_registry.hpp"
#include "ring_buffer.hpp"
#include "stt/transcriber.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// Stands in for the hardware: feed() plays the part of the real-time
// callback and only delivers while the device is open.
class FakeAudioCapture : public AudioCapture {
public:
    explicit FakeAudioCapture(RingBuffer& ring) : ring_(ring) {}

    std::expected<void, Error> open(const DeviceDescriptor& device,
                                    const CaptureFormat&) override {
        std::lock_guard lock(mutex_);
        ++opens_;
        if (fail_open) {
            return std::unexpected(Error{ErrorKind::DeviceOpen, "permission denied"});
        }
        device_id_ = device.id;
        capturing_ = true;
        return {};
    }

    void close() override { capturing_ = false; }
    bool is_capturing() const override { return capturing_; }

    bool feed(const std::vector<int16_t>& samples) {
        if (!capturing_) return false;
        size_t bytes = samples.size() * sizeof(int16_t);
        return ring_.write(samples.data(), bytes) == bytes;
    }

    std::string device_id() const {
        std::lock_guard lock(mutex_);
        return device_id_;
    }

    int opens() const {
        std::lock_guard lock(mutex_);
        return opens_;
    }

    std::atomic<bool> fail_open{false};

private:
    RingBuffer& ring_;
    mutable std::mutex mutex_;
    std::atomic<bool> capturing_{false};
    std::string device_id_;
    int opens_ = 0;
};

class FakeRegistry : public DeviceRegistry {
public:
    explicit FakeRegistry(std::vector<DeviceDescriptor> devices) : devices_(std::move(devices)) {}

    std::expected<std::vector<DeviceDescriptor>, Error> list_devices() override {
        std::lock_guard lock(mutex_);
        return devices_;
    }

    std::optional<DeviceDescriptor> default_device() override {
        std::lock_guard lock(mutex_);
        auto it = std::ranges::find_if(devices_, [](auto& d) { return d.is_default; });
        if (it != devices_.end()) return *it;
        if (devices_.empty()) return std::nullopt;
        return devices_.front();
    }

    void set_removed_callback(RemovedCallback cb) override {
        std::lock_guard lock(mutex_);
        removed_cb_ = std::move(cb);
    }

    void remove(const std::string& id) {
        RemovedCallback cb;
        {
            std::lock_guard lock(mutex_);
            std::erase_if(devices_, [&id](auto& d) { return d.id == id; });
            cb = removed_cb_;
        }
        if (cb) cb(id);
    }

private:
    std::mutex mutex_;
    std::vector<DeviceDescriptor> devices_;
    RemovedCallback removed_cb_;
};

// Provider state shared by every FakeTranscriber a factory hands out, so a
// test can script the remote end across reconnects.
struct FakeProvider {
    std::mutex mutex;
    std::vector<std::vector<int16_t>> audio;
    std::deque<std::expected<void, Error>> connect_results;  // empty = accept
    std::deque<ProviderResult> results;
    std::string finalize_text;  // transcript of the answer to finalize()
    int fail_sends = 0;         // audio sends that drop the stream
    int connects = 0;
    int finalizes = 0;
    int keepalives = 0;
    int closes = 0;
    bool connected = false;
    bool drop = false;

    void push_result(std::string text, bool is_final) {
        std::lock_guard lock(mutex);
        results.push_back({std::move(text), is_final, false});
    }

    void fail_next_send() {
        std::lock_guard lock(mutex);
        ++fail_sends;
    }

    void fail_next_connect(Error err) {
        std::lock_guard lock(mutex);
        connect_results.push_back(std::unexpected(std::move(err)));
    }

    void disconnect() {
        std::lock_guard lock(mutex);
        drop = true;
    }

    size_t audio_count() {
        std::lock_guard lock(mutex);
        return audio.size();
    }

    template <typename T>
    T read(T FakeProvider::*field) {
        std::lock_guard lock(mutex);
        return this->*field;
    }
};

class FakeTranscriber : public StreamingTranscriber {
public:
    explicit FakeTranscriber(std::shared_ptr<FakeProvider> provider)
        : provider_(std::move(provider)) {}

    std::expected<void, Error> connect(const Settings&, const CaptureFormat&) override {
        std::lock_guard lock(provider_->mutex);
        ++provider_->connects;
        if (!provider_->connect_results.empty()) {
            auto res = provider_->connect_results.front();
            provider_->connect_results.pop_front();
            if (!res) return res;
        }
        provider_->connected = true;
        provider_->drop = false;
        return {};
    }

    std::expected<void, Error> send_audio(std::span<const int16_t> samples) override {
        std::lock_guard lock(provider_->mutex);
        if (!provider_->connected) return down();
        if (provider_->fail_sends > 0) {
            --provider_->fail_sends;
            provider_->connected = false;
            return std::unexpected(Error{ErrorKind::Disconnected, "connection reset"});
        }
        provider_->audio.emplace_back(samples.begin(), samples.end());
        return {};
    }

    std::expected<void, Error> finalize() override {
        std::lock_guard lock(provider_->mutex);
        if (!provider_->connected) return down();
        ++provider_->finalizes;
        provider_->results.push_back({provider_->finalize_text, true, true});
        return {};
    }

    std::expected<void, Error> keep_alive() override {
        std::lock_guard lock(provider_->mutex);
        if (!provider_->connected) return down();
        ++provider_->keepalives;
        return {};
    }

    std::expected<std::optional<ProviderResult>, Error>
    receive(std::chrono::milliseconds) override {
        std::lock_guard lock(provider_->mutex);
        if (provider_->drop) {
            provider_->drop = false;
            provider_->connected = false;
            return std::unexpected(Error{ErrorKind::Disconnected, "stream closed by provider"});
        }
        if (!provider_->connected) {
            return std::unexpected(Error{ErrorKind::Disconnected, "not connected"});
        }
        if (provider_->results.empty()) return std::nullopt;
        auto result = provider_->results.front();
        provider_->results.pop_front();
        return result;
    }

    void close() override {
        std::lock_guard lock(provider_->mutex);
        provider_->connected = false;
        ++provider_->closes;
    }

private:
    static std::expected<void, Error> down() {
        return std::unexpected(Error{ErrorKind::Disconnected, "not connected"});
    }

    std::shared_ptr<FakeProvider> provider_;
};

inline TranscriberFactory fake_factory(std::shared_ptr<FakeProvider> provider) {
    return [provider]() -> std::unique_ptr<StreamingTranscriber> {
        return std::make_unique<FakeTranscriber>(provider);
    };
}
