#include "soundkeys/audio/AudioEngine.hpp"

#include <cstdint>
#include <format>
#include <memory>
#include <utility>

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

namespace soundkeys::audio {

struct AudioEngine::Impl {
    ma_engine engine{};
    uint32_t sample_rate = 48000;
    bool initialized = false;
};

namespace {

std::string describe(ma_result result) {
    return ma_result_description(result);
}

class MiniaudioSound final : public SoundHandle {
public:
    explicit MiniaudioSound(std::filesystem::path path) : path_(std::move(path)) {}

    ~MiniaudioSound() override {
        if (initialized_) {
            ma_sound_uninit(&sound_);
        }
    }

    MiniaudioSound(const MiniaudioSound&) = delete;
    MiniaudioSound& operator=(const MiniaudioSound&) = delete;

    ma_result init(ma_engine& engine) {
        // Decode fully in the background so restarts never hit the disk.
        const ma_uint32 flags = MA_SOUND_FLAG_DECODE | MA_SOUND_FLAG_ASYNC;
        const ma_result result =
            ma_sound_init_from_file(&engine, path_.string().c_str(), flags, nullptr, nullptr, &sound_);
        initialized_ = (result == MA_SUCCESS);
        return result;
    }

    const std::filesystem::path& path() const override { return path_; }

    std::expected<void, std::string> play() override {
        if (!initialized_) {
            return std::unexpected(std::format("'{}' is not open", path_.filename().string()));
        }
        if (const ma_result result = ma_sound_start(&sound_); result != MA_SUCCESS) {
            return std::unexpected(std::format("Failed to play '{}': {}", path_.filename().string(), describe(result)));
        }
        return {};
    }

    std::expected<void, std::string> stop() override {
        if (!initialized_) {
            return std::unexpected(std::format("'{}' is not open", path_.filename().string()));
        }
        if (const ma_result result = ma_sound_stop(&sound_); result != MA_SUCCESS) {
            return std::unexpected(std::format("Failed to stop '{}': {}", path_.filename().string(), describe(result)));
        }
        return {};
    }

    std::expected<void, std::string> seek(double seconds) override {
        if (!initialized_) {
            return std::unexpected(std::format("'{}' is not open", path_.filename().string()));
        }
        ma_uint64 frame = 0;
        if (seconds > 0.0) {
            ma_uint32 rate = 0;
            if (ma_sound_get_data_format(&sound_, nullptr, nullptr, &rate, nullptr, 0) != MA_SUCCESS || rate == 0) {
                return std::unexpected(
                    std::format("Cannot seek '{}' before it is decoded", path_.filename().string()));
            }
            frame = static_cast<ma_uint64>(seconds * static_cast<double>(rate));
        }
        if (const ma_result result = ma_sound_seek_to_pcm_frame(&sound_, frame); result != MA_SUCCESS) {
            return std::unexpected(std::format("Failed to seek '{}': {}", path_.filename().string(), describe(result)));
        }
        return {};
    }

    bool isPlaying() const override { return initialized_ && ma_sound_is_playing(&sound_) == MA_TRUE; }

    bool isAtStart() const override {
        if (!initialized_) {
            return false;
        }
        ma_uint64 cursor = 0;
        if (ma_sound_get_cursor_in_pcm_frames(const_cast<ma_sound*>(&sound_), &cursor) != MA_SUCCESS) {
            return false;
        }
        return cursor == 0;
    }

    bool isAtEnd() const override { return initialized_ && ma_sound_at_end(&sound_) == MA_TRUE; }

    bool isReady() const override {
        if (!initialized_) {
            return false;
        }
        auto* source = static_cast<ma_resource_manager_data_source*>(ma_sound_get_data_source(&sound_));
        if (source == nullptr) {
            return false;
        }
        return ma_resource_manager_data_source_result(source) == MA_SUCCESS;
    }

    double position() const override {
        if (!initialized_) {
            return 0.0;
        }
        float cursor = 0.0f;
        if (ma_sound_get_cursor_in_seconds(const_cast<ma_sound*>(&sound_), &cursor) != MA_SUCCESS) {
            return 0.0;
        }
        return cursor;
    }

    double duration() const override {
        if (!initialized_) {
            return -1.0;
        }
        float length = 0.0f;
        if (ma_sound_get_length_in_seconds(const_cast<ma_sound*>(&sound_), &length) != MA_SUCCESS) {
            return -1.0;
        }
        return length;
    }

private:
    std::filesystem::path path_;
    ma_sound sound_{};
    bool initialized_ = false;
};

}  // namespace

AudioEngine::AudioEngine() : impl_(std::make_unique<Impl>()) {}

AudioEngine::~AudioEngine() {
    shutdown();
}

bool AudioEngine::initialize() {
    if (impl_->initialized) {
        return true;
    }

    ma_engine_config config = ma_engine_config_init();
    config.channels = 2;

    if (ma_engine_init(&config, &impl_->engine) != MA_SUCCESS) {
        return false;
    }

    impl_->initialized = true;
    impl_->sample_rate = ma_engine_get_sample_rate(&impl_->engine);
    return true;
}

void AudioEngine::shutdown() {
    if (impl_ && impl_->initialized) {
        ma_engine_uninit(&impl_->engine);
        impl_->initialized = false;
    }
}

std::expected<std::unique_ptr<SoundHandle>, std::string> AudioEngine::openSound(const std::filesystem::path& path) {
    if (!impl_->initialized) {
        return std::unexpected("Audio engine is not initialized");
    }

    auto sound = std::make_unique<MiniaudioSound>(path);
    if (const ma_result result = sound->init(impl_->engine); result != MA_SUCCESS) {
        return std::unexpected(std::format("Failed to open '{}': {}", path.string(), describe(result)));
    }
    return std::unique_ptr<SoundHandle>(std::move(sound));
}

uint32_t AudioEngine::sampleRate() const {
    return impl_->sample_rate;
}

}  // namespace soundkeys::audio
