#include "audio_io.h"
#include "logger.h"
#include "core/constants.h"
#include "voice_mixer.h"
#include <portaudio.h>
#include <atomic>
#include <deque>
#include <mutex>
#include <sstream>

namespace helios {

namespace {

int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default " << (is_input ? "input" : "output")
                << " device: [" << default_idx << "] " << (info ? info->name : "?");
            Logger::debug(oss.str());
            return default_idx;
        }
        return -1;
    }

    // Numeric device index
    try {
        int device_idx = std::stoi(name);
        if (device_idx >= 0 && device_idx < num_devices && Pa_GetDeviceInfo(device_idx)) {
            return device_idx;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->name != name) continue;
        int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            return i;
        }
    }

    return -1;
}

std::string pa_error(const std::string& what, PaError err) {
    return what + ": " + Pa_GetErrorText(err);
}

} // namespace

// ---------------------------------------------------------------------------
// Microphone
// ---------------------------------------------------------------------------

class PortAudioMicrophone::Impl {
public:
    Impl(const std::string& device, int sample_rate, int quantum)
        : device_(device), sample_rate_(sample_rate), quantum_(quantum) {}

    ~Impl() {
        stop();
    }

    Result<void> start() {
        if (running_) return {};

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_connect_error(pa_error("PortAudio init error", err));
        }

        int idx = find_device(device_, true);
        const PaDeviceInfo* info = idx >= 0 ? Pa_GetDeviceInfo(idx) : nullptr;
        if (!info || info->maxInputChannels == 0) {
            Pa_Terminate();
            return make_connect_error("Input device not found: " + device_);
        }
        Logger::info("Using input device: [" + std::to_string(idx) + "] " + info->name);

        PaStreamParameters params;
        params.device = idx;
        params.channelCount = 1;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = info->defaultLowInputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, &params, nullptr, sample_rate_,
                            static_cast<unsigned long>(quantum_), paClipOff, input_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            Pa_Terminate();
            return make_connect_error(pa_error("Failed to open input stream", err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::string message = pa_error("Failed to start input stream", err);
            if (err == paUnanticipatedHostError) {
                message += " (check microphone permissions)";
            }
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            Pa_Terminate();
            return make_connect_error(message);
        }

        running_ = true;
        LOG_CAPTURE("Microphone stream started at " + std::to_string(sample_rate_) + " Hz");
        return {};
    }

    void stop() {
        if (!running_) return;
        running_ = false;

        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            Logger::warn(pa_error("Failed to stop input stream", err));
        }
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        Pa_Terminate();

        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.clear();
    }

    bool is_running() const { return running_; }

    bool read_quantum(std::vector<float>& samples) {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.empty()) {
            return false;
        }
        samples = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

private:
    static int input_callback(const void* input, void* /*output*/,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* /*time_info*/,
                              PaStreamCallbackFlags /*status_flags*/,
                              void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        if (!input) return paContinue;

        const float* in = static_cast<const float*>(input);
        std::vector<float> quantum(in, in + frame_count);

        std::lock_guard<std::mutex> lock(self->queue_mutex_);
        // Drop when the session loop falls behind
        if (self->queue_.size() < static_cast<size_t>(constants::audio::MAX_PENDING_QUANTA)) {
            self->queue_.push_back(std::move(quantum));
        }
        return paContinue;
    }

    std::string device_;
    int sample_rate_;
    int quantum_;
    PaStream* stream_ = nullptr;
    std::atomic<bool> running_{false};

    std::mutex queue_mutex_;
    std::deque<std::vector<float>> queue_;
};

PortAudioMicrophone::PortAudioMicrophone(const std::string& device, int sample_rate, int quantum)
    : pimpl_(std::make_unique<Impl>(device, sample_rate, quantum)) {}

PortAudioMicrophone::~PortAudioMicrophone() = default;

Result<void> PortAudioMicrophone::start() {
    return pimpl_->start();
}

void PortAudioMicrophone::stop() {
    pimpl_->stop();
}

bool PortAudioMicrophone::is_running() const {
    return pimpl_->is_running();
}

bool PortAudioMicrophone::read_quantum(std::vector<float>& samples) {
    return pimpl_->read_quantum(samples);
}

// ---------------------------------------------------------------------------
// Scheduled output
// ---------------------------------------------------------------------------

class PortAudioSink::Impl {
public:
    ~Impl() {
        stop();
    }

    Result<void> start(const std::string& device, int sample_rate) {
        if (stream_) return {};
        mixer_.reset(sample_rate);

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_connect_error(pa_error("PortAudio init error", err));
        }

        int idx = find_device(device, false);
        const PaDeviceInfo* info = idx >= 0 ? Pa_GetDeviceInfo(idx) : nullptr;
        if (!info || info->maxOutputChannels == 0) {
            Pa_Terminate();
            return make_connect_error("Output device not found: " + device);
        }
        Logger::info("Using output device: [" + std::to_string(idx) + "] " + info->name);

        PaStreamParameters params;
        params.device = idx;
        params.channelCount = constants::audio::OUTPUT_CHANNELS;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = info->defaultLowOutputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, nullptr, &params, sample_rate,
                            paFramesPerBufferUnspecified, paClipOff, output_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            Pa_Terminate();
            return make_connect_error(pa_error("Failed to open output stream", err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            Pa_Terminate();
            return make_connect_error(pa_error("Failed to start output stream", err));
        }

        sample_rate_ = sample_rate;
        LOG_PLAYBACK("Output stream started at " + std::to_string(sample_rate) + " Hz");
        return {};
    }

    void stop() {
        if (!stream_) return;

        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            Logger::warn(pa_error("Failed to stop output stream", err));
        }
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        Pa_Terminate();

        mixer_.reset(sample_rate_);
    }

    VoiceMixer& mixer() { return mixer_; }

private:
    static int output_callback(const void* /*input*/, void* output,
                               unsigned long frame_count,
                               const PaStreamCallbackTimeInfo* /*time_info*/,
                               PaStreamCallbackFlags /*status_flags*/,
                               void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        self->mixer_.render(static_cast<float*>(output), frame_count);
        return paContinue;
    }

    PaStream* stream_ = nullptr;
    int sample_rate_ = constants::audio::OUTPUT_SAMPLE_RATE;
    VoiceMixer mixer_;
};

PortAudioSink::PortAudioSink() : pimpl_(std::make_unique<Impl>()) {}
PortAudioSink::~PortAudioSink() = default;

Result<void> PortAudioSink::start(const std::string& device, int sample_rate) {
    return pimpl_->start(device, sample_rate);
}

void PortAudioSink::stop() {
    pimpl_->stop();
}

double PortAudioSink::current_time() const {
    return pimpl_->mixer().current_time();
}

SourceId PortAudioSink::start_source(const PlayableBuffer& buffer, double when) {
    return pimpl_->mixer().start_source(buffer, when);
}

void PortAudioSink::stop_source(SourceId id) {
    pimpl_->mixer().stop_source(id);
}

std::vector<SourceId> PortAudioSink::take_finished() {
    return pimpl_->mixer().take_finished();
}

void list_audio_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        Logger::error(pa_error("PortAudio init error", err));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        if (i == Pa_GetDefaultInputDevice()) oss << " [default input]";
        if (i == Pa_GetDefaultOutputDevice()) oss << " [default output]";
        Logger::info(oss.str());
    }

    Pa_Terminate();
}

} // namespace helios
