#pragma once

#include "audio_sink.h"
#include "media_source.h"
#include <string>
#include <memory>

namespace helios {

/**
 * @brief Microphone capture using PortAudio
 *
 * Opens a mono float32 input stream whose buffer size equals the capture
 * quantum, so each PortAudio callback yields exactly one quantum. Quanta are
 * queued under a mutex and popped by the session loop.
 *
 * Thread Safety:
 * - The stream callback runs in PortAudio's thread and only touches the queue
 * - read_quantum() may be called from any thread
 */
class PortAudioMicrophone : public MicrophoneSource {
public:
    /**
     * @param device Device name, numeric index, or "default"
     * @param sample_rate Capture rate in Hz (16000)
     * @param quantum Samples per callback (4096)
     */
    PortAudioMicrophone(const std::string& device, int sample_rate, int quantum);
    ~PortAudioMicrophone() override;

    PortAudioMicrophone(const PortAudioMicrophone&) = delete;
    PortAudioMicrophone& operator=(const PortAudioMicrophone&) = delete;

    Result<void> start() override;
    void stop() override;
    bool is_running() const override;
    bool read_quantum(std::vector<float>& samples) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Sample-accurate scheduled playback using PortAudio
 *
 * A VoiceMixer owns the timeline; the stream callback renders it block by
 * block, so back-to-back sources are gapless.
 */
class PortAudioSink : public AudioSink {
public:
    PortAudioSink();
    ~PortAudioSink() override;

    PortAudioSink(const PortAudioSink&) = delete;
    PortAudioSink& operator=(const PortAudioSink&) = delete;

    /**
     * @brief Open and start the output stream
     * @param device Device name, numeric index, or "default"
     * @param sample_rate Output rate in Hz (24000)
     * @return ConnectError if the device cannot be opened
     */
    Result<void> start(const std::string& device, int sample_rate);

    /**
     * @brief Stop the stream and drop every scheduled source
     */
    void stop();

    double current_time() const override;
    SourceId start_source(const PlayableBuffer& buffer, double when) override;
    void stop_source(SourceId id) override;
    std::vector<SourceId> take_finished() override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Log all available audio devices
 */
void list_audio_devices();

} // namespace helios
