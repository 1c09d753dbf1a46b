#pragma once

#include "common.h"
#include "errors.h"
#include "frame_mailbox.h"
#include <memory>
#include <string>

namespace live_scribe {

/**
 * @brief Microphone-to-mailbox capture pipeline
 *
 * Owns the sample source and the encoder. Encoded frames go to the
 * mailbox given at start(); the session client drains it on the event loop.
 */
class AudioInput {
public:
    virtual ~AudioInput() = default;

    /**
     * @brief Acquire the microphone and start producing frames
     * @param mailbox Destination for encoded frames; must outlive the capture
     */
    virtual Result<void> start(FrameMailbox* mailbox) = 0;

    /// Release the audio graph, then the microphone stream. Idempotent.
    virtual void stop() = 0;

    virtual bool is_running() const = 0;
};

/**
 * @brief AudioInput backed by PortAudio
 *
 * At start, a worker-thread source (blocking reads) is tried first; if it
 * fails to initialize a callback-driven source is substituted.
 *
 * Thread Safety:
 * - start()/stop() must be called from the event loop thread
 * - The encoder runs on the capture context only
 */
class PortAudioCapture : public AudioInput {
public:
    PortAudioCapture(const std::string& input_device,
                     int sample_rate,
                     size_t frame_samples,
                     bool force_callback_source = false);
    ~PortAudioCapture() override;

    PortAudioCapture(const PortAudioCapture&) = delete;
    PortAudioCapture& operator=(const PortAudioCapture&) = delete;

    Result<void> start(FrameMailbox* mailbox) override;
    void stop() override;
    bool is_running() const override;

    /// Log available input devices
    static void list_devices();

    /**
     * @brief Open and immediately close the input device
     *
     * Fails fast on a missing device or denied microphone permission
     * before a transcription session is requested.
     */
    static Result<void> probe_microphone(const std::string& input_device, int sample_rate);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace live_scribe
