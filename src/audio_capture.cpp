#include "audio_capture.h"
#include "logger.h"
#include "sample_encoder.h"
#include "sample_source.h"
#include <portaudio.h>
#include <atomic>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace live_scribe {

namespace {

/// Keeps PortAudio initialized for the lifetime of the object
class PaLibrary {
public:
    PaLibrary() : err_(Pa_Initialize()) {}
    ~PaLibrary() {
        if (err_ == paNoError) Pa_Terminate();
    }

    PaLibrary(const PaLibrary&) = delete;
    PaLibrary& operator=(const PaLibrary&) = delete;

    bool ok() const { return err_ == paNoError; }
    std::string error_text() const { return Pa_GetErrorText(err_); }

private:
    PaError err_;
};

int find_input_device(const std::string& name) {
    int num_devices = Pa_GetDeviceCount();

    if (name == "default" || name.empty()) {
        int default_idx = Pa_GetDefaultInputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default input device: [" << default_idx << "] " << (info ? info->name : "?");
            Logger::debug(oss.str());
        }
        return default_idx == paNoDevice ? -1 : default_idx;
    }

    // Numeric device index
    try {
        size_t consumed = 0;
        int device_idx = std::stoi(name, &consumed);
        if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(device_idx);
            if (info && info->maxInputChannels > 0) return device_idx;
            Logger::warn("Device [" + name + "] reports no input channels");
            return -1;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0 && name == info->name) {
            std::ostringstream oss;
            oss << "Found input device: [" << i << "] " << info->name;
            Logger::debug(oss.str());
            return i;
        }
    }

    return -1;
}

PaStreamParameters input_parameters(int device_idx) {
    PaStreamParameters params;
    params.device = device_idx;
    params.channelCount = 1;
    params.sampleFormat = paFloat32;
    params.suggestedLatency = Pa_GetDeviceInfo(device_idx)->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = nullptr;
    return params;
}

std::string pa_error(const std::string& what, PaError err) {
    std::ostringstream oss;
    oss << what << ": " << Pa_GetErrorText(err) << " (Error code: " << err << ")";
    return oss.str();
}

/**
 * @brief Blocking-read stream serviced by a dedicated worker thread
 */
class WorkerSampleSource : public SampleSource {
public:
    WorkerSampleSource(int device_idx, int sample_rate, size_t block_samples)
        : device_idx_(device_idx), sample_rate_(sample_rate), block_samples_(block_samples) {}

    ~WorkerSampleSource() override { stop(); }

    Result<void> start(SampleCallback on_samples, SourceErrorCallback on_error) override {
        PaStreamParameters params = input_parameters(device_idx_);
        PaError err = Pa_OpenStream(&stream_, &params, nullptr, sample_rate_,
                                    block_samples_, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            stream_ = nullptr;
            return make_resource_error(pa_error("Failed to open input stream", err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            return make_resource_error(pa_error("Failed to start input stream", err));
        }

        callback_ = std::move(on_samples);
        on_error_ = std::move(on_error);
        running_ = true;
        thread_ = std::thread(&WorkerSampleSource::read_loop, this);
        return Result<void>();
    }

    void stop() override {
        running_ = false;
        if (thread_.joinable()) thread_.join();
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
    }

    bool is_running() const override { return running_; }

    const char* name() const override { return "worker"; }

private:
    void read_loop() {
        std::vector<float> block(block_samples_);
        while (running_) {
            PaError err = Pa_ReadStream(stream_, block.data(), block_samples_);
            if (err == paInputOverflowed) {
                LOG_AUDIO("Input overflow");
            } else if (err != paNoError) {
                std::string msg = pa_error("Input stream read failed", err);
                Logger::error("[Audio] " + msg);
                running_ = false;
                if (on_error_) on_error_(msg);
                break;
            }
            callback_(block.data(), block.size());
        }
    }

    int device_idx_;
    int sample_rate_;
    size_t block_samples_;
    PaStream* stream_ = nullptr;
    SampleCallback callback_;
    SourceErrorCallback on_error_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

/**
 * @brief Stream whose samples arrive through the PortAudio callback
 */
class CallbackSampleSource : public SampleSource {
public:
    CallbackSampleSource(int device_idx, int sample_rate, size_t block_samples)
        : device_idx_(device_idx), sample_rate_(sample_rate), block_samples_(block_samples) {}

    ~CallbackSampleSource() override { stop(); }

    Result<void> start(SampleCallback on_samples, SourceErrorCallback /*on_error*/) override {
        callback_ = std::move(on_samples);

        PaStreamParameters params = input_parameters(device_idx_);
        PaError err = Pa_OpenStream(&stream_, &params, nullptr, sample_rate_,
                                    block_samples_, paClipOff, &CallbackSampleSource::on_audio, this);
        if (err != paNoError) {
            stream_ = nullptr;
            return make_resource_error(pa_error("Failed to open callback stream", err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            return make_resource_error(pa_error("Failed to start callback stream", err));
        }

        running_ = true;
        return Result<void>();
    }

    void stop() override {
        running_ = false;
        if (stream_) {
            // Pa_StopStream waits for the callback in progress to return
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
    }

    bool is_running() const override { return running_; }

    const char* name() const override { return "callback"; }

private:
    static int on_audio(const void* input, void* /*output*/,
                        unsigned long frame_count,
                        const PaStreamCallbackTimeInfo* /*time_info*/,
                        PaStreamCallbackFlags status_flags,
                        void* user_data) {
        auto* self = static_cast<CallbackSampleSource*>(user_data);
        if (!self->running_) return paComplete;
        if (status_flags & paInputOverflow) {
            LOG_AUDIO("Input overflow");
        }
        if (input) {
            self->callback_(static_cast<const float*>(input), frame_count);
        }
        return paContinue;
    }

    int device_idx_;
    int sample_rate_;
    size_t block_samples_;
    PaStream* stream_ = nullptr;
    SampleCallback callback_;
    std::atomic<bool> running_{false};
};

} // anonymous namespace

class PortAudioCapture::Impl {
public:
    Impl(const std::string& input_device, int sample_rate, size_t frame_samples, bool force_callback)
        : input_device_(input_device)
        , sample_rate_(sample_rate)
        , encoder_(frame_samples)
        , force_callback_(force_callback) {}

    ~Impl() { stop(); }

    Result<void> start(FrameMailbox* mailbox) {
        if (source_) return make_state_error("Audio capture already running");
        if (!mailbox) return make_resource_error("No frame mailbox for audio capture");

        library_ = std::make_unique<PaLibrary>();
        if (!library_->ok()) {
            std::string msg = "PortAudio init error: " + library_->error_text();
            library_.reset();
            return make_resource_error(msg);
        }

        int device_idx = find_input_device(input_device_);
        if (device_idx < 0) {
            library_.reset();
            return make_resource_error("Input device not found: " + input_device_);
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(device_idx);
        std::ostringstream dev_oss;
        dev_oss << "Using input device: [" << device_idx << "] " << (info ? info->name : "?");
        Logger::info(dev_oss.str());

        encoder_.reset();
        encoder_.set_frame_callback([mailbox](AudioFrame&& frame) {
            if (!mailbox->offer(std::move(frame))) {
                LOG_AUDIO("Frame mailbox full, dropping frame");
            }
        });
        SampleCallback on_samples = [this](const float* samples, size_t count) {
            encoder_.push(samples, count);
        };
        SourceErrorCallback on_error = [mailbox](const std::string& message) {
            mailbox->report_failure("Microphone capture stopped: " + message);
        };

        size_t block = encoder_.frame_samples();
        int rate = sample_rate_;
        std::vector<SampleSourceFactory> candidates;
        if (!force_callback_) {
            candidates.push_back([device_idx, rate, block]() -> std::unique_ptr<SampleSource> {
                return std::make_unique<WorkerSampleSource>(device_idx, rate, block);
            });
        }
        candidates.push_back([device_idx, rate, block]() -> std::unique_ptr<SampleSource> {
            return std::make_unique<CallbackSampleSource>(device_idx, rate, block);
        });

        auto started = start_first_available(candidates, on_samples, on_error);
        if (!started) {
            std::string msg = started.error().message;
            if (msg.find("nanticipated host error") != std::string::npos) {
                msg += ". Check that this process has microphone access.";
            }
            encoder_.set_frame_callback(nullptr);
            library_.reset();
            return make_resource_error(msg);
        }
        source_ = std::move(started.value());

        Logger::info(std::string("Audio capture started (") + source_->name() + " source, " +
                     std::to_string(sample_rate_) + " Hz, " + std::to_string(block) + "-sample frames)");
        return Result<void>();
    }

    void stop() {
        if (source_) {
            source_->stop();
            source_.reset();
            LOG_AUDIO("Audio capture stopped");
        }
        encoder_.reset();
        encoder_.set_frame_callback(nullptr);
        library_.reset();
    }

    bool is_running() const { return source_ && source_->is_running(); }

private:
    std::string input_device_;
    int sample_rate_;
    SampleEncoder encoder_;
    bool force_callback_;
    std::unique_ptr<PaLibrary> library_;
    std::unique_ptr<SampleSource> source_;
};

PortAudioCapture::PortAudioCapture(const std::string& input_device, int sample_rate,
                                   size_t frame_samples, bool force_callback_source)
    : pimpl_(std::make_unique<Impl>(input_device, sample_rate, frame_samples, force_callback_source)) {}

PortAudioCapture::~PortAudioCapture() = default;

Result<void> PortAudioCapture::start(FrameMailbox* mailbox) {
    return pimpl_->start(mailbox);
}

void PortAudioCapture::stop() {
    pimpl_->stop();
}

bool PortAudioCapture::is_running() const {
    return pimpl_->is_running();
}

void PortAudioCapture::list_devices() {
    PaLibrary library;
    if (!library.ok()) {
        Logger::error("PortAudio init error: " + library.error_text());
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    int default_idx = Pa_GetDefaultInputDevice();
    Logger::info("Available input devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels == 0) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name << " (IN:" << info->maxInputChannels << ")";
        if (i == default_idx) oss << " (default)";
        Logger::info(oss.str());
    }
}

Result<void> PortAudioCapture::probe_microphone(const std::string& input_device, int sample_rate) {
    PaLibrary library;
    if (!library.ok()) {
        return make_resource_error("PortAudio init error: " + library.error_text());
    }

    int device_idx = find_input_device(input_device);
    if (device_idx < 0) {
        return make_resource_error("Input device not found: " + input_device);
    }

    PaStreamParameters params = input_parameters(device_idx);
    PaError err = Pa_IsFormatSupported(&params, nullptr, sample_rate);
    if (err != paFormatIsSupported) {
        return make_resource_error(pa_error("Microphone does not support " + std::to_string(sample_rate) + " Hz mono", err));
    }

    PaStream* stream = nullptr;
    err = Pa_OpenStream(&stream, &params, nullptr, sample_rate, paFramesPerBufferUnspecified,
                        paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        return make_resource_error(pa_error("Microphone access failed", err));
    }
    Pa_CloseStream(stream);
    return Result<void>();
}

} // namespace live_scribe
