#pragma once

/**
 * @file sample_source.h
 * @brief Microphone sample source interface
 *
 * Two backends deliver the same normalized float samples: a worker thread
 * doing blocking reads, and a driver callback. The capture layer probes
 * them in that order and keeps the first one that starts.
 */

#include "errors.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace live_scribe {

/// Receives blocks of mono float samples in [-1, 1] on the capture context
using SampleCallback = std::function<void(const float* samples, size_t count)>;

/// Told once when a running source stops delivering on its own
using SourceErrorCallback = std::function<void(const std::string& message)>;

/**
 * @brief Abstract sample source
 */
class SampleSource {
public:
    virtual ~SampleSource() = default;

    /**
     * @brief Begin delivering samples
     * @param on_samples Invoked from the capture context, never from the caller's thread
     * @param on_error Invoked from the capture context if delivery fails after start
     * @return Error (ResourceError) if the source could not be started
     */
    virtual Result<void> start(SampleCallback on_samples, SourceErrorCallback on_error) = 0;

    /// Stop delivery; no callback runs after this returns
    virtual void stop() = 0;

    virtual bool is_running() const = 0;

    /// Backend name for logs
    virtual const char* name() const = 0;
};

using SampleSourceFactory = std::function<std::unique_ptr<SampleSource>()>;

/**
 * @brief Start candidates in order and keep the first that comes up
 *
 * A source that fails to start is destroyed before the next is tried.
 * @return The running source, or ResourceError carrying the last failure
 */
Result<std::unique_ptr<SampleSource>> start_first_available(const std::vector<SampleSourceFactory>& factories,
                                                            const SampleCallback& on_samples,
                                                            const SourceErrorCallback& on_error);

} // namespace live_scribe
