#pragma once

#include "config.h"
#include "common.h"
#include <memory>

namespace live_scribe {

/**
 * @brief Live transcription agent
 *
 * Wires microphone capture, the transcription session, the finalization
 * detector and the dialogue sink together and drives them from one event
 * loop until shutdown() is requested or the session fails.
 */
class ScribeAgent {
public:
    explicit ScribeAgent(const Config& config);
    ~ScribeAgent();

    // Non-copyable
    ScribeAgent(const ScribeAgent&) = delete;
    ScribeAgent& operator=(const ScribeAgent&) = delete;

    /**
     * @brief Create all components and probe the microphone
     * @return True if initialization successful, false otherwise
     */
    bool initialize();

    /**
     * @brief Run the event loop
     * @return Exit code (0 after shutdown, 1 if the session ended in error)
     */
    int run();

    /**
     * @brief Request shutdown (safe from a signal handler)
     */
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace live_scribe
