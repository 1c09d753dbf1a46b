/**
 * Capture backend selection tests, with scripted sample sources.
 * Asserts:
 * - The first source that starts is kept; later ones are never built.
 * - A source that fails to start is destroyed and the next one is tried.
 * - When every source fails, the last failure comes back as ResourceError.
 * - The chosen source receives both callbacks.
 *
 * Run from build dir: ./test_sample_source
 * No PortAudio device required.
 */

#include "sample_source.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace live_scribe;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

/// Shared record of what the scripted sources saw
struct SourceLog {
    std::vector<std::string> built;
    std::vector<std::string> started;
    std::vector<std::string> destroyed;
};

class ScriptedSource : public SampleSource {
public:
    ScriptedSource(const char* name, bool starts, SourceLog& log)
        : name_(name), starts_(starts), log_(log) {
        log_.built.push_back(name_);
    }

    ~ScriptedSource() override { log_.destroyed.push_back(name_); }

    Result<void> start(SampleCallback on_samples, SourceErrorCallback on_error) override {
        log_.started.push_back(name_);
        if (!starts_) return make_resource_error(std::string(name_) + " stream could not be opened");
        on_samples_ = std::move(on_samples);
        on_error_ = std::move(on_error);
        running_ = true;
        return Result<void>();
    }

    void stop() override { running_ = false; }
    bool is_running() const override { return running_; }
    const char* name() const override { return name_; }

    void deliver(const float* samples, size_t count) { if (on_samples_) on_samples_(samples, count); }
    void break_down(const std::string& message) { if (on_error_) on_error_(message); }

private:
    const char* name_;
    bool starts_;
    SourceLog& log_;
    SampleCallback on_samples_;
    SourceErrorCallback on_error_;
    bool running_ = false;
};

SampleSourceFactory scripted(const char* name, bool starts, SourceLog& log) {
    return [name, starts, &log]() -> std::unique_ptr<SampleSource> {
        return std::make_unique<ScriptedSource>(name, starts, log);
    };
}

} // anonymous namespace

int main() {
    size_t samples_seen = 0;
    std::string error_seen;
    SampleCallback on_samples = [&samples_seen](const float*, size_t count) { samples_seen += count; };
    SourceErrorCallback on_error = [&error_seen](const std::string& message) { error_seen = message; };

    // --- first source starts: fallback never built ---
    {
        SourceLog log;
        auto chosen = start_first_available({scripted("worker", true, log), scripted("callback", true, log)},
                                            on_samples, on_error);
        ASSERT(chosen.is_ok());
        ASSERT(chosen.is_ok() && std::string(chosen.value()->name()) == "worker");
        ASSERT(chosen.is_ok() && chosen.value()->is_running());
        ASSERT(log.built.size() == 1);
        ASSERT(log.destroyed.empty());
    }

    // --- worker fails: callback source takes over ---
    {
        SourceLog log;
        samples_seen = 0;
        error_seen.clear();
        auto chosen = start_first_available({scripted("worker", false, log), scripted("callback", true, log)},
                                            on_samples, on_error);
        ASSERT(chosen.is_ok());
        if (chosen.is_ok()) {
            ASSERT(std::string(chosen.value()->name()) == "callback");
            auto* source = static_cast<ScriptedSource*>(chosen.value().get());
            float block[160] = {};
            source->deliver(block, 160);
            source->break_down("Input stream read failed");
        }
        ASSERT(samples_seen == 160);
        ASSERT(error_seen == "Input stream read failed");
        ASSERT(log.started.size() == 2 && log.started[0] == "worker" && log.started[1] == "callback");
        ASSERT(log.destroyed.size() == 1 && log.destroyed[0] == "worker");
    }

    // --- every source fails ---
    {
        SourceLog log;
        auto chosen = start_first_available({scripted("worker", false, log), scripted("callback", false, log)},
                                            on_samples, on_error);
        ASSERT(chosen.is_error());
        ASSERT(chosen.is_error() && chosen.error().type == ErrorType::ResourceError);
        ASSERT(chosen.is_error() && chosen.error().message == "callback stream could not be opened");
        ASSERT(log.destroyed.size() == 2);
    }

    // --- forced callback path: only one candidate ---
    {
        SourceLog log;
        auto chosen = start_first_available({scripted("callback", true, log)}, on_samples, on_error);
        ASSERT(chosen.is_ok() && std::string(chosen.value()->name()) == "callback");
    }

    // --- nothing to try ---
    {
        auto chosen = start_first_available({}, on_samples, on_error);
        ASSERT(chosen.is_error() && chosen.error().type == ErrorType::ResourceError);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All sample source tests passed.\n";
    return 0;
}
