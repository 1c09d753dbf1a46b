#include "sample_source.h"
#include "logger.h"

namespace live_scribe {

Result<std::unique_ptr<SampleSource>> start_first_available(const std::vector<SampleSourceFactory>& factories,
                                                            const SampleCallback& on_samples,
                                                            const SourceErrorCallback& on_error) {
    std::string last_error = "No audio capture backend available";

    for (const auto& factory : factories) {
        std::unique_ptr<SampleSource> source = factory ? factory() : nullptr;
        if (!source) continue;

        auto started = source->start(on_samples, on_error);
        if (started) {
            return std::move(source);
        }

        last_error = started.error().message;
        Logger::warn(std::string("[Audio] ") + source->name() + " capture unavailable (" + last_error + ")");
    }

    return make_resource_error(last_error);
}

} // namespace live_scribe
