#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

/// Apply full JSON config (all sections) into cfg. Keys that are absent keep their defaults.
void apply_json_to_config(live_scribe::Config& cfg, const json& j) {
    // Audio config
    if (j.contains("audio") && j["audio"].is_object()) {
        const auto& a = j["audio"];
        if (a.contains("input_device") && a["input_device"].is_string()) cfg.audio.input_device = a["input_device"].get<std::string>();
        if (a.contains("sample_rate") && a["sample_rate"].is_number_integer()) cfg.audio.sample_rate = a["sample_rate"];
        if (a.contains("frame_samples") && a["frame_samples"].is_number_unsigned()) cfg.audio.frame_samples = a["frame_samples"];
        if (a.contains("mailbox_frames") && a["mailbox_frames"].is_number_unsigned()) cfg.audio.mailbox_frames = a["mailbox_frames"];
        if (a.contains("force_callback_source") && a["force_callback_source"].is_boolean())
            cfg.audio.force_callback_source = a["force_callback_source"];
    }

    // Credential endpoint
    if (j.contains("credential") && j["credential"].is_object()) {
        const auto& c = j["credential"];
        if (c.contains("endpoint") && c["endpoint"].is_string()) cfg.credential.endpoint = c["endpoint"].get<std::string>();
        if (c.contains("timeout_ms") && c["timeout_ms"].is_number_integer()) cfg.credential.timeout_ms = c["timeout_ms"];
        if (c.contains("user_id") && c["user_id"].is_string()) cfg.credential.user_id = c["user_id"].get<std::string>();
    }

    // Streaming session
    if (j.contains("stream") && j["stream"].is_object()) {
        const auto& s = j["stream"];
        if (s.contains("realtime_url") && s["realtime_url"].is_string()) cfg.stream.realtime_url = s["realtime_url"].get<std::string>();
        if (s.contains("model_id") && s["model_id"].is_string()) cfg.stream.model_id = s["model_id"].get<std::string>();
        if (s.contains("audio_format") && s["audio_format"].is_string()) cfg.stream.audio_format = s["audio_format"].get<std::string>();
        if (s.contains("send_config") && s["send_config"].is_boolean()) cfg.stream.send_config = s["send_config"];
        if (s.contains("vad_silence_threshold_secs") && s["vad_silence_threshold_secs"].is_number())
            cfg.stream.vad_silence_threshold_secs = s["vad_silence_threshold_secs"];
        if (s.contains("commit_strategy") && s["commit_strategy"].is_string()) cfg.stream.commit_strategy = s["commit_strategy"].get<std::string>();
        if (s.contains("immediate_close_ms") && s["immediate_close_ms"].is_number_integer())
            cfg.stream.immediate_close_ms = s["immediate_close_ms"];
        if (s.contains("connect_timeout_ms") && s["connect_timeout_ms"].is_number_integer())
            cfg.stream.connect_timeout_ms = s["connect_timeout_ms"];
    }

    // Utterance finalization
    if (j.contains("finalize") && j["finalize"].is_object()) {
        const auto& f = j["finalize"];
        if (f.contains("quiet_window_ms") && f["quiet_window_ms"].is_number_integer()) cfg.finalize.quiet_window_ms = f["quiet_window_ms"];
        if (f.contains("pattern_window") && f["pattern_window"].is_number_unsigned()) cfg.finalize.pattern_window = f["pattern_window"];
        if (f.contains("lock_reset_length_delta") && f["lock_reset_length_delta"].is_number_unsigned())
            cfg.finalize.lock_reset_length_delta = f["lock_reset_length_delta"];
    }

    // Dialogue collaborator
    if (j.contains("dialogue") && j["dialogue"].is_object()) {
        const auto& d = j["dialogue"];
        if (d.contains("endpoint") && d["endpoint"].is_string()) cfg.dialogue.endpoint = d["endpoint"].get<std::string>();
        if (d.contains("timeout_ms") && d["timeout_ms"].is_number_integer()) cfg.dialogue.timeout_ms = d["timeout_ms"];
        if (d.contains("session_id") && d["session_id"].is_string()) cfg.dialogue.session_id = d["session_id"].get<std::string>();
        if (d.contains("voice_id") && d["voice_id"].is_string()) cfg.dialogue.voice_id = d["voice_id"].get<std::string>();
    }

    if (j.contains("log_level") && j["log_level"].is_string()) cfg.log_level = j["log_level"].get<std::string>();
    if (j.contains("log_file") && j["log_file"].is_string()) cfg.log_file = j["log_file"].get<std::string>();
}

} // anonymous namespace

namespace live_scribe {

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file " + path + ". Using defaults.");
        return cfg;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        Logger::error("Error parsing config file " + path + ": " + std::string(e.what()) + ". Using defaults.");
        return cfg;
    }

    if (!j.is_object()) {
        Logger::warn("Config file " + path + " is not a JSON object. Using defaults.");
        return cfg;
    }

    apply_json_to_config(cfg, j);

    if (cfg.audio.frame_samples == 0) {
        Logger::warn("audio.frame_samples must be positive; using " + std::to_string(DEFAULT_FRAME_SAMPLES));
        cfg.audio.frame_samples = DEFAULT_FRAME_SAMPLES;
    }
    if (cfg.audio.mailbox_frames == 0) {
        cfg.audio.mailbox_frames = 1;
    }
    if (cfg.finalize.pattern_window < 2) {
        Logger::warn("finalize.pattern_window below 2 would fire on every partial; using " +
                     std::to_string(PARTIAL_PATTERN_WINDOW));
        cfg.finalize.pattern_window = PARTIAL_PATTERN_WINDOW;
    }
    if (!cfg.log_file.empty()) cfg.log_file = expand_path(cfg.log_file);

    Logger::info("Loaded config from " + path);
    return cfg;
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["sample_rate"] = audio.sample_rate;
    j["audio"]["frame_samples"] = audio.frame_samples;
    j["audio"]["mailbox_frames"] = audio.mailbox_frames;
    j["audio"]["force_callback_source"] = audio.force_callback_source;

    j["credential"]["endpoint"] = credential.endpoint;
    j["credential"]["timeout_ms"] = credential.timeout_ms;
    if (!credential.user_id.empty()) j["credential"]["user_id"] = credential.user_id;

    j["stream"]["realtime_url"] = stream.realtime_url;
    j["stream"]["model_id"] = stream.model_id;
    j["stream"]["audio_format"] = stream.audio_format;
    j["stream"]["send_config"] = stream.send_config;
    j["stream"]["vad_silence_threshold_secs"] = stream.vad_silence_threshold_secs;
    j["stream"]["commit_strategy"] = stream.commit_strategy;
    j["stream"]["immediate_close_ms"] = stream.immediate_close_ms;
    j["stream"]["connect_timeout_ms"] = stream.connect_timeout_ms;

    j["finalize"]["quiet_window_ms"] = finalize.quiet_window_ms;
    j["finalize"]["pattern_window"] = finalize.pattern_window;
    j["finalize"]["lock_reset_length_delta"] = finalize.lock_reset_length_delta;

    j["dialogue"]["endpoint"] = dialogue.endpoint;
    j["dialogue"]["timeout_ms"] = dialogue.timeout_ms;
    j["dialogue"]["session_id"] = dialogue.session_id;
    if (!dialogue.voice_id.empty()) j["dialogue"]["voice_id"] = dialogue.voice_id;

    j["log_level"] = log_level;
    if (!log_file.empty()) j["log_file"] = log_file;

    std::ofstream file(path);
    if (file.is_open()) {
        file << j.dump(2);
    } else {
        Logger::warn("Could not write config file " + path);
    }
}

} // namespace live_scribe
