#include "decode_limits.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace mediaframes {

namespace {

template <typename T>
void read_value(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void require_positive(const char* name, int value) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(name) + " has to be positive, got " +
                                    std::to_string(value));
    }
}

} // namespace

void Limits::validate() const {
    require_positive("keyframe_interval", keyframe_interval);
    require_positive("max_keyframes", max_keyframes);
    require_positive("max_duration", max_duration);
    require_positive("frame_batch_size", frame_batch_size);
    require_positive("max_upload_size_mb", max_upload_size_mb);
    require_positive("min_matches", min_matches);
    if (similarity_threshold < 0.0 || similarity_threshold > 1.0) {
        throw std::invalid_argument("similarity_threshold has to be within [0, 1], got " +
                                    std::to_string(similarity_threshold));
    }
}

Limits Limits::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Limits configuration has to be a JSON object");
    }

    Limits limits;
    read_value(j, "keyframe_interval", limits.keyframe_interval);
    read_value(j, "max_keyframes", limits.max_keyframes);
    read_value(j, "max_duration", limits.max_duration);
    read_value(j, "frame_batch_size", limits.frame_batch_size);
    read_value(j, "max_upload_size_mb", limits.max_upload_size_mb);
    read_value(j, "min_matches", limits.min_matches);
    read_value(j, "similarity_threshold", limits.similarity_threshold);
    limits.validate();
    return limits;
}

VideoDecoderOptions VideoDecoderOptions::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Decoder configuration has to be a JSON object");
    }

    VideoDecoderOptions options;
    read_value(j, "ffmpeg_path", options.ffmpeg_path);

    int timeout_ms = static_cast<int>(options.exit_timeout.count());
    read_value(j, "exit_timeout_ms", timeout_ms);
    if (timeout_ms <= 0) {
        throw std::invalid_argument("exit_timeout_ms has to be positive");
    }
    options.exit_timeout = std::chrono::milliseconds(timeout_ms);

    if (options.ffmpeg_path.empty()) {
        throw std::invalid_argument("ffmpeg_path must not be empty");
    }
    return options;
}

json read_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json config;
    try {
        config = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse config file " + path + ": " + e.what());
    }
    if (!config.is_object()) {
        throw std::runtime_error("Config file " + path + " has to contain a JSON object");
    }
    return config;
}

Limits load_limits(const std::string& path) {
    return Limits::from_json(read_config_file(path).value("limits", json::object()));
}

} // namespace mediaframes
