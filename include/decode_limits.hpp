#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace mediaframes {

// Limits applied while decoding a single post. Built once from configuration
// and passed by const reference to every decode call.
struct Limits {
    int keyframe_interval = 1;      // seconds between retained keyframes
    int max_keyframes = 100;        // enforced by the caller, not the decoder
    int max_duration = 300;         // seconds
    int frame_batch_size = 10;      // downstream hint, unused here
    int max_upload_size_mb = 200;

    // Matching parameters, carried through for downstream consumers
    int min_matches = 3;
    double similarity_threshold = 0.8;

    size_t max_upload_size_bytes() const {
        return static_cast<size_t>(max_upload_size_mb) * 1024 * 1024;
    }

    // Throws std::invalid_argument if any value is out of range
    void validate() const;

    static Limits from_json(const nlohmann::json& j);
};

struct VideoDecoderOptions {
    std::string ffmpeg_path = "ffmpeg";
    std::chrono::milliseconds exit_timeout{1000};

    static VideoDecoderOptions from_json(const nlohmann::json& j);
};

// Config files hold a "limits" and a "decoder" object, both optional.
nlohmann::json read_config_file(const std::string& path);
Limits load_limits(const std::string& path);

} // namespace mediaframes
