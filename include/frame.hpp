#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>

namespace mediaframes {

// One decoded picture, always 8-bit 3-channel in BGR order.
struct DecodedFrame {
    cv::Mat image;
    int64_t frame_number = 0;
    std::optional<double> timestamp;
    bool is_keyframe = false;

    int width() const { return image.cols; }
    int height() const { return image.rows; }
};

// Lazy, single-pass sequence of frames. Whatever the stream holds (files,
// processes) is released by close(), which also runs on destruction.
class FrameStream {
public:
    virtual ~FrameStream() = default;

    // Returns false once the sequence is exhausted or closed.
    virtual bool next(DecodedFrame& frame) = 0;
    virtual void close() = 0;
};

// Pulls at most max_frames frames and closes the stream.
std::vector<DecodedFrame> collect_frames(FrameStream& stream, size_t max_frames);

// Per-frame record handed to the persistence layer.
struct FrameInfo {
    int64_t post_id = 0;
    int64_t frame_number = 0;
    double timestamp = 0.0;
    bool is_keyframe = false;
    int width = 0;
    int height = 0;
};

FrameInfo make_frame_info(int64_t post_id, const DecodedFrame& frame);

void to_json(nlohmann::json& j, const FrameInfo& info);
void from_json(const nlohmann::json& j, FrameInfo& info);

} // namespace mediaframes
