#include "frame.hpp"

using json = nlohmann::json;

namespace mediaframes {

std::vector<DecodedFrame> collect_frames(FrameStream& stream, size_t max_frames) {
    std::vector<DecodedFrame> frames;
    DecodedFrame frame;
    try {
        while (frames.size() < max_frames && stream.next(frame)) {
            frames.push_back(std::move(frame));
            frame = DecodedFrame{};
        }
    } catch (...) {
        stream.close();
        throw;
    }
    stream.close();
    return frames;
}

FrameInfo make_frame_info(int64_t post_id, const DecodedFrame& frame) {
    FrameInfo info;
    info.post_id = post_id;
    info.frame_number = frame.frame_number;
    info.timestamp = frame.timestamp.value_or(0.0);
    info.is_keyframe = frame.is_keyframe;
    info.width = frame.width();
    info.height = frame.height();
    return info;
}

void to_json(json& j, const FrameInfo& info) {
    j = json{
        {"post_id", info.post_id},
        {"frame_number", info.frame_number},
        {"timestamp", info.timestamp},
        {"is_keyframe", info.is_keyframe},
        {"width", info.width},
        {"height", info.height}
    };
}

void from_json(const json& j, FrameInfo& info) {
    j.at("post_id").get_to(info.post_id);
    j.at("frame_number").get_to(info.frame_number);
    j.at("timestamp").get_to(info.timestamp);
    j.at("is_keyframe").get_to(info.is_keyframe);
    info.width = j.value("width", 0);
    info.height = j.value("height", 0);
}

} // namespace mediaframes
