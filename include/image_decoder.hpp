#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>

#include "frame_decoder.hpp"

namespace mediaframes {

class ImageDecoder {
public:
    // Decodes an encoded image into a BGR cv::Mat. Throws DecodeError.
    cv::Mat decode(const std::vector<uint8_t>& bytes) const;
    cv::Mat decode(MediaFile& file) const;
};

// Exposes a still image as a one-frame stream.
class ImageFrameDecoder : public FrameDecoder {
public:
    std::unique_ptr<FrameStream> decode(std::unique_ptr<MediaFile> file,
                                        const Limits& limits) override;

private:
    ImageDecoder decoder_;
};

} // namespace mediaframes
