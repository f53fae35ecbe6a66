#include "image_decoder.hpp"
#include <opencv2/imgcodecs.hpp>

namespace mediaframes {

cv::Mat ImageDecoder::decode(const std::vector<uint8_t>& bytes) const {
    if (bytes.empty()) {
        throw DecodeError(DecodeFailure::InvalidImage, "could not decode image");
    }

    cv::Mat image;
    try {
        image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception&) {
        throw DecodeError(DecodeFailure::InvalidImage, "could not decode image");
    }

    // imdecode signals most failures with an empty result
    if (image.empty()) {
        throw DecodeError(DecodeFailure::InvalidImage, "could not decode image");
    }
    return image;
}

cv::Mat ImageDecoder::decode(MediaFile& file) const {
    return decode(file.read_all());
}

namespace {

class SingleImageStream : public FrameStream {
public:
    explicit SingleImageStream(cv::Mat image) : image_(std::move(image)) {}

    bool next(DecodedFrame& frame) override {
        if (done_) {
            return false;
        }
        done_ = true;

        frame = DecodedFrame{};
        frame.image = std::move(image_);
        frame.frame_number = 0;
        frame.is_keyframe = false;
        return true;
    }

    void close() override {
        done_ = true;
        image_.release();
    }

private:
    cv::Mat image_;
    bool done_ = false;
};

} // namespace

std::unique_ptr<FrameStream> ImageFrameDecoder::decode(std::unique_ptr<MediaFile> file,
                                                       const Limits& /*limits*/) {
    // The whole file is read up front, so the handle is released right here.
    cv::Mat image = decoder_.decode(*file);
    file.reset();
    return std::make_unique<SingleImageStream>(std::move(image));
}

} // namespace mediaframes
