#include <gtest/gtest.h>
#include "frame.hpp"

using json = nlohmann::json;

namespace mediaframes {

namespace {

class CountingStream : public FrameStream {
public:
    explicit CountingStream(int total) : total_(total) {}

    bool next(DecodedFrame& frame) override {
        if (closed || produced >= total_) return false;
        frame.image = cv::Mat(2, 3, CV_8UC3, cv::Scalar::all(produced));
        frame.frame_number = produced++;
        frame.is_keyframe = true;
        return true;
    }

    void close() override { closed = true; }

    int produced = 0;
    bool closed = false;

private:
    int total_;
};

} // namespace

TEST(FrameInfoTest, CollectStopsAtLimitAndCloses) {
    CountingStream stream(10);

    auto frames = collect_frames(stream, 4);

    ASSERT_EQ(frames.size(), 4u);
    EXPECT_EQ(stream.produced, 4);
    EXPECT_TRUE(stream.closed);
    for (size_t i = 0; i < frames.size(); ++i) {
        EXPECT_EQ(frames[i].frame_number, static_cast<int64_t>(i));
        EXPECT_EQ(frames[i].image.at<cv::Vec3b>(0, 0)[0], static_cast<uint8_t>(i));
    }
}

TEST(FrameInfoTest, CollectReturnsShortSequences) {
    CountingStream stream(2);

    auto frames = collect_frames(stream, 100);
    EXPECT_EQ(frames.size(), 2u);
    EXPECT_TRUE(stream.closed);
}

TEST(FrameInfoTest, SerializesForPersistence) {
    DecodedFrame frame;
    frame.image = cv::Mat(480, 640, CV_8UC3);
    frame.frame_number = 12;
    frame.timestamp = 6.5;
    frame.is_keyframe = true;

    json j = make_frame_info(99, frame);

    EXPECT_EQ(j["post_id"], 99);
    EXPECT_EQ(j["frame_number"], 12);
    EXPECT_DOUBLE_EQ(j["timestamp"].get<double>(), 6.5);
    EXPECT_EQ(j["is_keyframe"], true);
    EXPECT_EQ(j["width"], 640);
    EXPECT_EQ(j["height"], 480);

    auto info = j.get<FrameInfo>();
    EXPECT_EQ(info.frame_number, 12);
    EXPECT_EQ(info.width, 640);
}

TEST(FrameInfoTest, MissingTimestampIsStoredAsZero) {
    DecodedFrame frame;
    frame.image = cv::Mat(1, 1, CV_8UC3);

    auto info = make_frame_info(1, frame);
    EXPECT_DOUBLE_EQ(info.timestamp, 0.0);
    EXPECT_FALSE(info.is_keyframe);
}

} // namespace mediaframes
