#include <gtest/gtest.h>
#include "media_resolver.hpp"
#include "logging.hpp"
#include "test_support.hpp"
#include <opencv2/imgcodecs.hpp>
#include <cerrno>
#include <system_error>

namespace mediaframes {

using namespace testing_support;

namespace {

class StaticFrameStream : public FrameStream {
public:
    explicit StaticFrameStream(bool fail_with_io_error) : fail_(fail_with_io_error) {}

    bool next(DecodedFrame& frame) override {
        if (fail_) {
            throw std::system_error(EIO, std::generic_category(), "read failed");
        }
        if (done_) return false;
        done_ = true;
        frame.image = cv::Mat(4, 4, CV_8UC3, cv::Scalar(1, 2, 3));
        return true;
    }

    void close() override { done_ = true; }

private:
    bool fail_;
    bool done_ = false;
};

// Records which file it was handed instead of decoding it.
class RecordingDecoder : public FrameDecoder {
public:
    std::unique_ptr<FrameStream> decode(std::unique_ptr<MediaFile> file,
                                        const Limits& limits) override {
        calls++;
        opened_path = file->path();
        seen_max_duration = limits.max_duration;
        if (throw_decode_error) {
            throw DecodeError(DecodeFailure::InvalidImage, "could not decode image");
        }
        return std::make_unique<StaticFrameStream>(fail_while_streaming);
    }

    int calls = 0;
    std::string opened_path;
    int seen_max_duration = 0;
    bool throw_decode_error = false;
    bool fail_while_streaming = false;
};

} // namespace

class MediaResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        decoder_ = std::make_shared<RecordingDecoder>();
        registry_[MediaType::IMAGE] = decoder_;
        registry_[MediaType::VIDEO] = decoder_;
        limits_.max_duration = 42;
    }

    void TearDown() override {
        set_log_level(LogLevel::Info);
    }

    MediaResolver make_resolver() {
        return MediaResolver(root_.path().string(), limits_, registry_);
    }

    MediaReference post(const std::string& image,
                        std::optional<std::string> fullsize = std::nullopt,
                        MediaType type = MediaType::IMAGE) {
        MediaReference ref;
        ref.post_id = 1234;
        ref.type = type;
        ref.image = image;
        ref.fullsize = std::move(fullsize);
        return ref;
    }

    TempDir root_;
    Limits limits_;
    DecoderRegistry registry_;
    std::shared_ptr<RecordingDecoder> decoder_;
};

TEST_F(MediaResolverTest, RequiresExistingMediaRoot) {
    EXPECT_THROW(MediaResolver((root_.path() / "missing").string(), limits_, registry_),
                 std::invalid_argument);
    EXPECT_THROW(MediaResolver("", limits_, registry_), std::invalid_argument);
}

TEST_F(MediaResolverTest, UsesPrimaryFileWithoutFullsize) {
    std::string primary = root_.write("2024/01/a.jpg", "data");
    auto resolver = make_resolver();

    auto stream = resolver.get_frames(post("2024/01/a.jpg"));
    EXPECT_EQ(decoder_->opened_path, primary);
    EXPECT_EQ(decoder_->seen_max_duration, 42);

    DecodedFrame frame;
    EXPECT_TRUE(stream->next(frame));
    EXPECT_FALSE(stream->next(frame));
}

TEST_F(MediaResolverTest, PrefersExistingFullsizeFile) {
    root_.write("a.jpg", "small");
    std::string fullsize = root_.write("full/a_big.jpg", "big");
    set_log_level(LogLevel::Debug);
    auto resolver = make_resolver();

    ::testing::internal::CaptureStdout();
    auto stream = resolver.get_frames(post("a.jpg", std::string("a_big.jpg")));
    std::string logged = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(decoder_->opened_path, fullsize);
    EXPECT_NE(logged.find("Using fullsize image"), std::string::npos);
}

TEST_F(MediaResolverTest, FallsBackToPrimaryWhenFullsizeIsMissing) {
    std::string primary = root_.write("a.jpg", "small");
    auto resolver = make_resolver();

    ::testing::internal::CaptureStderr();
    auto stream = resolver.get_frames(post("a.jpg", std::string("a_big.jpg")));
    std::string logged = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(decoder_->opened_path, primary);
    EXPECT_NE(logged.find("[WARN]"), std::string::npos);
    EXPECT_NE(logged.find("Falling back to resized image"), std::string::npos);
    EXPECT_NE(logged.find("1234"), std::string::npos);
}

TEST_F(MediaResolverTest, UnregisteredTypeFailsWithoutTouchingFiles) {
    registry_.erase(MediaType::VIDEO);
    auto resolver = make_resolver();

    ::testing::internal::CaptureStderr();
    try {
        resolver.get_frames(post("missing.mp4", std::string("missing_full.mp4"), MediaType::VIDEO));
        FAIL() << "expected UnsupportedTypeError";
    } catch (const UnsupportedTypeError& e) {
        EXPECT_EQ(e.post_id(), 1234);
        EXPECT_EQ(e.media_type(), MediaType::VIDEO);
    }
    std::string logged = ::testing::internal::GetCapturedStderr();

    // The fullsize variant was never looked up
    EXPECT_EQ(logged.find("Falling back"), std::string::npos);
    EXPECT_EQ(decoder_->calls, 0);
}

TEST_F(MediaResolverTest, MissingFileRaisesMediaNotFound) {
    auto resolver = make_resolver();

    try {
        resolver.get_frames(post("gone.jpg"));
        FAIL() << "expected MediaNotFoundError";
    } catch (const MediaNotFoundError& e) {
        EXPECT_EQ(e.post_id(), 1234);
        EXPECT_EQ(e.path(), (root_.path() / "gone.jpg").string());
    }
    EXPECT_EQ(decoder_->calls, 0);
}

TEST_F(MediaResolverTest, DirectoryInsteadOfFileRaisesMediaNotFound) {
    std::filesystem::create_directories(root_.path() / "dir.jpg");
    auto resolver = make_resolver();

    EXPECT_THROW(resolver.get_frames(post("dir.jpg")), MediaNotFoundError);
}

TEST_F(MediaResolverTest, DecodeErrorsPropagateUnchanged) {
    root_.write("a.jpg", "data");
    decoder_->throw_decode_error = true;
    auto resolver = make_resolver();

    EXPECT_THROW(resolver.get_frames(post("a.jpg")), DecodeError);
}

TEST_F(MediaResolverTest, ReadFailureWhileStreamingRaisesMediaNotFound) {
    std::string primary = root_.write("a.mp4", "data");
    decoder_->fail_while_streaming = true;
    auto resolver = make_resolver();

    auto stream = resolver.get_frames(post("a.mp4", std::nullopt, MediaType::VIDEO));
    DecodedFrame frame;
    try {
        stream->next(frame);
        FAIL() << "expected MediaNotFoundError";
    } catch (const MediaNotFoundError& e) {
        EXPECT_EQ(e.path(), primary);
        EXPECT_NE(std::string(e.what()).find("read failed"), std::string::npos);
    }
}

TEST_F(MediaResolverTest, DecodesStoredImageWithDefaultRegistry) {
    cv::Mat image(30, 50, CV_8UC3, cv::Scalar(10, 200, 30));
    std::vector<uint8_t> png;
    ASSERT_TRUE(cv::imencode(".png", image, png));
    root_.write("photo.png", std::string(png.begin(), png.end()));

    MediaResolver resolver(root_.path().string(), limits_, make_default_registry());
    auto stream = resolver.get_frames(post("photo.png"));
    auto frames = collect_frames(*stream, 10);

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].width(), 50);
    EXPECT_EQ(frames[0].height(), 30);
    EXPECT_EQ(frames[0].image.at<cv::Vec3b>(5, 5), cv::Vec3b(10, 200, 30));
}

TEST_F(MediaResolverTest, RegistryWithoutDecoderInstanceIsUnsupported) {
    registry_[MediaType::IMAGE] = nullptr;
    auto resolver = make_resolver();

    EXPECT_THROW(resolver.get_frames(post("a.jpg")), UnsupportedTypeError);
}

} // namespace mediaframes
