#include "video_decoder.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <opencv2/imgproc.hpp>

namespace mediaframes {

namespace {

constexpr size_t kReadChunk = 64 * 1024;
constexpr long kMaxDimension = 1 << 15;

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Strict decimal parse: digits only, no sign, no trailing garbage.
bool parse_int(const std::string& s, long& out) {
    if (s.empty() || s.size() > 9) {
        return false;
    }
    long value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

PpmFrameReader::PpmFrameReader(ChildProcess& process)
    : process_(process), buffer_(kReadChunk) {}

bool PpmFrameReader::fill() {
    pos_ = 0;
    end_ = process_.read(buffer_.data(), buffer_.size());
    return end_ > 0;
}

std::optional<std::string> PpmFrameReader::read_line() {
    if (pos_ == end_ && !fill()) {
        return std::nullopt;
    }

    std::string line;
    while (true) {
        if (pos_ == end_ && !fill()) {
            throw DecodeError(DecodeFailure::MalformedHeader,
                              "stream ended inside a frame header");
        }
        char c = static_cast<char>(buffer_[pos_++]);
        if (c == '\n') {
            return trim(line);
        }
        line.push_back(c);
    }
}

std::string PpmFrameReader::read_header_line(const char* what) {
    auto line = read_line();
    if (!line) {
        throw DecodeError(DecodeFailure::MalformedHeader,
                          std::string("stream ended before ") + what);
    }
    return *line;
}

void PpmFrameReader::read_exact(uint8_t* out, size_t size) {
    size_t copied = 0;
    while (copied < size) {
        if (pos_ == end_ && !fill()) {
            throw DecodeError(DecodeFailure::TruncatedPayload,
                              "could not read the full frame, got " + std::to_string(copied) +
                              " of " + std::to_string(size) + " bytes");
        }
        size_t n = std::min(size - copied, end_ - pos_);
        std::memcpy(out + copied, buffer_.data() + pos_, n);
        pos_ += n;
        copied += n;
    }
}

bool PpmFrameReader::read_frame(cv::Mat& rgb) {
    auto format = read_line();
    if (!format) {
        return false;
    }
    if (*format != "P6") {
        throw DecodeError(DecodeFailure::UnsupportedFormat,
                          "frames returned by the transcoder have format '" + *format +
                          "', expected P6");
    }

    std::string dimensions = read_header_line("frame dimensions");
    auto space = dimensions.find(' ');
    long width = 0;
    long height = 0;
    if (space == std::string::npos ||
        !parse_int(dimensions.substr(0, space), width) ||
        !parse_int(dimensions.substr(space + 1), height) ||
        width <= 0 || height <= 0 || width > kMaxDimension || height > kMaxDimension) {
        throw DecodeError(DecodeFailure::MalformedHeader,
                          "invalid frame dimensions '" + dimensions + "'");
    }

    std::string max_value_line = read_header_line("maximum sample value");
    long max_value = 0;
    if (!parse_int(max_value_line, max_value)) {
        throw DecodeError(DecodeFailure::MalformedHeader,
                          "invalid maximum sample value '" + max_value_line + "'");
    }
    if (max_value != 255) {
        throw DecodeError(DecodeFailure::UnsupportedSampleDepth,
                          "max_value has to be 255, it is " + max_value_line);
    }

    rgb.create(static_cast<int>(height), static_cast<int>(width), CV_8UC3);
    read_exact(rgb.ptr<uint8_t>(), static_cast<size_t>(width) * height * 3);
    return true;
}

std::vector<std::string> build_ffmpeg_args(const Limits& limits,
                                           const VideoDecoderOptions& options) {
    // Keep the first keyframe, then the next one at least keyframe_interval later
    std::string select = "select='isnan(prev_selected_t)+gte(t-prev_selected_t," +
                         std::to_string(limits.keyframe_interval) + ")'";

    return {
        options.ffmpeg_path,
        "-hide_banner",
        "-loglevel", "error",
        "-threads", "1",
        "-skip_frame", "nokey",
        "-vsync", "0",
        "-i", "pipe:",
        "-vf", select,
        "-vcodec", "ppm",
        "-f", "rawvideo",
        "pipe:"
    };
}

namespace {

// Owns the transcoder process and the input file for one decode.
class KeyframeStream : public FrameStream {
public:
    KeyframeStream(std::unique_ptr<MediaFile> file,
                   std::unique_ptr<ChildProcess> process,
                   std::chrono::milliseconds exit_timeout)
        : file_(std::move(file))
        , process_(std::move(process))
        , reader_(*process_)
        , exit_timeout_(exit_timeout) {}

    ~KeyframeStream() override {
        close();
    }

    bool next(DecodedFrame& frame) override {
        if (closed_) {
            return false;
        }

        try {
            cv::Mat rgb;
            if (!reader_.read_frame(rgb)) {
                finish();
                return false;
            }

            frame = DecodedFrame{};
            cv::cvtColor(rgb, frame.image, cv::COLOR_RGB2BGR);
            frame.frame_number = frame_count_++;
            frame.is_keyframe = true;
            return true;
        } catch (...) {
            close();
            throw;
        }
    }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        process_->terminate();
        file_.reset();
    }

private:
    void finish() {
        auto status = process_->wait_for(exit_timeout_);
        if (!status) {
            throw DecodeError(DecodeFailure::ProcessTimeout,
                              "transcoder still running " +
                              std::to_string(exit_timeout_.count()) +
                              " ms after closing its output");
        }

        std::string error_output = *status != 0 ? process_->error_output() : std::string();
        close();
        if (*status != 0) {
            throw DecodeError::process_failed(*status, error_output);
        }
        log_debug("Decoded " + std::to_string(frame_count_) + " keyframes");
    }

    std::unique_ptr<MediaFile> file_;
    std::unique_ptr<ChildProcess> process_;
    PpmFrameReader reader_;
    std::chrono::milliseconds exit_timeout_;
    int64_t frame_count_ = 0;
    bool closed_ = false;
};

} // namespace

VideoFrameStreamDecoder::VideoFrameStreamDecoder(VideoDecoderOptions options)
    : VideoFrameStreamDecoder(std::move(options),
                              std::make_shared<PosixProcessLauncher>(),
                              std::make_shared<OpenCvMediaProbe>()) {}

VideoFrameStreamDecoder::VideoFrameStreamDecoder(VideoDecoderOptions options,
                                                 std::shared_ptr<ProcessLauncher> launcher,
                                                 std::shared_ptr<MediaProbe> probe)
    : options_(std::move(options))
    , launcher_(std::move(launcher))
    , probe_(std::move(probe)) {}

void VideoFrameStreamDecoder::check_duration(const MediaFile& file, const Limits& limits) {
    auto duration = probe_->duration(file.path());
    if (!duration) {
        log_warning("Failed to get video duration of " + file.path() + ", not enforcing limit");
        return;
    }
    if (*duration > limits.max_duration) {
        throw DecodeError::limit_exceeded(
            DecodeFailure::DurationLimitExceeded,
            LimitViolation{"max_duration", static_cast<double>(limits.max_duration), *duration});
    }
}

void VideoFrameStreamDecoder::check_size(const MediaFile& file, const Limits& limits) {
    size_t file_size = file.size();
    size_t limit = limits.max_upload_size_bytes();
    if (file_size > limit) {
        throw DecodeError::limit_exceeded(
            DecodeFailure::SizeLimitExceeded,
            LimitViolation{"max_upload_size_bytes", static_cast<double>(limit),
                           static_cast<double>(file_size)});
    }
}

std::unique_ptr<FrameStream> VideoFrameStreamDecoder::decode(std::unique_ptr<MediaFile> file,
                                                             const Limits& limits) {
    check_duration(*file, limits);
    check_size(*file, limits);

    file->rewind();
    auto process = launcher_->launch(build_ffmpeg_args(limits, options_), file->fd());
    return std::make_unique<KeyframeStream>(std::move(file), std::move(process),
                                            options_.exit_timeout);
}

} // namespace mediaframes
