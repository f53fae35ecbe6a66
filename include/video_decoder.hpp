#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "frame_decoder.hpp"
#include "media_probe.hpp"
#include "process.hpp"

namespace mediaframes {

// Parses a sequence of binary PPM (P6, maxval 255) records from a child
// process's stdout. Header lines are read up to their newline only, so the
// payload that follows is never consumed early.
class PpmFrameReader {
public:
    explicit PpmFrameReader(ChildProcess& process);

    // Reads the next record as an RGB image. Returns false on a clean end of
    // stream before the first header line. Throws DecodeError otherwise.
    bool read_frame(cv::Mat& rgb);

private:
    std::optional<std::string> read_line();
    std::string read_header_line(const char* what);
    void read_exact(uint8_t* out, size_t size);
    bool fill();

    ChildProcess& process_;
    std::vector<uint8_t> buffer_;
    size_t pos_ = 0;
    size_t end_ = 0;
};

// Arguments for a keyframe-only transcoder run reading stdin and writing
// raw PPM frames to stdout.
std::vector<std::string> build_ffmpeg_args(const Limits& limits,
                                           const VideoDecoderOptions& options);

class VideoFrameStreamDecoder : public FrameDecoder {
public:
    explicit VideoFrameStreamDecoder(VideoDecoderOptions options = {});
    VideoFrameStreamDecoder(VideoDecoderOptions options,
                            std::shared_ptr<ProcessLauncher> launcher,
                            std::shared_ptr<MediaProbe> probe);

    // Checks duration and size limits, then starts the transcoder. Frames are
    // produced as the returned stream is pulled.
    std::unique_ptr<FrameStream> decode(std::unique_ptr<MediaFile> file,
                                        const Limits& limits) override;

    const VideoDecoderOptions& options() const { return options_; }

private:
    void check_duration(const MediaFile& file, const Limits& limits);
    void check_size(const MediaFile& file, const Limits& limits);

    VideoDecoderOptions options_;
    std::shared_ptr<ProcessLauncher> launcher_;
    std::shared_ptr<MediaProbe> probe_;
};

} // namespace mediaframes
