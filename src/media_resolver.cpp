#include "media_resolver.hpp"
#include "image_decoder.hpp"
#include "logging.hpp"
#include "video_decoder.hpp"
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace mediaframes {

namespace {

// Reports I/O failures while frames are pulled against the post and path
// they were read from. Decoder errors pass through untouched.
class ResolvedFrameStream : public FrameStream {
public:
    ResolvedFrameStream(std::unique_ptr<FrameStream> inner, int64_t post_id, std::string path)
        : inner_(std::move(inner)), post_id_(post_id), path_(std::move(path)) {}

    bool next(DecodedFrame& frame) override {
        try {
            return inner_->next(frame);
        } catch (const std::system_error& e) {
            inner_->close();
            throw MediaNotFoundError(post_id_, path_, e.what());
        }
    }

    void close() override {
        inner_->close();
    }

private:
    std::unique_ptr<FrameStream> inner_;
    int64_t post_id_;
    std::string path_;
};

} // namespace

class MediaResolver::Impl {
public:
    Impl(const std::string& media_root, Limits limits, DecoderRegistry decoders)
        : media_root_(media_root)
        , limits_(std::move(limits))
        , decoders_(std::move(decoders)) {
        std::error_code ec;
        if (media_root.empty() || !fs::is_directory(media_root_, ec)) {
            throw std::invalid_argument("media root has to be an existing directory: '" +
                                        media_root + "'");
        }
        limits_.validate();
    }

    std::string resolve_path(const MediaReference& post) const {
        fs::path media_file = media_root_ / post.image;

        if (post.fullsize && !post.fullsize->empty()) {
            fs::path fullsize_file = media_root_ / "full" / *post.fullsize;
            std::error_code ec;
            if (!fs::is_regular_file(fullsize_file, ec)) {
                log_warning("Fullsize image for " + std::to_string(post.post_id) + " not found at " +
                            fs::absolute(fullsize_file, ec).string() +
                            ". Falling back to resized image");
            } else {
                log_debug("Using fullsize image " + fs::absolute(fullsize_file, ec).string());
                media_file = fullsize_file;
            }
        }
        return media_file.string();
    }

    std::unique_ptr<FrameStream> get_frames(const MediaReference& post) {
        auto it = decoders_.find(post.type);
        if (it == decoders_.end() || !it->second) {
            throw UnsupportedTypeError(post.post_id, post.type);
        }

        std::string path = resolve_path(post);
        try {
            auto file = MediaFile::open(path);
            auto frames = it->second->decode(std::move(file), limits_);
            return std::make_unique<ResolvedFrameStream>(std::move(frames), post.post_id, path);
        } catch (const std::system_error& e) {
            throw MediaNotFoundError(post.post_id, path, e.what());
        }
    }

    const Limits& limits() const { return limits_; }

private:
    fs::path media_root_;
    const Limits limits_;
    DecoderRegistry decoders_;
};

MediaResolver::MediaResolver(const std::string& media_root, Limits limits, DecoderRegistry decoders)
    : pimpl_(std::make_unique<Impl>(media_root, std::move(limits), std::move(decoders))) {}

MediaResolver::~MediaResolver() = default;

std::unique_ptr<FrameStream> MediaResolver::get_frames(const MediaReference& post) {
    return pimpl_->get_frames(post);
}

std::string MediaResolver::resolve_path(const MediaReference& post) const {
    return pimpl_->resolve_path(post);
}

const Limits& MediaResolver::limits() const {
    return pimpl_->limits();
}

DecoderRegistry make_default_registry(const VideoDecoderOptions& options) {
    DecoderRegistry registry;
    registry[MediaType::IMAGE] = std::make_shared<ImageFrameDecoder>();
    registry[MediaType::VIDEO] = std::make_shared<VideoFrameStreamDecoder>(options);
    return registry;
}

} // namespace mediaframes
