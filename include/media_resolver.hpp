#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "frame_decoder.hpp"

namespace mediaframes {

// What the resolver needs to know about a post.
struct MediaReference {
    int64_t post_id = 0;
    MediaType type = MediaType::IMAGE;
    std::string image;                   // primary file, relative to the media root
    std::optional<std::string> fullsize; // relative to <media root>/full
};

class MediaResolver {
public:
    // media_root has to be an existing directory.
    MediaResolver(const std::string& media_root, Limits limits, DecoderRegistry decoders);
    ~MediaResolver();

    // Picks the file to decode for the post and opens a frame stream on it.
    std::unique_ptr<FrameStream> get_frames(const MediaReference& post);

    // Path get_frames would read for the post.
    std::string resolve_path(const MediaReference& post) const;

    const Limits& limits() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

DecoderRegistry make_default_registry(const VideoDecoderOptions& options = {});

} // namespace mediaframes
