#pragma once

#include <map>
#include <memory>

#include "decode_limits.hpp"
#include "errors.hpp"
#include "frame.hpp"
#include "media_file.hpp"

namespace mediaframes {

class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    // Takes ownership of the file; it lives as long as the returned stream.
    virtual std::unique_ptr<FrameStream> decode(std::unique_ptr<MediaFile> file,
                                                const Limits& limits) = 0;
};

using DecoderRegistry = std::map<MediaType, std::shared_ptr<FrameDecoder>>;

} // namespace mediaframes
