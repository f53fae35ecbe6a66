#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace mediaframes {

enum class MediaType {
    IMAGE,
    VIDEO
};

std::string to_string(MediaType type);

class MediaError : public std::runtime_error {
public:
    explicit MediaError(const std::string& message) : std::runtime_error(message) {}
};

// The stored file for a post is missing or could not be read.
class MediaNotFoundError : public MediaError {
public:
    MediaNotFoundError(int64_t post_id, std::string path, const std::string& cause);

    int64_t post_id() const { return post_id_; }
    const std::string& path() const { return path_; }

private:
    int64_t post_id_;
    std::string path_;
};

enum class DecodeFailure {
    InvalidImage,
    DurationLimitExceeded,
    SizeLimitExceeded,
    UnsupportedFormat,
    MalformedHeader,
    UnsupportedSampleDepth,
    TruncatedPayload,
    ProcessFailed,
    ProcessTimeout
};

const char* to_string(DecodeFailure reason);

struct LimitViolation {
    std::string limit_name;
    double limit_value;
    double actual_value;
};

class DecodeError : public MediaError {
public:
    DecodeError(DecodeFailure reason, const std::string& detail);

    static DecodeError limit_exceeded(DecodeFailure reason, LimitViolation violation);
    static DecodeError process_failed(int exit_status, const std::string& error_output);

    DecodeFailure reason() const { return reason_; }
    const std::string& detail() const { return detail_; }
    const std::optional<LimitViolation>& violation() const { return violation_; }
    const std::optional<int>& exit_status() const { return exit_status_; }

private:
    DecodeFailure reason_;
    std::string detail_;
    std::optional<LimitViolation> violation_;
    std::optional<int> exit_status_;
};

// No decoder is registered for the post's media type.
class UnsupportedTypeError : public MediaError {
public:
    UnsupportedTypeError(int64_t post_id, MediaType type);

    int64_t post_id() const { return post_id_; }
    MediaType media_type() const { return type_; }

private:
    int64_t post_id_;
    MediaType type_;
};

} // namespace mediaframes
