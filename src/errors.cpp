#include "errors.hpp"

namespace mediaframes {

std::string to_string(MediaType type) {
    switch (type) {
        case MediaType::IMAGE: return "IMAGE";
        case MediaType::VIDEO: return "VIDEO";
    }
    return "UNKNOWN";
}

const char* to_string(DecodeFailure reason) {
    switch (reason) {
        case DecodeFailure::InvalidImage: return "invalid image";
        case DecodeFailure::DurationLimitExceeded: return "duration limit exceeded";
        case DecodeFailure::SizeLimitExceeded: return "size limit exceeded";
        case DecodeFailure::UnsupportedFormat: return "unsupported frame format";
        case DecodeFailure::MalformedHeader: return "malformed frame header";
        case DecodeFailure::UnsupportedSampleDepth: return "unsupported sample depth";
        case DecodeFailure::TruncatedPayload: return "truncated frame";
        case DecodeFailure::ProcessFailed: return "transcoder failed";
        case DecodeFailure::ProcessTimeout: return "transcoder did not exit";
    }
    return "decode error";
}

MediaNotFoundError::MediaNotFoundError(int64_t post_id, std::string path, const std::string& cause)
    : MediaError("Could not read images for post " + std::to_string(post_id) +
                 " from file " + path + ": " + cause)
    , post_id_(post_id)
    , path_(std::move(path)) {}

DecodeError::DecodeError(DecodeFailure reason, const std::string& detail)
    : MediaError(std::string(to_string(reason)) + ": " + detail)
    , reason_(reason)
    , detail_(detail) {}

DecodeError DecodeError::limit_exceeded(DecodeFailure reason, LimitViolation violation) {
    DecodeError error(reason, violation.limit_name + " is " +
                              std::to_string(violation.actual_value) +
                              ", maximum allowed is " +
                              std::to_string(violation.limit_value));
    error.violation_ = std::move(violation);
    return error;
}

DecodeError DecodeError::process_failed(int exit_status, const std::string& error_output) {
    DecodeError error(DecodeFailure::ProcessFailed,
                      "exit status " + std::to_string(exit_status) + ": " + error_output);
    error.exit_status_ = exit_status;
    return error;
}

UnsupportedTypeError::UnsupportedTypeError(int64_t post_id, MediaType type)
    : MediaError("Decoder needed for post " + std::to_string(post_id) + " of type " +
                 to_string(type) + " is not implemented")
    , post_id_(post_id)
    , type_(type) {}

} // namespace mediaframes
