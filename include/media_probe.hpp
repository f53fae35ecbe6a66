#pragma once

#include <optional>
#include <string>

namespace mediaframes {

class MediaProbe {
public:
    virtual ~MediaProbe() = default;

    // Container duration in seconds, nullopt when it cannot be determined.
    virtual std::optional<double> duration(const std::string& path) = 0;
};

class OpenCvMediaProbe : public MediaProbe {
public:
    std::optional<double> duration(const std::string& path) override;
};

} // namespace mediaframes
