#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mediaframes {

// Read-only handle to a stored media file. The descriptor is closed when the
// object is destroyed. I/O failures throw std::system_error.
class MediaFile {
public:
    static std::unique_ptr<MediaFile> open(const std::string& path);

    ~MediaFile();

    MediaFile(const MediaFile&) = delete;
    MediaFile& operator=(const MediaFile&) = delete;

    const std::string& path() const { return path_; }
    int fd() const { return fd_; }

    size_t size() const;
    void rewind();
    std::vector<uint8_t> read_all();

private:
    MediaFile(std::string path, int fd);

    std::string path_;
    int fd_;
};

} // namespace mediaframes
