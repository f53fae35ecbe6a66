#include "media_file.hpp"
#include <cerrno>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mediaframes {

std::unique_ptr<MediaFile> MediaFile::open(const std::string& path) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot open " + path);
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(), "Cannot stat " + path);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        throw std::system_error(EISDIR, std::generic_category(), "Not a regular file: " + path);
    }

    return std::unique_ptr<MediaFile>(new MediaFile(path, fd));
}

MediaFile::MediaFile(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

MediaFile::~MediaFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

size_t MediaFile::size() const {
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot stat " + path_);
    }
    return static_cast<size_t>(st.st_size);
}

void MediaFile::rewind() {
    if (::lseek(fd_, 0, SEEK_SET) < 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot seek " + path_);
    }
}

std::vector<uint8_t> MediaFile::read_all() {
    rewind();

    std::vector<uint8_t> data;
    data.reserve(size());

    uint8_t chunk[64 * 1024];
    while (true) {
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "Cannot read " + path_);
        }
        if (n == 0) {
            break;
        }
        data.insert(data.end(), chunk, chunk + n);
    }
    return data;
}

} // namespace mediaframes
