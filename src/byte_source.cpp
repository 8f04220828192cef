#include "tusclient/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace tusclient {

// --- FileByteSource ---

FileByteSource::FileByteSource(const std::filesystem::path& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "cannot open " + path.string());
    }
}

FileByteSource::~FileByteSource() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

uint64_t FileByteSource::seek(int64_t offset, Whence whence) {
    off_t pos = ::lseek(fd_, static_cast<off_t>(offset),
                        whence == Whence::Begin ? SEEK_SET : SEEK_END);
    if (pos < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "cannot seek in " + path_.string());
    }
    return static_cast<uint64_t>(pos);
}

std::vector<uint8_t> FileByteSource::read(size_t max_bytes) {
    std::vector<uint8_t> buf(max_bytes);
    size_t total = 0;
    // Fill the buffer unless EOF comes first; read() may return short counts
    while (total < max_bytes) {
        ssize_t n = ::read(fd_, buf.data() + total, max_bytes - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(),
                                    "cannot read " + path_.string());
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
    }
    buf.resize(total);
    return buf;
}

// --- MemoryByteSource ---

uint64_t MemoryByteSource::seek(int64_t offset, Whence whence) {
    int64_t base = (whence == Whence::Begin) ? 0 : static_cast<int64_t>(data_.size());
    int64_t target = base + offset;
    if (target < 0) {
        throw std::system_error(EINVAL, std::generic_category(), "seek before start of buffer");
    }
    pos_ = static_cast<size_t>(target);
    return static_cast<uint64_t>(pos_);
}

std::vector<uint8_t> MemoryByteSource::read(size_t max_bytes) {
    if (pos_ >= data_.size()) {
        return {};
    }
    size_t n = std::min(max_bytes, data_.size() - pos_);
    std::vector<uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                             data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return out;
}

void MemoryByteSource::truncate(size_t new_size) {
    if (new_size < data_.size()) {
        data_.resize(new_size);
    }
}

}  // namespace tusclient
