#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tusclient {

/// Seekable, readable stream of bytes. Not safe for concurrent use: there is
/// a single read cursor.
class ByteSource {
public:
    enum class Whence {
        Begin,
        End
    };

    virtual ~ByteSource() = default;

    /// Move the read cursor. Returns the new absolute position.
    /// Throws std::system_error on I/O failure.
    virtual uint64_t seek(int64_t offset, Whence whence) = 0;

    /// Read up to max_bytes from the cursor. Returns an empty vector at EOF.
    /// Throws std::system_error on I/O failure.
    virtual std::vector<uint8_t> read(size_t max_bytes) = 0;

    /// Total length, found by seeking to the end (the cursor is left there).
    uint64_t size() { return seek(0, Whence::End); }
};

/// Byte source over a regular file. Owns the descriptor it opens.
class FileByteSource : public ByteSource {
public:
    /// Throws std::system_error if the file cannot be opened.
    explicit FileByteSource(const std::filesystem::path& path);
    ~FileByteSource() override;

    FileByteSource(const FileByteSource&) = delete;
    FileByteSource& operator=(const FileByteSource&) = delete;

    uint64_t seek(int64_t offset, Whence whence) override;
    std::vector<uint8_t> read(size_t max_bytes) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

/// Byte source over an in-memory buffer.
class MemoryByteSource : public ByteSource {
public:
    MemoryByteSource() = default;
    explicit MemoryByteSource(std::vector<uint8_t> data) : data_(std::move(data)) {}
    explicit MemoryByteSource(const std::string& data) : data_(data.begin(), data.end()) {}

    uint64_t seek(int64_t offset, Whence whence) override;
    std::vector<uint8_t> read(size_t max_bytes) override;

    const std::vector<uint8_t>& data() const { return data_; }

    /// Drop everything past `new_size`. Lets tests simulate a source that
    /// shrinks under an ongoing transfer.
    void truncate(size_t new_size);

private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
};

}  // namespace tusclient
