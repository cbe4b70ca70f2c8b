#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

// Read-only handle on the measurement file.
// Positional reads (pread) do not touch a shared file position, so one InputFile
// can be read from every worker thread at once.
class InputFile {
public:
    explicit InputFile(const std::string& path);
    ~InputFile();

    InputFile(const InputFile&) = delete;
    InputFile& operator=(const InputFile&) = delete;

    const std::string& path() const { return path_; }
    uint64_t size() const { return size_; }

    // Read exactly `length` bytes starting at `offset` into `dst`.
    // Throws IoError on a failed or short read.
    void read_at(uint64_t offset, char* dst, size_t length) const;

private:
    std::string path_;
    int fd_ = -1;
    uint64_t size_ = 0;
};
