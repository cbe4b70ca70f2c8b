#include "include/input_file.hpp"
#include "include/aggregation_error.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

InputFile::InputFile(const std::string& path) : path_(path) {
    // Open the input file in read-only mode
    fd_ = open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw IoError("Failed to open input file " + path + ": " + std::strerror(errno));
    }

    // Retrieve the file size once, the file is not expected to grow during a run
    struct stat st;
    if (fstat(fd_, &st) < 0) {
        int err = errno;
        close(fd_);
        fd_ = -1;
        throw IoError("fstat failed on " + path + ": " + std::strerror(err));
    }
    size_ = static_cast<uint64_t>(st.st_size);
}

InputFile::~InputFile() {
    if (fd_ >= 0 && close(fd_) == -1) {
        std::cerr << "Warning: failed to close " << path_ << ": " << std::strerror(errno) << std::endl;
    }
}

void InputFile::read_at(uint64_t offset, char* dst, size_t length) const {
    size_t done = 0;
    // pread may return fewer bytes than asked, keep going until the request is filled
    while (done < length) {
        ssize_t n = pread(fd_, dst + done, length - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("pread failed on " + path_ + ": " + std::strerror(errno), offset + done);
        }
        if (n == 0) {
            throw IoError("Unexpected end of file while reading " + path_, offset + done);
        }
        done += static_cast<size_t>(n);
    }
}
