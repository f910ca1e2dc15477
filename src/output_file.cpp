#include "rangeget/output_file.hpp"

#include <cerrno>
#include <utility>

#include <sys/types.h>
#include <unistd.h>

namespace rangeget {

namespace {

std::error_code lastError() {
    return {errno, std::generic_category()};
}

} // namespace

OutputFile::OutputFile(std::string path) : path_(std::move(path)) {
    file_.reset(std::fopen(path_.c_str(), "wb+"));
    if (!file_) {
        throw std::system_error(lastError(), "Cannot create destination file " + path_);
    }
}

std::error_code OutputFile::preallocate(std::uint64_t size) {
    if (!file_) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    if (ftruncate(fileno(file_.get()), static_cast<off_t>(size)) == -1) {
        return lastError();
    }
    return {};
}

std::error_code OutputFile::writeAt(const char* data, std::size_t size, std::uint64_t offset) noexcept {
    if (!file_) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    const int fd = fileno(file_.get());
    while (size > 0) {
        const ssize_t written = pwrite(fd, data, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return lastError();
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
    return {};
}

std::error_code OutputFile::append(const char* data, std::size_t size) noexcept {
    if (!file_) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    if (std::fwrite(data, 1, size, file_.get()) != size) {
        return lastError();
    }
    return {};
}

std::error_code OutputFile::close() {
    if (!file_) {
        return {};
    }
    FILE* fp = file_.release();
    if (std::fflush(fp) != 0) {
        const auto ec = lastError();
        std::fclose(fp);
        return ec;
    }
    if (std::fclose(fp) != 0) {
        return lastError();
    }
    return {};
}

} // namespace rangeget
