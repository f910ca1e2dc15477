#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <system_error>

namespace rangeget {

// Destination file of a transfer. Offset writes use pwrite and need no
// locking as long as callers address disjoint ranges. None of the write
// operations throw, so they are safe to call from libcurl callbacks.
class OutputFile {
public:
    // Creates or truncates the file. Throws std::system_error on failure.
    explicit OutputFile(std::string path);

    [[nodiscard]] std::error_code preallocate(std::uint64_t size);
    [[nodiscard]] std::error_code writeAt(const char* data, std::size_t size,
                                          std::uint64_t offset) noexcept;
    [[nodiscard]] std::error_code append(const char* data, std::size_t size) noexcept;
    [[nodiscard]] std::error_code close();

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] bool isOpen() const { return file_ != nullptr; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::string path_;
    std::unique_ptr<FILE, FileDeleter> file_{};
};

} // namespace rangeget
