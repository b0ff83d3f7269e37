/**
 * @file temp_directory.hpp
 * @brief Self-removing scratch directory for filesystem tests
 */

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace fmri_sync::test {

class temp_directory {
public:
    explicit temp_directory(std::string_view prefix = "fmri_sync_test") {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                (std::string(prefix) + "_" + std::to_string(::getpid()) + "_" +
                 std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_directory(const temp_directory&) = delete;
    temp_directory& operator=(const temp_directory&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    [[nodiscard]] auto operator/(const std::string& child) const -> std::filesystem::path {
        return path_ / child;
    }

    /// Create (or overwrite) a file with the given content
    auto write_file(const std::string& relative, std::string_view content) const
        -> std::filesystem::path {
        const auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return file;
    }

private:
    std::filesystem::path path_;
};

/// Read a whole file, empty when it does not exist
inline auto read_file(const std::filesystem::path& file) -> std::string {
    std::ifstream in(file, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Give a path an mtime offset from now, for ordering tests
inline void set_age(const std::filesystem::path& p, std::chrono::seconds age) {
    std::filesystem::last_write_time(p, std::filesystem::file_time_type::clock::now() - age);
}

}  // namespace fmri_sync::test
