#pragma once

#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>

// RAII class for managing temporary directories
class TemporaryDirectory {
public:
    explicit TemporaryDirectory(std::string const& prefix = "mydiff-test") {
        // Generate a unique directory name using PID, thread ID, timestamp and a counter
        static size_t counter = 0;
        auto pid = getpid();
        auto tid = std::this_thread::get_id();
        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

        std::ostringstream oss;
        oss << prefix << "-" << pid << "-" << tid << "-" << timestamp << "-" << counter++;
        path_ = std::filesystem::temp_directory_path() / oss.str();

        std::filesystem::create_directories(path_);
    }

    ~TemporaryDirectory() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    const std::filesystem::path& path() const {
        return path_;
    }

    std::filesystem::path operator/(std::string const& name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};
