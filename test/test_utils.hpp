#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

// Temporary project directory removed on destruction
class TempProject {
public:
    explicit TempProject(const std::string& name) {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() /
                ("archlens_" + name + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(root_);
    }

    ~TempProject() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    TempProject(const TempProject&) = delete;
    TempProject& operator=(const TempProject&) = delete;

    const fs::path& root() const { return root_; }

    // Write a file relative to the root, creating parent directories
    fs::path write(const std::string& relativePath, const std::string& content) const {
        const fs::path path = root_ / relativePath;
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    fs::path mkdir(const std::string& relativePath) const {
        const fs::path path = root_ / relativePath;
        fs::create_directories(path);
        return path;
    }

private:
    fs::path root_;
};
