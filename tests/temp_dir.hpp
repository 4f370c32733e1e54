#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace troupe {

// Per-test scratch directory, removed on destruction
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& tag) {
        static int counter = 0;
        path = std::filesystem::temp_directory_path() /
               ("troupe_" + tag + "_" + std::to_string(getpid()) + "_" +
                std::to_string(counter++));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path.string(); }

    std::string write(const std::string& name, const std::string& content) const {
        auto file = path / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream f(file);
        f << content;
        return file.string();
    }
};

} // namespace troupe
