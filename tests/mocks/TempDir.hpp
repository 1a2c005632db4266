//
// Created by Andrea on 20/10/2025.
//

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace mocks {
    /**
     * @brief Scratch directory removed with everything in it on destruction
     */
    class TempDir {
    public:
        TempDir() {
            static std::atomic<int> counter{0};
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path() /
                    ("fleet_dispatch_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        ~TempDir() {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        TempDir(const TempDir &) = delete;

        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }

        std::string file(const std::string &relative) const { return (path_ / relative).string(); }

        std::string write(const std::string &relative, const std::string &content) const {
            const auto target = path_ / relative;
            std::filesystem::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            out << content;
            return target.string();
        }

    private:
        std::filesystem::path path_;
    };
}
