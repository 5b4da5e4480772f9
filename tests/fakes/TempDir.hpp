#pragma once
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

// Scratch directory named after the running test, removed on destruction.
class TempDir {
    std::filesystem::path root;

public:
    TempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = std::filesystem::temp_directory_path() /
               ("virtrecon-" + std::string(info->test_suite_name()) + "-" + info->name());
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return root; }
    [[nodiscard]] std::string operator/(const std::string& name) const { return (root / name).string(); }
};
