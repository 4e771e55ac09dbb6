#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace fs = std::filesystem;

// Scratch project directory, removed after each test.
class TempProjectTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() /
               (std::string("treeline_") + info->test_suite_name() + "_" + info->name() + "_" + std::to_string(std::random_device{}()));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(root, ec);
    }

    void writeFile(const std::string& rel, const std::string& content) const {
        const auto p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
    }

    void removeFile(const std::string& rel) const {
        fs::remove(root / rel);
    }
};
