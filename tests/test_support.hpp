#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <atomic>
#include <iterator>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

// Fixture owning a scratch directory that is unique per process and test.
class ScratchDirTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   ("azprov_" + std::string(info->test_suite_name()) + "_" +
                    std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    fs::path write_file(const std::string& rel_path, const std::string& content = "") {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
        return full;
    }

    // Executable /bin/sh script standing in for an external CLI.
    fs::path write_script(const std::string& rel_path, const std::string& body) {
        auto full = write_file(rel_path, "#!/bin/sh\n" + body);
        fs::permissions(full, fs::perms::owner_all | fs::perms::group_read |
                                  fs::perms::group_exec,
                        fs::perm_options::replace);
        return full;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        return std::string((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    }
};

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        const char* old = std::getenv(name);
        if (old) {
            had_old_ = true;
            old_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (had_old_) {
            setenv(name_.c_str(), old_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::string old_;
    bool had_old_ = false;
};
