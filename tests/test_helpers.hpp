#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>

#if !defined(_WIN32) && !defined(_WIN64)
#include <unistd.h>
#endif

namespace deviceid {
namespace testing_support {

// Helper to create a temporary directory for tests
class TempDirectory {
  public:
    TempDirectory() {
        path_ = std::filesystem::temp_directory_path() /
                ("deviceid_test_" +
                 std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        // Restore permissions tests may have removed, so cleanup can descend
        for (auto it = std::filesystem::recursive_directory_iterator(
                 path_, std::filesystem::directory_options::skip_permission_denied, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::add, ec);
        }
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
};

// Sets (or unsets) an environment variable for the lifetime of the object
class ScopedEnv {
  public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = std::string(old);
        }
        set(value);
    }

    ~ScopedEnv() { set(old_ ? old_->c_str() : nullptr); }

  private:
    void set(const char* value) {
#if defined(_WIN32) || defined(_WIN64)
        _putenv_s(name_.c_str(), value != nullptr ? value : "");
#else
        if (value != nullptr) {
            setenv(name_.c_str(), value, 1);
        } else {
            unsetenv(name_.c_str());
        }
#endif
    }

    std::string name_;
    std::optional<std::string> old_;
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

// Permission checks do not apply to root
inline bool running_as_root() {
#if defined(_WIN32) || defined(_WIN64)
    return false;
#else
    return geteuid() == 0;
#endif
}

constexpr const char* HOME_VARIABLE =
#if defined(_WIN32) || defined(_WIN64)
    "USERPROFILE";
#else
    "HOME";
#endif

// SHA-256 of "abc"
constexpr const char* SAMPLE_ID = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

}  // namespace testing_support
}  // namespace deviceid
