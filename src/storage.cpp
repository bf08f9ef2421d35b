#include "deviceid/storage.hpp"

#include <boost/log/trivial.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

namespace deviceid {

namespace fs = std::filesystem;

namespace {

#if defined(_WIN32) || defined(_WIN64)
constexpr const char* HOME_ENV = "USERPROFILE";
#else
constexpr const char* HOME_ENV = "HOME";
#endif

std::string read_env(const char* name) {
#if defined(_WIN32) || defined(_WIN64)
    // Use _dupenv_s on Windows (getenv is deprecated by MSVC)
    char* value = nullptr;
    size_t len = 0;
    std::string result;
    if (_dupenv_s(&value, &len, name) == 0 && value != nullptr) {
        result = value;
        free(value);
    }
    return result;
#else
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
#endif
}

}  // namespace

FileStore::FileStore(fs::path path) : path_(std::move(path)) {}

Result<fs::path> FileStore::home_directory() {
    std::string home = read_env(HOME_ENV);
    if (home.empty()) {
        return Result<fs::path>::error(
            ErrorCode::PathResolutionError,
            std::string("failed to get user home directory: $") + HOME_ENV + " is not defined");
    }
    return Result<fs::path>::ok(fs::path(home));
}

Result<fs::path> FileStore::resolve_path(const Config& config) {
    fs::path base;
    if (!config.storage_dir.empty()) {
        base = config.storage_dir;
    } else {
        auto home = home_directory();
        if (home.is_error()) {
            return home;
        }
        base = home.value() / DEFAULT_STORAGE_SUBDIR;
    }

    const std::string& file_name =
        config.id_file_name.empty() ? std::string(DEFAULT_ID_FILE_NAME) : config.id_file_name;

    // A rooted file name is taken relative to the storage directory.
    fs::path resolved = (base / fs::path(file_name).relative_path()).lexically_normal();
    BOOST_LOG_TRIVIAL(debug) << "Device ID path resolved to " << resolved.string();
    return Result<fs::path>::ok(std::move(resolved));
}

Result<void> FileStore::ensure_directory() const {
    fs::path dir = path_.parent_path();

    // Collect missing ancestors, deepest first
    std::vector<fs::path> missing;
    for (fs::path p = dir; !p.empty(); p = p.parent_path()) {
        std::error_code ec;
        auto st = fs::status(p, ec);
        if (st.type() != fs::file_type::not_found) {
            if (ec) {
                return Result<void>::error(ErrorCode::StorageError,
                                           "failed to create directory: " + p.string() + ": " +
                                               ec.message());
            }
            if (!fs::is_directory(st)) {
                return Result<void>::error(ErrorCode::StorageError,
                                           "failed to create directory: " + p.string() +
                                               " is not a directory");
            }
            break;
        }
        missing.push_back(p);
        if (p == p.parent_path()) {
            break;
        }
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        std::error_code ec;
        fs::create_directory(*it, ec);
        if (!ec) {
            fs::permissions(*it, fs::perms::owner_all, fs::perm_options::replace, ec);
        }
        if (ec) {
            return Result<void>::error(ErrorCode::StorageError, "failed to create directory: " +
                                                                    it->string() + ": " +
                                                                    ec.message());
        }
        BOOST_LOG_TRIVIAL(debug) << "Created directory " << it->string();
    }

    return Result<void>::ok();
}

Result<std::string> FileStore::read() const {
    std::error_code ec;
    auto st = fs::status(path_, ec);
    if (st.type() == fs::file_type::not_found) {
        return Result<std::string>::error(ErrorCode::FileNotFound,
                                          "device ID file not found: " + path_.string());
    }
    if (ec) {
        return Result<std::string>::error(ErrorCode::StorageError, "failed to read device ID: " +
                                                                       path_.string() + ": " +
                                                                       ec.message());
    }
    if (fs::is_directory(st)) {
        return Result<std::string>::error(
            ErrorCode::StorageError, "failed to read device ID: " + path_.string() + " is a directory");
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCode::StorageError,
                                          "failed to read device ID: cannot open " + path_.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::error(ErrorCode::StorageError,
                                          "failed to read device ID: error reading " + path_.string());
    }

    return Result<std::string>::ok(std::move(content));
}

Result<void> FileStore::write(const std::string& device_id) {
    if (!is_valid_sha256(device_id)) {
        return Result<void>::error(ErrorCode::InvalidFormatError, "invalid device ID format");
    }

    auto dir = ensure_directory();
    if (dir.is_error()) {
        return dir;
    }

    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<void>::error(ErrorCode::StorageError,
                                   "failed to write device ID: cannot open " + path_.string());
    }

    file.write(device_id.data(), static_cast<std::streamsize>(device_id.size()));
    file.close();
    if (file.fail()) {
        return Result<void>::error(ErrorCode::StorageError,
                                   "failed to write device ID: error writing " + path_.string());
    }

    // Mode is set only after the content is on disk.
    std::error_code ec;
    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    if (ec) {
        return Result<void>::error(ErrorCode::StorageError, "failed to write device ID: " +
                                                                path_.string() + ": " + ec.message());
    }

    BOOST_LOG_TRIVIAL(info) << "Saved device ID " << device_id.substr(0, 8) << "... to "
                            << path_.string();
    return Result<void>::ok();
}

}  // namespace deviceid
