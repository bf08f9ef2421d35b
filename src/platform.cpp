#include "deviceid/platform.hpp"

#include <boost/log/trivial.hpp>

#include <array>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>

// Platform detection
#if defined(__APPLE__)
#define DEVICEID_PLATFORM_APPLE 1
#elif defined(_WIN32) || defined(_WIN64)
#define DEVICEID_PLATFORM_WINDOWS 1
#endif

#if defined(DEVICEID_PLATFORM_WINDOWS)
#define DEVICEID_POPEN _popen
#define DEVICEID_PCLOSE _pclose
#else
#include <sys/wait.h>
#define DEVICEID_POPEN popen
#define DEVICEID_PCLOSE pclose
#endif

namespace deviceid {
namespace platform {

namespace {

constexpr const char* MACHINE_ID_PATH = "/etc/machine-id";

#if defined(DEVICEID_PLATFORM_WINDOWS)
constexpr const char* STDERR_SINK = " 2>NUL";
#else
constexpr const char* STDERR_SINK = " 2>/dev/null";
#endif

struct PipeCloser {
    void operator()(FILE* pipe) const {
        if (pipe != nullptr) {
            DEVICEID_PCLOSE(pipe);
        }
    }
};

// Translate a pclose() status into the command's exit code (-1 if it did not exit normally)
int exit_code(int status) {
#if defined(DEVICEID_PLATFORM_WINDOWS)
    return status;
#else
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
#endif
}

}  // namespace

Platform detect_platform() noexcept {
#if defined(DEVICEID_PLATFORM_APPLE)
    return Platform::Apple;
#elif defined(DEVICEID_PLATFORM_WINDOWS)
    return Platform::Windows;
#else
    return Platform::Other;
#endif
}

ProbeFunction make_probe(Platform platform) {
    BOOST_LOG_TRIVIAL(debug) << "Using " << platform_to_string(platform) << " platform probe";

    switch (platform) {
        case Platform::Windows:
            return probe_windows;
        case Platform::Apple:
            return probe_apple;
        case Platform::Other:
            return probe_machine_id;
    }
    return probe_machine_id;
}

Result<std::string> probe_windows() {
    return run_command("wmic csproduct get UUID");
}

Result<std::string> probe_apple() {
    return run_command("ioreg -d2 -c IOPlatformExpertDevice");
}

Result<std::string> probe_machine_id() {
    return read_source_file(MACHINE_ID_PATH);
}

Result<std::string> run_command(const std::string& command) {
    std::unique_ptr<FILE, PipeCloser> pipe(DEVICEID_POPEN((command + STDERR_SINK).c_str(), "r"));
    if (!pipe) {
        return Result<std::string>::error(ErrorCode::ProbeError,
                                          "failed to get system info: cannot run '" + command + "'");
    }

    std::string output;
    std::array<char, 256> buffer{};
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        output.append(buffer.data(), n);
    }
    bool read_failed = std::ferror(pipe.get()) != 0;

    int code = exit_code(DEVICEID_PCLOSE(pipe.release()));
    if (read_failed) {
        return Result<std::string>::error(
            ErrorCode::ProbeError, "failed to get system info: error reading output of '" + command + "'");
    }
    if (code != 0) {
        return Result<std::string>::error(ErrorCode::ProbeError,
                                          "failed to get system info: '" + command +
                                              "' exited with status " + std::to_string(code));
    }

    return Result<std::string>::ok(std::move(output));
}

Result<std::string> read_source_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCode::ProbeError,
                                          "failed to get system info: cannot open " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::error(ErrorCode::ProbeError,
                                          "failed to get system info: error reading " + path);
    }

    return Result<std::string>::ok(std::move(content));
}

}  // namespace platform
}  // namespace deviceid
