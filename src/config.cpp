#include "deviceid/deviceid.hpp"
#include "deviceid/json.hpp"

#include <boost/log/trivial.hpp>

#include <fstream>

namespace deviceid {

Result<Config> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config>::error(ErrorCode::ConfigError, "cannot open config file " + path);
    }

    try {
        auto j = nlohmann::json::parse(file);
        auto config = json::parse_config(j);
        if (config.is_error()) {
            return Result<Config>::error(ErrorCode::ConfigError,
                                         path + ": " + config.error_message());
        }
        BOOST_LOG_TRIVIAL(debug) << "Loaded configuration from " << path;
        return config;
    } catch (const nlohmann::json::parse_error& e) {
        BOOST_LOG_TRIVIAL(error) << "parse " << path << " got a nlohmann::detail::parse_error, reason = "
                                 << e.what();
        return Result<Config>::error(ErrorCode::ConfigError, path + ": " + e.what());
    }
}

}  // namespace deviceid
