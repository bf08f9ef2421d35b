#include "deviceid/logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include <map>

namespace deviceid {

namespace {

boost::log::trivial::severity_level log_severity = boost::log::trivial::warning;

boost::log::trivial::severity_level level_to_boost(unsigned int level) {
    switch (level) {
        // Report fatal errors only.
        case 0:
            return boost::log::trivial::fatal;
        // Report fatal errors and errors.
        case 1:
            return boost::log::trivial::error;
        // Report fatal errors, errors and warnings.
        case 2:
            return boost::log::trivial::warning;
        // Report all errors, warnings and infos.
        case 3:
            return boost::log::trivial::info;
        // Report all errors, warnings, infos and debugging.
        case 4:
            return boost::log::trivial::debug;
        // Report everything including fine level tracing information.
        default:
            return boost::log::trivial::trace;
    }
}

}  // namespace

void set_logging_level(unsigned int level) {
    log_severity = level_to_boost(level);

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= log_severity);
}

// Install the default filter (warning) when the library is loaded.
static struct RunOnInit {
    RunOnInit() { set_logging_level(2); }
} g_run_on_init;

unsigned int get_logging_level() {
    switch (log_severity) {
        case boost::log::trivial::fatal:
            return 0;
        case boost::log::trivial::error:
            return 1;
        case boost::log::trivial::warning:
            return 2;
        case boost::log::trivial::info:
            return 3;
        case boost::log::trivial::debug:
            return 4;
        case boost::log::trivial::trace:
            return 5;
        default:
            return 1;
    }
}

unsigned int level_string_to_number(const std::string& level) {
    static const std::map<std::string, unsigned int> levels = {
        {"fatal", 0}, {"error", 1}, {"warning", 2}, {"info", 3}, {"debug", 4}, {"trace", 5},
    };

    auto it = levels.find(level);
    return it != levels.end() ? it->second : 1;
}

std::string get_string_logging_level(unsigned int level) {
    switch (level) {
        case 0:
            return "fatal";
        case 1:
            return "error";
        case 2:
            return "warning";
        case 3:
            return "info";
        case 4:
            return "debug";
        case 5:
            return "trace";
        default:
            return "error";
    }
}

}  // namespace deviceid
