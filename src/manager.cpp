#include "deviceid/deviceid.hpp"
#include "deviceid/digest.hpp"
#include "deviceid/events.hpp"
#include "deviceid/logging.hpp"
#include "deviceid/platform.hpp"
#include "deviceid/storage.hpp"

#include <boost/log/trivial.hpp>

namespace deviceid {

bool is_valid_sha256(const std::string& s) noexcept {
    if (s.length() != DEVICE_ID_LENGTH) {
        return false;
    }
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

namespace {

// Identifiers are only logged by prefix
std::string abbreviate(const std::string& device_id) {
    return device_id.substr(0, 8) + "...";
}

template <typename T> Result<T> with_context(const std::string& context, ErrorCode code,
                                             const std::string& message) {
    return Result<T>::error(code, context + ": " + message);
}

}  // namespace

// PIMPL implementation
class Manager::Impl {
  public:
    Impl(Config config, ProbeFunction probe)
        : config_(std::move(config)), probe_(std::move(probe)) {
        if (!config_.log_level.empty()) {
            set_logging_level(level_string_to_number(config_.log_level));
        }
    }

    Result<std::string> generate() const {
        if (!probe_) {
            return Result<std::string>::error(ErrorCode::ProbeError,
                                              "failed to generate device ID: no platform probe");
        }

        auto info = probe_();
        if (info.is_error()) {
            return with_context<std::string>("failed to generate device ID", info.error_code(),
                                             info.error_message());
        }

        auto hash = digest::sha256_hex(info.value());
        if (hash.is_error()) {
            return with_context<std::string>("failed to generate device ID", hash.error_code(),
                                             hash.error_message());
        }

        BOOST_LOG_TRIVIAL(debug) << "Generated device ID " << abbreviate(hash.value());
        return hash;
    }

    Result<void> save(const std::string& device_id) {
        if (!is_valid_sha256(device_id)) {
            return Result<void>::error(ErrorCode::InvalidFormatError,
                                       "failed to save device ID: invalid device ID format");
        }

        auto path = resolve_path();
        if (path.is_error()) {
            return with_context<void>("failed to save device ID", path.error_code(),
                                      path.error_message());
        }

        FileStore store(path.value());
        auto written = store.write(device_id);
        if (written.is_error()) {
            auto failed = with_context<void>("failed to save device ID", written.error_code(),
                                             written.error_message());
            BOOST_LOG_TRIVIAL(error) << failed.error_message();
            return failed;
        }

        event_bus_.emit(events::DEVICE_ID_SAVED, store.path().string());
        return written;
    }

    Result<std::string> verify() {
        auto path = resolve_path();
        if (path.is_error()) {
            return fail(path.error_code(), path.error_message());
        }

        FileStore store(path.value());
        auto stored = store.read();

        if (stored.is_ok()) {
            if (is_valid_sha256(stored.value())) {
                BOOST_LOG_TRIVIAL(debug) << "Loaded device ID " << abbreviate(stored.value())
                                         << " from " << store.path().string();
                event_bus_.emit(events::DEVICE_ID_LOADED, store.path().string());
                return stored;
            }

            // Corrupt content is replaced, not reported as an error
            BOOST_LOG_TRIVIAL(warning) << "Device ID file " << store.path().string()
                                       << " has an invalid format, regenerating";
            event_bus_.emit(events::DEVICE_ID_CORRUPT, store.path().string());
        } else if (stored.error_code() == ErrorCode::FileNotFound) {
            BOOST_LOG_TRIVIAL(info) << "No device ID at " << store.path().string()
                                    << ", generating a new one";
        } else {
            return fail(stored.error_code(), stored.error_message());
        }

        return regenerate(store);
    }

    Result<std::string> path() const {
        auto path = resolve_path();
        if (path.is_error()) {
            return Result<std::string>::error(path.error_code(), path.error_message());
        }
        return Result<std::string>::ok(path.value().string());
    }

    EventSubscription on(const std::string& event, EventHandler handler) {
        return event_bus_.on(event, std::move(handler));
    }

    const Config& config() const noexcept { return config_; }

  private:
    Result<std::filesystem::path> resolve_path() const {
        auto path = FileStore::resolve_path(config_);
        if (path.is_error()) {
            return with_context<std::filesystem::path>("failed to get device ID path",
                                                       path.error_code(), path.error_message());
        }
        return path;
    }

    Result<std::string> regenerate(FileStore& store) {
        auto device_id = generate();
        if (device_id.is_error()) {
            return fail(device_id.error_code(),
                        "failed to generate new device ID: " + device_id.error_message());
        }
        event_bus_.emit(events::DEVICE_ID_GENERATED, store.path().string());

        auto written = store.write(device_id.value());
        if (written.is_error()) {
            return fail(written.error_code(),
                        "failed to save new device ID: " + written.error_message());
        }
        event_bus_.emit(events::DEVICE_ID_SAVED, store.path().string());

        BOOST_LOG_TRIVIAL(info) << "Stored new device ID " << abbreviate(device_id.value());
        return device_id;
    }

    Result<std::string> fail(ErrorCode code, const std::string& message) {
        BOOST_LOG_TRIVIAL(error) << message;
        event_bus_.emit(events::DEVICE_ID_ERROR, message);
        return Result<std::string>::error(code, message);
    }

    Config config_;
    ProbeFunction probe_;
    EventBus event_bus_;
};

// ==================== Manager ====================

Manager::Manager(Config config)
    : impl_(std::make_unique<Impl>(std::move(config),
                                   platform::make_probe(platform::detect_platform()))) {}

Manager::Manager(Config config, ProbeFunction probe)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(probe))) {}

Manager::~Manager() = default;

Manager::Manager(Manager&&) noexcept = default;
Manager& Manager::operator=(Manager&&) noexcept = default;

Result<std::string> Manager::generate_device_id() const {
    return impl_->generate();
}

Result<void> Manager::save_device_id(const std::string& device_id) {
    return impl_->save(device_id);
}

Result<std::string> Manager::verify_device_id() {
    return impl_->verify();
}

Result<std::string> Manager::get_device_id_path() const {
    return impl_->path();
}

EventSubscription Manager::on(const std::string& event, EventHandler handler) {
    return impl_->on(event, std::move(handler));
}

const Config& Manager::config() const noexcept {
    return impl_->config();
}

}  // namespace deviceid
