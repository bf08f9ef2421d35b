/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the deviceid library
 *
 * This example demonstrates how to:
 * - Configure a manager (storage and log level) in code or from a JSON file
 * - Subscribe to manager events
 * - Read or create the persistent device ID
 * - Handle errors using the Result type
 *
 * Usage: basic_usage [config.json]
 */

#include <deviceid/deviceid.hpp>
#include <deviceid/platform.hpp>

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    deviceid::Config config;

    if (argc > 1) {
        auto loaded = deviceid::load_config(argv[1]);
        if (loaded.is_error()) {
            std::cerr << "Error: " << loaded.error_message() << "\n";
            return 1;
        }
        config = loaded.value();
    } else {
        // Keep the example's ID file out of the home directory
        config.storage_dir = "/tmp/deviceid_example";
        config.log_level = "info";
    }

    deviceid::Manager manager(config);

    std::cout << "Platform: "
              << deviceid::platform::platform_to_string(deviceid::platform::detect_platform())
              << "\n";

    auto path = manager.get_device_id_path();
    if (path.is_ok()) {
        std::cout << "Device ID file: " << path.value() << "\n";
    }

    auto sub1 = manager.on(deviceid::events::DEVICE_ID_GENERATED, [](const std::string& /*path*/) {
        std::cout << "[Event] Generated a new device ID.\n";
    });
    auto sub2 = manager.on(deviceid::events::DEVICE_ID_CORRUPT, [](const std::string& path) {
        std::cout << "[Event] Replacing corrupt file " << path << "\n";
    });

    auto result = manager.verify_device_id();
    if (result.is_error()) {
        std::cerr << "Error (" << deviceid::error_code_to_string(result.error_code())
                  << "): " << result.error_message() << "\n";
        return 1;
    }

    std::cout << "Device ID: " << result.value() << "\n";
    return 0;
}
