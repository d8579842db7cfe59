// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

/**
 * @file Context.hpp
 * @brief The SDK context class, which serves as the entry point to the native fingerprint library. It is used to query the device list and set the
 * log level.
 */
#pragma once

#include "Types.hpp"
#include "Error.hpp"

#include <functional>
#include <memory>

namespace fps {
class Device;
class DeviceList;

class FPS_EXPORT Context {
private:
    fps_context *impl_ = nullptr;

public:
    /**
     * @brief Create the context, loading the configuration file and initializing the native device registry.
     *
     * The context must be kept alive for as long as devices are used: it holds the native registry and the logger.
     *
     * @param configPath Path of the XML configuration file. When empty, "./FpsSDKConfig.xml" is used if it exists.
     * @throws Error with kind FPS_ERROR_NATIVE_INIT_FAILURE if the native registry can not be created.
     */
    explicit Context(const char *configPath = "");

    ~Context() noexcept;

    Context(const Context &)            = delete;
    Context &operator=(const Context &) = delete;

    /**
     * @brief Get the devices currently reported by the native registry, after applying pending hot-plug events.
     *
     * The list is in native registry order, which is not guaranteed to be stable across calls. The same Device object is returned for the same
     * native device as long as the caller keeps a reference to it.
     *
     * @return std::shared_ptr<DeviceList> The device list, empty when no device is connected.
     */
    std::shared_ptr<DeviceList> getDevices();

    /**
     * @brief Bring the device registry up to date.
     *
     * The native registry scans the buses once, when the context is created. Sensors plugged in or removed later are reported as hot-plug
     * events, which this call (and getDevices()) applies. A call made while another thread runs a device operation may see those events
     * only on a later call.
     */
    void enumerate();

    /**
     * @brief Set the level of the global log, which affects the terminal, file and callback outputs.
     *
     * @param severity The log output level.
     */
    static void setLoggerSeverity(FPSLogSeverity severity);

    /**
     * @brief Set log output to a file.
     *
     * @param severity The log level output to the file.
     * @param directory The log file output path, the default "Log/" directory is used when empty.
     */
    static void setLoggerToFile(FPSLogSeverity severity, const char *directory);

    /**
     * @brief Set log output to the terminal.
     *
     * @param severity The log level output to the terminal.
     */
    static void setLoggerToConsole(FPSLogSeverity severity);

    /**
     * @brief Log output callback function.
     *
     * @param severity The current callback log level.
     * @param logMsg The log message.
     */
    using LogCallback = std::function<void(FPSLogSeverity severity, const char *logMsg)>;

    /**
     * @brief Set the logger to callback.
     *
     * @param severity The callback log level.
     * @param callback The callback function, nullptr to remove it.
     */
    static void setLoggerToCallback(FPSLogSeverity severity, LogCallback callback);
};

}  // namespace fps
