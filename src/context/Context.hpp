// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fprint.h>

#include "logger/Logger.hpp"
#include "environment/EnvConfig.hpp"
#include "native/GlibHandle.hpp"

namespace libfpsdk {
class FingerprintDevice;

/**
 * @brief Owns the native device registry (FpContext) together with the process logger and configuration.
 *
 * Devices created by a context hold a reference to it, so the registry outlives every device wrapper.
 */
class Context : public std::enable_shared_from_this<Context> {
private:
    explicit Context(const std::string &configFilePath);

public:
    static std::shared_ptr<Context> create(const std::string &configFilePath = "");

    ~Context() noexcept;

    // Scans for devices on the first call, then applies hot-plug events queued since the last call.
    void enumerate();

    // Devices in native registry order, one wrapper per native device while that wrapper is alive.
    std::vector<std::shared_ptr<FingerprintDevice>> getDevices();

    FpContext                 *getNativeContext() const;
    std::shared_ptr<Logger>    getLogger() const;
    std::shared_ptr<EnvConfig> getEnvConfig() const;

private:
    void dispatchPendingEvents();

private:
    std::shared_ptr<EnvConfig>       envConfig_;
    std::shared_ptr<Logger>          logger_;
    native::GObjectHandle<FpContext> fpContext_;

    std::mutex                                            createdDevicesMutex_;
    std::map<FpDevice *, std::weak_ptr<FingerprintDevice>> createdDevices_;
};
}  // namespace libfpsdk
