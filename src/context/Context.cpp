// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "Context.hpp"
#include "device/FingerprintDevice.hpp"
#include "exception/FpsException.hpp"
#include "utils/Utils.hpp"

namespace libfpsdk {

std::shared_ptr<Context> Context::create(const std::string &configFilePath) {
    return std::shared_ptr<Context>(new Context(configFilePath));
}

Context::Context(const std::string &configFilePath) : envConfig_(EnvConfig::getInstance(configFilePath)), logger_(Logger::getInstance()) {
    LOG_DEBUG("Context creating, config file: {}", envConfig_->getConfigFilePath().empty() ? "<built-in defaults>" : envConfig_->getConfigFilePath());

    fpContext_.reset(fp_context_new());
    if(!fpContext_) {
        throw native_init_exception("fp_context_new failed to create the native device registry");
    }

    enumerate();
    LOG_INFO("Context created!");
}

Context::~Context() noexcept {
    {
        std::lock_guard<std::mutex> lock(createdDevicesMutex_);
        createdDevices_.clear();
    }
    fpContext_.reset();
    LOG_INFO("Context destroyed");
}

void Context::enumerate() {
    // the registry scans only once, later changes arrive as device-added/device-removed signals
    fp_context_enumerate(fpContext_.get());
    dispatchPendingEvents();
    auto devices = fp_context_get_devices(fpContext_.get());
    LOG_DEBUG("Device enumeration done, {} device(s) found", devices ? devices->len : 0);
}

void Context::dispatchPendingEvents() {
    // returns at once when another thread owns the default main context (an operation in flight)
    while(g_main_context_iteration(nullptr, FALSE)) {}
}

std::vector<std::shared_ptr<FingerprintDevice>> Context::getDevices() {
    std::vector<std::shared_ptr<FingerprintDevice>> devices;

    dispatchPendingEvents();

    // transfer none, owned by the registry
    auto nativeDevices = fp_context_get_devices(fpContext_.get());
    if(!nativeDevices) {
        return devices;
    }

    std::lock_guard<std::mutex> lock(createdDevicesMutex_);
    for(guint i = 0; i < nativeDevices->len; i++) {
        auto fpDevice = static_cast<FpDevice *>(g_ptr_array_index(nativeDevices, i));
        auto iter     = createdDevices_.find(fpDevice);
        if(iter != createdDevices_.end()) {
            auto device = iter->second.lock();
            if(device) {
                devices.push_back(device);
                continue;
            }
        }
        auto device              = std::make_shared<FingerprintDevice>(shared_from_this(), fpDevice);
        createdDevices_[fpDevice] = device;
        devices.push_back(device);
    }

    // forget wrappers that have been released
    for(auto iter = createdDevices_.begin(); iter != createdDevices_.end();) {
        if(iter->second.expired()) {
            iter = createdDevices_.erase(iter);
        }
        else {
            ++iter;
        }
    }

    LOG_DEBUG("Get devices, count: {}", devices.size());
    return devices;
}

FpContext *Context::getNativeContext() const {
    return fpContext_.get();
}

std::shared_ptr<Logger> Context::getLogger() const {
    return logger_;
}

std::shared_ptr<EnvConfig> Context::getEnvConfig() const {
    return envConfig_;
}

}  // namespace libfpsdk
