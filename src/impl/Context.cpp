// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "fpsdk/hpp/Context.hpp"
#include "fpsdk/hpp/Device.hpp"

#include "ImplTypes.hpp"
#include "logger/Logger.hpp"

namespace fps {

Context::Context(const char *configPath) BEGIN_API_CALL {
    std::unique_ptr<fps_context> impl(new fps_context());
    impl->context = libfpsdk::Context::create(configPath ? configPath : "");
    impl_         = impl.release();
}
HANDLE_EXCEPTIONS_AND_THROW(configPath)

Context::~Context() noexcept {
    delete impl_;
}

std::shared_ptr<DeviceList> Context::getDevices() BEGIN_API_CALL {
    auto devices = impl_->context->getDevices();

    std::vector<std::shared_ptr<Device>> wrappers;
    std::lock_guard<std::mutex>          lock(impl_->devicesMutex);
    for(auto &device: devices) {
        std::shared_ptr<Device> wrapper;
        auto                    iter = impl_->devices.find(device.get());
        if(iter != impl_->devices.end()) {
            wrapper = iter->second.lock();
        }
        if(!wrapper) {
            std::unique_ptr<fps_device> devImpl(new fps_device());
            devImpl->device = device;
            wrapper         = std::make_shared<Device>(devImpl.get());
            devImpl.release();
            impl_->devices[device.get()] = wrapper;
        }
        wrappers.push_back(wrapper);
    }

    for(auto iter = impl_->devices.begin(); iter != impl_->devices.end();) {
        if(iter->second.expired()) {
            iter = impl_->devices.erase(iter);
        }
        else {
            ++iter;
        }
    }
    return std::make_shared<DeviceList>(std::move(wrappers));
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Context::enumerate() BEGIN_API_CALL {
    impl_->context->enumerate();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Context::setLoggerSeverity(FPSLogSeverity severity) BEGIN_API_CALL {
    VALIDATE_ENUM(severity, FPS_LOG_SEVERITY_OFF + 1);
    libfpsdk::Logger::setLogSeverity(severity);
}
HANDLE_EXCEPTIONS_AND_THROW(severity)

void Context::setLoggerToFile(FPSLogSeverity severity, const char *directory) BEGIN_API_CALL {
    VALIDATE_ENUM(severity, FPS_LOG_SEVERITY_OFF + 1);
    libfpsdk::Logger::setFileLogConfig(severity, directory ? directory : "");
}
HANDLE_EXCEPTIONS_AND_THROW(severity, directory)

void Context::setLoggerToConsole(FPSLogSeverity severity) BEGIN_API_CALL {
    VALIDATE_ENUM(severity, FPS_LOG_SEVERITY_OFF + 1);
    libfpsdk::Logger::setConsoleLogSeverity(severity);
}
HANDLE_EXCEPTIONS_AND_THROW(severity)

void Context::setLoggerToCallback(FPSLogSeverity severity, LogCallback callback) BEGIN_API_CALL {
    VALIDATE_ENUM(severity, FPS_LOG_SEVERITY_OFF + 1);
    if(!callback) {
        libfpsdk::Logger::setLogCallback(FPS_LOG_SEVERITY_OFF, nullptr);
        return;
    }
    libfpsdk::Logger::setLogCallback(severity, [callback](FPSLogSeverity logSeverity, const std::string &logMsg) {  //
        callback(logSeverity, logMsg.c_str());
    });
}
HANDLE_EXCEPTIONS_AND_THROW(severity)

}  // namespace fps
