// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "fpsdk/hpp/Device.hpp"
#include "fpsdk/hpp/Print.hpp"
#include "fpsdk/hpp/Image.hpp"

#include "ImplTypes.hpp"

#include <cstring>

namespace fps {

Device::Device(fps_device *impl) : impl_(impl) {}

Device::~Device() noexcept {
    delete impl_;
}

const char *Device::getName() const BEGIN_API_CALL {
    return impl_->device->getName();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

const char *Device::getDriver() const BEGIN_API_CALL {
    return impl_->device->getDriver();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

const char *Device::getDeviceId() const BEGIN_API_CALL {
    return impl_->device->getDeviceId();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

FPSDeviceType Device::getDeviceType() const BEGIN_API_CALL {
    return impl_->device->getDeviceType();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

FPSScanType Device::getScanType() const BEGIN_API_CALL {
    return impl_->device->getScanType();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

uint32_t Device::getEnrollStages() const BEGIN_API_CALL {
    return impl_->device->getEnrollStages();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

uint32_t Device::getFeatures() const BEGIN_API_CALL {
    return impl_->device->getFeatures();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

bool Device::hasFeature(FPSDeviceFeature feature) const BEGIN_API_CALL {
    return impl_->device->hasFeature(feature);
}
HANDLE_EXCEPTIONS_AND_THROW(this, feature)

uint32_t Device::getFingerStatus() const BEGIN_API_CALL {
    return impl_->device->getFingerStatus();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

bool Device::isOpen() const BEGIN_API_CALL {
    return impl_->device->isOpen();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Device::open() BEGIN_API_CALL {
    impl_->device->open();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Device::close() BEGIN_API_CALL {
    impl_->device->close();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

std::shared_ptr<Print> Device::enroll(std::shared_ptr<Print> templatePrint, EnrollProgressCallback callback) BEGIN_API_CALL {
    FpPrint *nativeTemplate = templatePrint ? templatePrint->getImpl()->print.get() : nullptr;

    libfpsdk::EnrollProgressHandler handler;
    if(callback) {
        handler = [&callback](uint32_t completedStages, FpPrint *print, const GError *error) {
            std::shared_ptr<Print> scanned;
            if(print) {
                scanned = createPrint(libfpsdk::native::GObjectHandle<FpPrint>::ref(print));
            }
            if(error) {
                auto retry = createNativeError(error, "Device::enroll");
                callback(completedStages, scanned, &retry);
            }
            else {
                callback(completedStages, scanned, nullptr);
            }
        };
    }
    return createPrint(impl_->device->enroll(nativeTemplate, handler));
}
HANDLE_EXCEPTIONS_AND_THROW(this, templatePrint)

std::shared_ptr<Print> Device::enroll(EnrollProgressCallback callback) {
    return enroll(nullptr, callback);
}

VerifyResult Device::verify(std::shared_ptr<Print> enrolledPrint, MatchCallback callback) BEGIN_API_CALL {
    VALIDATE_NOT_NULL(enrolledPrint);
    auto nativeEnrolled = enrolledPrint->getImpl()->print.get();

    libfpsdk::MatchHandler handler;
    if(callback) {
        handler = [&callback, &enrolledPrint, nativeEnrolled](FpPrint *match, FpPrint *print, const GError *error) {
            std::shared_ptr<Print> matched;
            if(match == nativeEnrolled) {
                matched = enrolledPrint;
            }
            else if(match) {
                matched = createPrint(libfpsdk::native::GObjectHandle<FpPrint>::ref(match));
            }
            std::shared_ptr<Print> scanned;
            if(print) {
                scanned = createPrint(libfpsdk::native::GObjectHandle<FpPrint>::ref(print));
            }
            if(error) {
                auto retry = createNativeError(error, "Device::verify");
                callback(matched, scanned, &retry);
            }
            else {
                callback(matched, scanned, nullptr);
            }
        };
    }

    auto         nativeResult = impl_->device->verify(nativeEnrolled, handler);
    VerifyResult result;
    result.matched = nativeResult.matched;
    if(nativeResult.scannedPrint) {
        result.scannedPrint = createPrint(std::move(nativeResult.scannedPrint));
    }
    return result;
}
HANDLE_EXCEPTIONS_AND_THROW(this, enrolledPrint)

IdentifyResult Device::identify(const std::vector<std::shared_ptr<Print>> &prints, MatchCallback callback) BEGIN_API_CALL {
    std::vector<FpPrint *> gallery;
    for(auto &print: prints) {
        if(!print) {
            throw libfpsdk::invalid_value_exception("identify: the gallery contains a null print");
        }
        gallery.push_back(print->getImpl()->print.get());
    }

    // the match reported by the native library is one of the gallery prints, hand back the caller's own wrapper
    auto findInGallery = [&prints](FpPrint *match) -> std::shared_ptr<Print> {
        for(auto &print: prints) {
            if(print->getImpl()->print.get() == match) {
                return print;
            }
        }
        return createPrint(libfpsdk::native::GObjectHandle<FpPrint>::ref(match));
    };

    libfpsdk::MatchHandler handler;
    if(callback) {
        handler = [&callback, &findInGallery](FpPrint *match, FpPrint *print, const GError *error) {
            std::shared_ptr<Print> matched;
            if(match) {
                matched = findInGallery(match);
            }
            std::shared_ptr<Print> scanned;
            if(print) {
                scanned = createPrint(libfpsdk::native::GObjectHandle<FpPrint>::ref(print));
            }
            if(error) {
                auto retry = createNativeError(error, "Device::identify");
                callback(matched, scanned, &retry);
            }
            else {
                callback(matched, scanned, nullptr);
            }
        };
    }

    auto           nativeResult = impl_->device->identify(gallery, handler);
    IdentifyResult result;
    if(nativeResult.match) {
        result.match = findInGallery(nativeResult.match);
    }
    if(nativeResult.scannedPrint) {
        result.scannedPrint = createPrint(std::move(nativeResult.scannedPrint));
    }
    return result;
}
HANDLE_EXCEPTIONS_AND_THROW(this, prints.size())

std::shared_ptr<Image> Device::capture(bool waitForFinger) BEGIN_API_CALL {
    std::unique_ptr<fps_image> imageImpl(new fps_image());
    imageImpl->image = impl_->device->capture(waitForFinger);
    auto image       = std::make_shared<Image>(imageImpl.get());
    imageImpl.release();
    return image;
}
HANDLE_EXCEPTIONS_AND_THROW(this, waitForFinger)

std::vector<std::shared_ptr<Print>> Device::listPrints() BEGIN_API_CALL {
    std::vector<std::shared_ptr<Print>> prints;
    auto                                stored = impl_->device->listPrints();
    for(auto &print: stored) {
        prints.push_back(createPrint(std::move(print)));
    }
    return prints;
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Device::deletePrint(std::shared_ptr<Print> print) BEGIN_API_CALL {
    VALIDATE_NOT_NULL(print);
    impl_->device->deletePrint(print->getImpl()->print.get());
}
HANDLE_EXCEPTIONS_AND_THROW(this, print)

void Device::clearStorage() BEGIN_API_CALL {
    impl_->device->clearStorage();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Device::cancel() BEGIN_API_CALL {
    impl_->device->cancel();
}
HANDLE_EXCEPTIONS_AND_THROW(this)

std::shared_ptr<Device> DeviceList::getDevice(uint32_t index) const BEGIN_API_CALL {
    VALIDATE_UNSIGNED_INDEX(index, devices_.size());
    return devices_.at(index);
}
HANDLE_EXCEPTIONS_AND_THROW(this, index)

std::shared_ptr<Device> DeviceList::getDeviceById(const char *deviceId) const BEGIN_API_CALL {
    VALIDATE_NOT_NULL(deviceId);
    for(auto &device: devices_) {
        if(std::strcmp(device->getDeviceId(), deviceId) == 0) {
            return device;
        }
    }
    throw libfpsdk::invalid_value_exception(libfpsdk::utils::string::to_string() << "No device with id " << deviceId);
}
HANDLE_EXCEPTIONS_AND_THROW(this, deviceId)

}  // namespace fps
