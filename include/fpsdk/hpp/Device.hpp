// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

/**
 * @file Device.hpp
 * @brief Device related types: the fingerprint sensor and the device list returned by the context.
 */
#pragma once

#include "Types.hpp"
#include "Error.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fps {
class Print;
class Image;

/**
 * @brief A fingerprint sensor.
 *
 * All operations block the calling thread until the native library completes them; the calling thread runs the native event loop in the
 * meantime, which is where the progress and match callbacks are invoked. Only one operation may be in flight on a device at a time; starting
 * another one (from a callback or from another thread) fails with FPS_ERROR_DEVICE_BUSY.
 */
class FPS_EXPORT Device {
private:
    fps_device *impl_ = nullptr;

public:
    explicit Device(fps_device *impl);
    ~Device() noexcept;

    Device(const Device &)            = delete;
    Device &operator=(const Device &) = delete;

    /**
     * @brief Get the human readable device name.
     */
    const char *getName() const;

    /**
     * @brief Get the name of the native driver handling this device.
     */
    const char *getDriver() const;

    /**
     * @brief Get the device id, unique among the devices of one driver.
     */
    const char *getDeviceId() const;

    FPSDeviceType getDeviceType() const;

    /**
     * @brief Get whether the user has to swipe or press the finger on the sensor.
     */
    FPSScanType getScanType() const;

    /**
     * @brief Get the number of scans needed to complete an enrollment.
     */
    uint32_t getEnrollStages() const;

    /**
     * @brief Get the supported features as a combination of FPSDeviceFeature flags.
     */
    uint32_t getFeatures() const;

    bool hasFeature(FPSDeviceFeature feature) const;

    /**
     * @brief Get the finger status as a combination of FPSFingerStatus flags.
     */
    uint32_t getFingerStatus() const;

    bool isOpen() const;

    /**
     * @brief Open the device.
     *
     * @throws Error FPS_ERROR_DEVICE_ALREADY_OPEN if the device is already open, or the native failure (busy, permission denied...).
     */
    void open();

    /**
     * @brief Close the device.
     *
     * @throws Error FPS_ERROR_DEVICE_NOT_OPEN if the device is not open.
     */
    void close();

    /**
     * @brief Enroll a new print, using the given template for its metadata (finger, username...).
     *
     * @param templatePrint A print created for this device with Print(device), holding the metadata of the new print.
     * @param callback Invoked once per enroll stage, may be nullptr.
     * @return std::shared_ptr<Print> The enrolled print.
     */
    std::shared_ptr<Print> enroll(std::shared_ptr<Print> templatePrint, EnrollProgressCallback callback = nullptr);

    /**
     * @brief Enroll a new print with empty metadata.
     */
    std::shared_ptr<Print> enroll(EnrollProgressCallback callback);

    /**
     * @brief Scan a finger and compare it with a known print.
     *
     * @param enrolledPrint The print to compare against.
     * @param callback Invoked as soon as the driver reports the match result, may be nullptr.
     * @throws Error FPS_ERROR_SCAN_RETRY if the scan was not usable (the callback sees the same retry first), the operation has to be started
     * again.
     */
    VerifyResult verify(std::shared_ptr<Print> enrolledPrint, MatchCallback callback = nullptr);

    /**
     * @brief Scan a finger and search for it in a collection of prints.
     *
     * @param prints The gallery to search in.
     * @param callback Invoked as soon as the driver reports the match result, may be nullptr.
     * @return IdentifyResult The matching gallery print (if any) and the scanned print.
     * @throws Error FPS_ERROR_SCAN_RETRY if the scan was not usable, the operation has to be started again.
     */
    IdentifyResult identify(const std::vector<std::shared_ptr<Print>> &prints, MatchCallback callback = nullptr);

    /**
     * @brief Capture a fingerprint image, requires FPS_DEVICE_FEATURE_CAPTURE.
     *
     * @param waitForFinger Wait for a finger to be placed instead of capturing immediately.
     */
    std::shared_ptr<Image> capture(bool waitForFinger = true);

    /**
     * @brief List the prints stored on the device, requires FPS_DEVICE_FEATURE_STORAGE_LIST.
     */
    std::vector<std::shared_ptr<Print>> listPrints();

    /**
     * @brief Delete a print from the device storage, requires FPS_DEVICE_FEATURE_STORAGE_DELETE.
     */
    void deletePrint(std::shared_ptr<Print> print);

    /**
     * @brief Delete all prints from the device storage, requires FPS_DEVICE_FEATURE_STORAGE_CLEAR.
     */
    void clearStorage();

    /**
     * @brief Request cancellation of the operation in flight, if any.
     *
     * Cancellation is best effort: callbacks already scheduled by the native library may still fire, and an operation that completes before the
     * request is seen returns its result normally. A cancelled operation throws an Error with kind FPS_ERROR_OPERATION_CANCELLED.
     * Safe to call from any thread and from inside a callback.
     */
    void cancel();

    const fps_device *getImpl() const {
        return impl_;
    }
};

/**
 * @brief Snapshot of the devices reported by the native registry.
 */
class FPS_EXPORT DeviceList {
private:
    std::vector<std::shared_ptr<Device>> devices_;

public:
    explicit DeviceList(std::vector<std::shared_ptr<Device>> devices) : devices_(std::move(devices)) {}

    uint32_t getCount() const {
        return static_cast<uint32_t>(devices_.size());
    }

    /**
     * @brief Get a device by index.
     *
     * @param index The device index, in the range [0, count-1].
     * @throws Error FPS_ERROR_INVALID_VALUE if the index is out of range.
     */
    std::shared_ptr<Device> getDevice(uint32_t index) const;

    /**
     * @brief Get a device by its device id.
     *
     * @throws Error FPS_ERROR_INVALID_VALUE if no device has this id.
     */
    std::shared_ptr<Device> getDeviceById(const char *deviceId) const;
};

}  // namespace fps
