// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

/**
 * @file Print.hpp
 * @brief An enrolled fingerprint template and its metadata.
 */
#pragma once

#include "Types.hpp"
#include "Error.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fps {
class Device;
class Image;

/**
 * @brief A fingerprint template.
 *
 * The template data itself is opaque; it can only be persisted through serialize() and restored through deserialize(), which use the native
 * library format unchanged. Comparison is always done by a Device.
 */
class FPS_EXPORT Print {
private:
    fps_print *impl_ = nullptr;

public:
    explicit Print(fps_print *impl);

    /**
     * @brief Create an empty template for the given device, to be passed to Device::enroll.
     */
    explicit Print(std::shared_ptr<Device> device);

    ~Print() noexcept;

    Print(Print &&print) noexcept;
    Print &operator=(Print &&print) noexcept;
    Print(const Print &)            = delete;
    Print &operator=(const Print &) = delete;

    /**
     * @brief Restore a print from its serialized form.
     *
     * @throws Error FPS_ERROR_DATA_INVALID if the data is empty or not a valid serialized print.
     */
    static std::shared_ptr<Print> deserialize(const uint8_t *data, size_t size);
    static std::shared_ptr<Print> deserialize(const std::vector<uint8_t> &data);

    /**
     * @brief Serialize the print in the native library format.
     */
    std::vector<uint8_t> serialize() const;

    /**
     * @brief Get the name of the driver that created the print.
     */
    const char *getDriver() const;

    /**
     * @brief Get the id of the device that created the print.
     */
    const char *getDeviceId() const;

    /**
     * @brief Whether the print is stored on the device rather than on the host.
     */
    bool isDeviceStored() const;

    FPSFinger getFinger() const;
    void      setFinger(FPSFinger finger);

    std::string getUsername() const;
    void        setUsername(const std::string &username);

    std::string getDescription() const;
    void        setDescription(const std::string &description);

    /**
     * @brief Get the enrollment date, all fields are 0 when no date is set.
     */
    FPSDate getEnrollDate() const;
    void    setEnrollDate(const FPSDate &date);

    /**
     * @brief Get the image the print was created from, empty when the driver does not keep one.
     */
    std::shared_ptr<Image> getImage() const;

    /**
     * @brief Whether the print can be used for comparison on the given device.
     */
    bool isCompatible(const Device &device) const;

    /**
     * @brief Whether both objects hold the same template.
     */
    bool equals(const Print &other) const;

    const fps_print *getImpl() const {
        return impl_;
    }
};

}  // namespace fps
