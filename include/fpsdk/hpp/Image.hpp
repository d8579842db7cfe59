// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

/**
 * @file Image.hpp
 * @brief A fingerprint image captured by a device.
 */
#pragma once

#include "Types.hpp"
#include "Error.hpp"

#include <vector>

namespace fps {

class FPS_EXPORT Image {
private:
    fps_image *impl_ = nullptr;

public:
    explicit Image(fps_image *impl);
    ~Image() noexcept;

    Image(const Image &)            = delete;
    Image &operator=(const Image &) = delete;

    uint32_t getWidth() const;
    uint32_t getHeight() const;

    /**
     * @brief Get the resolution in pixels per millimeter.
     */
    double getPpmm() const;

    /**
     * @brief Get a copy of the 8-bit greyscale pixel data, width * height bytes.
     */
    std::vector<uint8_t> getData() const;

    /**
     * @brief Get a copy of the binarized image, empty if the native library has not computed it.
     */
    std::vector<uint8_t> getBinarized() const;
};

}  // namespace fps
