// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

/**
 * @file Types.hpp
 * @brief Callback and result types used by the C++ API.
 */
#pragma once

#include "fpsdk/h/FpsTypes.h"

#include <functional>
#include <memory>
#include <vector>

namespace fps {
class Error;
class Print;
class Image;
class Device;

/**
 * @brief Enrollment progress callback.
 *
 * Invoked synchronously from inside Device::enroll, once per native progress event and in native order.
 *
 * @param completedStages The number of enroll stages completed so far.
 * @param print The last scanned print, may be empty.
 * @param error A retry error (kind FPS_ERROR_SCAN_RETRY) when the scan must be repeated, otherwise nullptr. Only valid during the call.
 */
using EnrollProgressCallback = std::function<void(uint32_t completedStages, std::shared_ptr<Print> print, const Error *error)>;

/**
 * @brief Match callback for verify and identify.
 *
 * Invoked synchronously from inside Device::verify / Device::identify as soon as the driver reports a result, before the operation completes.
 *
 * @param match The matching print, empty when nothing matched.
 * @param print The newly scanned print, may be empty.
 * @param error A retry error when the scan must be repeated, otherwise nullptr. Only valid during the call.
 */
using MatchCallback = std::function<void(std::shared_ptr<Print> match, std::shared_ptr<Print> print, const Error *error)>;

/**
 * @brief Result of a one-to-one comparison. The native library reports no confidence score.
 */
struct VerifyResult {
    bool                   matched = false;
    std::shared_ptr<Print> scannedPrint;  ///< The print scanned during verification, may be empty
};

/**
 * @brief Result of a one-to-many comparison.
 */
struct IdentifyResult {
    std::shared_ptr<Print> match;         ///< One of the gallery prints passed to identify, empty when nothing matched
    std::shared_ptr<Print> scannedPrint;  ///< The print scanned during identification, may be empty
};

}  // namespace fps
