// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once

#include "fpsdk/h/FpsTypes.h"

#include <string>

namespace fps {
class FPS_EXPORT TypeHelper {
public:
    /**
     * @brief Convert FPSErrorKind to " string " type and then return.
     *
     * @param[in] kind FPSErrorKind type.
     * @return FPSErrorKind of "string" type.
     */
    static std::string convertErrorKindToString(const FPSErrorKind &kind);

    /**
     * @brief Convert FPSFinger to " string " type and then return.
     *
     * @param[in] finger FPSFinger type.
     * @return FPSFinger of "string" type.
     */
    static std::string convertFingerToString(const FPSFinger &finger);

    static std::string convertScanTypeToString(const FPSScanType &type);

    static std::string convertDeviceTypeToString(const FPSDeviceType &type);

    /**
     * @brief Convert a combination of FPSDeviceFeature flags to a '|' separated list of names.
     */
    static std::string convertDeviceFeaturesToString(uint32_t features);
};
}  // namespace fps
