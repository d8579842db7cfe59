// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "fpsdk/hpp/TypeHelper.hpp"

#include "utils/Utils.hpp"

namespace fps {

std::string TypeHelper::convertErrorKindToString(const FPSErrorKind &kind) {
    return libfpsdk::utils::errorKindToStr(kind);
}

std::string TypeHelper::convertFingerToString(const FPSFinger &finger) {
    return libfpsdk::utils::fingerToStr(finger);
}

std::string TypeHelper::convertScanTypeToString(const FPSScanType &type) {
    return libfpsdk::utils::scanTypeToStr(type);
}

std::string TypeHelper::convertDeviceTypeToString(const FPSDeviceType &type) {
    return libfpsdk::utils::deviceTypeToStr(type);
}

std::string TypeHelper::convertDeviceFeaturesToString(uint32_t features) {
    return libfpsdk::utils::deviceFeaturesToStr(features);
}

}  // namespace fps
