// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once

#include "fpsdk/h/FpsTypes.h"
#include <iostream>
#include <string>

namespace libfpsdk {
namespace utils {

const std::string &errorKindToStr(FPSErrorKind kind);
const std::string &fingerToStr(FPSFinger finger);
const std::string &scanTypeToStr(FPSScanType type);
const std::string &deviceTypeToStr(FPSDeviceType type);
std::string        deviceFeaturesToStr(uint32_t features);

}  // namespace utils
}  // namespace libfpsdk

std::ostream &operator<<(std::ostream &os, const FPSErrorKind &kind);
std::ostream &operator<<(std::ostream &os, const FPSFinger &finger);
