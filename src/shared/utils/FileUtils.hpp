// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once
#include <string>

namespace libfpsdk {
namespace utils {
bool fileExists(const char *file);
}  // namespace utils
}  // namespace libfpsdk
