// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "FileUtils.hpp"

#include <unistd.h>

namespace libfpsdk {
namespace utils {

bool fileExists(const char *file) {
    return (access(file, F_OK) == 0);
}

}  // namespace utils
}  // namespace libfpsdk
