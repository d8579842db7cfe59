// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "FpsException.hpp"
#include "logger/Logger.hpp"

namespace libfpsdk {
recoverable_exception::recoverable_exception(const std::string &msg, fps_error_kind error_kind) noexcept : libfpsdk_exception(msg, error_kind) {
    LOG_WARN(msg);
}
}  // namespace libfpsdk
