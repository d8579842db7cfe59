// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once

#include "fpsdk/h/FpsTypes.h"

#include <glib.h>
#include <string>

namespace libfpsdk {
namespace native {

class ErrorMapping {
public:
    // Total over (domain, code): anything not recognized is FPS_ERROR_UNKNOWN_NATIVE.
    static fps_error_kind toErrorKind(GQuark domain, int code);
    static fps_error_kind toErrorKind(const GError *error);

    static std::string domainName(GQuark domain);

    /**
     * @brief Throws a native_exception describing a failed native call.
     *
     * @param[in] operation name of the native function that failed
     * @param[in] error the GError it reported, may be null when the native call failed without one
     */
    [[noreturn]] static void throwNativeError(const std::string &operation, const GError *error);
};

}  // namespace native
}  // namespace libfpsdk
