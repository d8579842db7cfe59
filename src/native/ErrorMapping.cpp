// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "ErrorMapping.hpp"

#include <fprint.h>
#include <gio/gio.h>
#include <gusb.h>

#include "exception/FpsException.hpp"
#include "utils/Utils.hpp"

namespace libfpsdk {
namespace native {

static fps_error_kind deviceErrorToKind(int code) {
    switch(code) {
    case FP_DEVICE_ERROR_GENERAL:
        return FPS_ERROR_GENERAL;
    case FP_DEVICE_ERROR_NOT_SUPPORTED:
        return FPS_ERROR_DEVICE_NOT_SUPPORTED;
    case FP_DEVICE_ERROR_NOT_OPEN:
        return FPS_ERROR_DEVICE_NOT_OPEN;
    case FP_DEVICE_ERROR_ALREADY_OPEN:
        return FPS_ERROR_DEVICE_ALREADY_OPEN;
    case FP_DEVICE_ERROR_BUSY:
        return FPS_ERROR_DEVICE_BUSY;
    case FP_DEVICE_ERROR_PROTO:
        return FPS_ERROR_PROTOCOL;
    case FP_DEVICE_ERROR_DATA_INVALID:
        return FPS_ERROR_DATA_INVALID;
    case FP_DEVICE_ERROR_DATA_NOT_FOUND:
        return FPS_ERROR_DATA_NOT_FOUND;
    case FP_DEVICE_ERROR_DATA_FULL:
        return FPS_ERROR_DATA_FULL;
    case FP_DEVICE_ERROR_DATA_DUPLICATE:
        return FPS_ERROR_DATA_DUPLICATE;
    case FP_DEVICE_ERROR_REMOVED:
        return FPS_ERROR_DEVICE_REMOVED;
    default:
        return FPS_ERROR_UNKNOWN_NATIVE;
    }
}

static fps_error_kind ioErrorToKind(int code) {
    switch(code) {
    case G_IO_ERROR_CANCELLED:
        return FPS_ERROR_OPERATION_CANCELLED;
    case G_IO_ERROR_INVALID_DATA:
        // reported by fp_print_deserialize for malformed input
        return FPS_ERROR_DATA_INVALID;
    case G_IO_ERROR_PERMISSION_DENIED:
        return FPS_ERROR_PERMISSION_DENIED;
    case G_IO_ERROR_NOT_SUPPORTED:
        return FPS_ERROR_DEVICE_NOT_SUPPORTED;
    case G_IO_ERROR_BUSY:
        return FPS_ERROR_DEVICE_BUSY;
    default:
        return FPS_ERROR_IO;
    }
}

// USB transport errors, passed through unchanged by fp_device_open and the drivers' interface claim
static fps_error_kind usbErrorToKind(int code) {
    switch(code) {
    case G_USB_DEVICE_ERROR_PERMISSION_DENIED:
        return FPS_ERROR_PERMISSION_DENIED;
    case G_USB_DEVICE_ERROR_BUSY:
        return FPS_ERROR_DEVICE_BUSY;
    case G_USB_DEVICE_ERROR_NO_DEVICE:
        return FPS_ERROR_DEVICE_REMOVED;
    case G_USB_DEVICE_ERROR_NOT_SUPPORTED:
        return FPS_ERROR_DEVICE_NOT_SUPPORTED;
    case G_USB_DEVICE_ERROR_CANCELLED:
        return FPS_ERROR_OPERATION_CANCELLED;
    case G_USB_DEVICE_ERROR_NOT_OPEN:
        return FPS_ERROR_DEVICE_NOT_OPEN;
    case G_USB_DEVICE_ERROR_ALREADY_OPEN:
        return FPS_ERROR_DEVICE_ALREADY_OPEN;
    default:
        return FPS_ERROR_IO;
    }
}

fps_error_kind ErrorMapping::toErrorKind(GQuark domain, int code) {
    if(domain == 0) {
        return FPS_ERROR_UNKNOWN_NATIVE;
    }
    if(domain == FP_DEVICE_ERROR) {
        return deviceErrorToKind(code);
    }
    if(domain == FP_DEVICE_RETRY) {
        // any retry reason (too short, center finger, remove finger) asks for another scan
        return FPS_ERROR_SCAN_RETRY;
    }
    if(domain == G_IO_ERROR) {
        return ioErrorToKind(code);
    }
    if(domain == G_USB_DEVICE_ERROR) {
        return usbErrorToKind(code);
    }
    return FPS_ERROR_UNKNOWN_NATIVE;
}

fps_error_kind ErrorMapping::toErrorKind(const GError *error) {
    if(!error) {
        return FPS_ERROR_UNKNOWN_NATIVE;
    }
    return toErrorKind(error->domain, error->code);
}

std::string ErrorMapping::domainName(GQuark domain) {
    auto name = g_quark_to_string(domain);
    return name ? name : "";
}

void ErrorMapping::throwNativeError(const std::string &operation, const GError *error) {
    if(!error) {
        throw native_exception(operation + " failed without reporting an error", FPS_ERROR_UNKNOWN_NATIVE, "", 0);
    }
    auto        kind = toErrorKind(error);
    std::string msg  = utils::string::to_string() << operation << " failed: " << error->message << " (" << utils::errorKindToStr(kind) << ")";
    throw native_exception(msg, kind, domainName(error->domain), error->code);
}

}  // namespace native
}  // namespace libfpsdk
