// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fprint.h>
#include <gio/gio.h>
#include <gusb.h>

#include "native/ErrorMapping.hpp"
#include "exception/FpsException.hpp"
#include "TestUtils.hpp"

#include <iostream>
#include <vector>

using libfpsdk::native::ErrorMapping;

static void checkMapping(GQuark domain, int code, FPSErrorKind expected) {
    auto kind = ErrorMapping::toErrorKind(domain, code);
    if(kind != expected) {
        std::cerr << "Mapping of " << ErrorMapping::domainName(domain) << "/" << code << " is " << fps::TypeHelper::convertErrorKindToString(kind)
                  << ", expected " << fps::TypeHelper::convertErrorKindToString(expected) << std::endl;
        exit(-1);
    }
}

int main() {
    // device errors
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_GENERAL, FPS_ERROR_GENERAL);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_NOT_SUPPORTED, FPS_ERROR_DEVICE_NOT_SUPPORTED);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_NOT_OPEN, FPS_ERROR_DEVICE_NOT_OPEN);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_ALREADY_OPEN, FPS_ERROR_DEVICE_ALREADY_OPEN);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_BUSY, FPS_ERROR_DEVICE_BUSY);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_PROTO, FPS_ERROR_PROTOCOL);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_DATA_INVALID, FPS_ERROR_DATA_INVALID);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_DATA_NOT_FOUND, FPS_ERROR_DATA_NOT_FOUND);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_DATA_FULL, FPS_ERROR_DATA_FULL);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_DATA_DUPLICATE, FPS_ERROR_DATA_DUPLICATE);
    checkMapping(FP_DEVICE_ERROR, FP_DEVICE_ERROR_REMOVED, FPS_ERROR_DEVICE_REMOVED);

    // retry reasons
    checkMapping(FP_DEVICE_RETRY, FP_DEVICE_RETRY_GENERAL, FPS_ERROR_SCAN_RETRY);
    checkMapping(FP_DEVICE_RETRY, FP_DEVICE_RETRY_TOO_SHORT, FPS_ERROR_SCAN_RETRY);
    checkMapping(FP_DEVICE_RETRY, FP_DEVICE_RETRY_CENTER_FINGER, FPS_ERROR_SCAN_RETRY);
    checkMapping(FP_DEVICE_RETRY, FP_DEVICE_RETRY_REMOVE_FINGER, FPS_ERROR_SCAN_RETRY);

    // GIO errors
    checkMapping(G_IO_ERROR, G_IO_ERROR_CANCELLED, FPS_ERROR_OPERATION_CANCELLED);
    checkMapping(G_IO_ERROR, G_IO_ERROR_PERMISSION_DENIED, FPS_ERROR_PERMISSION_DENIED);
    checkMapping(G_IO_ERROR, G_IO_ERROR_NOT_SUPPORTED, FPS_ERROR_DEVICE_NOT_SUPPORTED);
    checkMapping(G_IO_ERROR, G_IO_ERROR_BUSY, FPS_ERROR_DEVICE_BUSY);
    checkMapping(G_IO_ERROR, G_IO_ERROR_INVALID_DATA, FPS_ERROR_DATA_INVALID);
    checkMapping(G_IO_ERROR, G_IO_ERROR_TIMED_OUT, FPS_ERROR_IO);

    // USB transport errors
    checkMapping(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_PERMISSION_DENIED, FPS_ERROR_PERMISSION_DENIED);
    checkMapping(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_BUSY, FPS_ERROR_DEVICE_BUSY);
    checkMapping(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_NO_DEVICE, FPS_ERROR_DEVICE_REMOVED);
    checkMapping(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_NOT_SUPPORTED, FPS_ERROR_DEVICE_NOT_SUPPORTED);
    checkMapping(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_CANCELLED, FPS_ERROR_OPERATION_CANCELLED);
    checkMapping(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_NOT_OPEN, FPS_ERROR_DEVICE_NOT_OPEN);
    checkMapping(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_ALREADY_OPEN, FPS_ERROR_DEVICE_ALREADY_OPEN);
    checkMapping(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_TIMED_OUT, FPS_ERROR_IO);
    checkMapping(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_IO, FPS_ERROR_IO);

    // open() on a sensor without access rights surfaces as PERMISSION_DENIED with the USB domain kept
    GError *usbError = g_error_new_literal(G_USB_DEVICE_ERROR, G_USB_DEVICE_ERROR_PERMISSION_DENIED, "Failed to open USB device: access denied");
    bool    usbThrown = false;
    try {
        ErrorMapping::throwNativeError("fp_device_open_sync", usbError);
    }
    catch(const libfpsdk::native_exception &e) {
        usbThrown = true;
        fps_test::check(e.get_error_kind() == FPS_ERROR_PERMISSION_DENIED, "USB open failure kind");
        fps_test::check(std::string(e.get_native_domain()) == g_quark_to_string(G_USB_DEVICE_ERROR), "USB error domain kept");
        fps_test::check(e.get_native_code() == G_USB_DEVICE_ERROR_PERMISSION_DENIED, "USB error code kept");
    }
    g_error_free(usbError);
    fps_test::check(usbThrown, "USB open failure raised");

    // unknown domains and codes
    auto foreignDomain = g_quark_from_static_string("fpsdk-test-foreign-error-quark");
    checkMapping(foreignDomain, 0, FPS_ERROR_UNKNOWN_NATIVE);
    checkMapping(0, 0, FPS_ERROR_UNKNOWN_NATIVE);
    checkMapping(FP_DEVICE_ERROR, 0x7fff, FPS_ERROR_UNKNOWN_NATIVE);
    checkMapping(FP_DEVICE_ERROR, -1, FPS_ERROR_UNKNOWN_NATIVE);

    // every pair maps to exactly one valid kind, and the same one every time
    std::vector<GQuark> domains = { 0, FP_DEVICE_ERROR, FP_DEVICE_RETRY, G_IO_ERROR, G_USB_DEVICE_ERROR, foreignDomain };
    for(auto domain: domains) {
        for(int code = -16; code <= 512; code++) {
            auto kind = ErrorMapping::toErrorKind(domain, code);
            fps_test::check(kind >= FPS_ERROR_UNKNOWN_NATIVE && kind < FPS_ERROR_KIND_COUNT, "mapped kind is in range");
            fps_test::check(ErrorMapping::toErrorKind(domain, code) == kind, "mapping is idempotent");
        }
    }

    // every kind has a name
    for(int kind = FPS_ERROR_UNKNOWN_NATIVE; kind < FPS_ERROR_KIND_COUNT; kind++) {
        auto name = fps::TypeHelper::convertErrorKindToString(static_cast<FPSErrorKind>(kind));
        fps_test::check(name.find("FPS_ERROR_") == 0, "error kind " + std::to_string(kind) + " has a name");
    }

    // native errors keep their domain and code
    GError *gerror = g_error_new_literal(FP_DEVICE_ERROR, FP_DEVICE_ERROR_DATA_FULL, "storage full");
    try {
        ErrorMapping::throwNativeError("fp_device_enroll_sync", gerror);
    }
    catch(const libfpsdk::native_exception &e) {
        fps_test::check(e.get_error_kind() == FPS_ERROR_DATA_FULL, "native exception kind");
        fps_test::check(e.get_native_code() == FP_DEVICE_ERROR_DATA_FULL, "native exception code");
        fps_test::check(std::string(e.get_native_domain()) == g_quark_to_string(FP_DEVICE_ERROR), "native exception domain");
    }
    g_error_free(gerror);

    try {
        ErrorMapping::throwNativeError("fp_device_open_sync", nullptr);
    }
    catch(const libfpsdk::native_exception &e) {
        fps_test::check(e.get_error_kind() == FPS_ERROR_UNKNOWN_NATIVE, "native failure without GError");
    }

    std::cout << "error_mapping_test passed" << std::endl;
    return 0;
}
