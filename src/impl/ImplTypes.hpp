// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once
#include "fpsdk/h/FpsTypes.h"
#include "fpsdk/hpp/Error.hpp"

#include "context/Context.hpp"
#include "device/FingerprintDevice.hpp"
#include "native/GlibHandle.hpp"
#include "exception/FpsException.hpp"
#include "utils/Utils.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace fps {
class Device;
class Print;
}  // namespace fps

struct fps_context_t {
    std::shared_ptr<libfpsdk::Context> context;

    // public wrappers handed out by getDevices(), kept while the caller holds them
    std::mutex                                                          devicesMutex;
    std::map<libfpsdk::FingerprintDevice *, std::weak_ptr<fps::Device>> devices;
};

struct fps_device_t {
    std::shared_ptr<libfpsdk::FingerprintDevice> device;
};

struct fps_print_t {
    libfpsdk::native::GObjectHandle<FpPrint> print;
};

struct fps_image_t {
    libfpsdk::native::GObjectHandle<FpImage> image;
};

// Rethrows the exception being handled as fps::Error, tagged with the public function name and its arguments.
[[noreturn]] void translate_exception(const char *name, const std::string &args);

// Wraps an owned native print into a public Print.
std::shared_ptr<fps::Print> createPrint(libfpsdk::native::GObjectHandle<FpPrint> print);

// Public error describing a native retry or failure reported through a callback.
fps::Error createNativeError(const GError *error, const char *function);

#define BEGIN_API_CALL try
#define HANDLE_EXCEPTIONS_AND_THROW(...)                                      \
    catch(...) {                                                              \
        std::ostringstream ss;                                                \
        libfpsdk::utils::string::ArgsToStream(ss, #__VA_ARGS__, __VA_ARGS__); \
        translate_exception(__FUNCTION__, ss.str());                          \
    }
#define NO_ARGS_HANDLE_EXCEPTIONS_AND_THROW()  \
    catch(...) {                               \
        translate_exception(__FUNCTION__, ""); \
    }
