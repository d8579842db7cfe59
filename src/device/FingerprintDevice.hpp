// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fprint.h>

#include "fpsdk/h/FpsTypes.h"
#include "native/GlibHandle.hpp"

namespace libfpsdk {
class Context;

// Invoked for every native enroll progress event; print and error are borrowed for the duration of the call.
typedef std::function<void(uint32_t completedStages, FpPrint *print, const GError *error)> EnrollProgressHandler;

// Invoked when the driver reports a match result; match, print and error are borrowed for the duration of the call.
typedef std::function<void(FpPrint *match, FpPrint *print, const GError *error)> MatchHandler;

struct NativeVerifyResult {
    bool                           matched = false;
    native::GObjectHandle<FpPrint> scannedPrint;
};

struct NativeIdentifyResult {
    FpPrint                       *match = nullptr;  // one of the gallery prints passed to identify(), or null
    native::GObjectHandle<FpPrint> scannedPrint;
};

/**
 * @brief Wraps one native FpDevice.
 *
 * Every operation drives the matching libfprint *_sync function on the calling thread. Operations are exclusive: a second one started while
 * another is in flight fails with FPS_ERROR_DEVICE_BUSY before any native call.
 */
class FingerprintDevice {
public:
    FingerprintDevice(std::shared_ptr<Context> context, FpDevice *device);
    ~FingerprintDevice() noexcept;

    FingerprintDevice(const FingerprintDevice &)            = delete;
    FingerprintDevice &operator=(const FingerprintDevice &) = delete;

    const char   *getName() const;
    const char   *getDriver() const;
    const char   *getDeviceId() const;
    FPSDeviceType getDeviceType() const;
    FPSScanType   getScanType() const;
    uint32_t      getEnrollStages() const;
    uint32_t      getFeatures() const;
    bool          hasFeature(FPSDeviceFeature feature) const;
    uint32_t      getFingerStatus() const;
    bool          isOpen() const;

    void open();
    void close();

    native::GObjectHandle<FpPrint> createTemplatePrint() const;

    native::GObjectHandle<FpPrint> enroll(FpPrint *templatePrint, EnrollProgressHandler handler);
    NativeVerifyResult             verify(FpPrint *enrolledPrint, MatchHandler handler);
    NativeIdentifyResult           identify(const std::vector<FpPrint *> &gallery, MatchHandler handler);
    native::GObjectHandle<FpImage> capture(bool waitForFinger);

    std::vector<native::GObjectHandle<FpPrint>> listPrints();
    void                                        deletePrint(FpPrint *print);
    void                                        clearStorage();

    // Cancels the operation in flight, no-op when there is none.
    void cancel();

    FpDevice                *getNativeDevice() const;
    std::shared_ptr<Context> getContext() const;

private:
    class OperationGuard;
    friend class OperationGuard;

    void checkOpen(const char *operation) const;

    template <typename Handler> struct CallbackContext {
        FingerprintDevice *owner;
        Handler            handler;
        std::exception_ptr exception;
    };

    // native callback trampolines, never let an exception reach the native frames
    static void onEnrollProgress(FpDevice *device, gint completedStages, FpPrint *print, gpointer userData, GError *error);
    static void onMatch(FpDevice *device, FpPrint *match, FpPrint *print, gpointer userData, GError *error);

private:
    std::shared_ptr<Context>            context_;
    native::GObjectHandle<FpDevice>     fpDevice_;
    std::atomic<bool>                   busy_;
    std::mutex                          cancellableMutex_;
    native::GObjectHandle<GCancellable> cancellable_;  // cancellable of the operation in flight
    bool                                openedByWrapper_;
    bool                                autoCloseOnRelease_;
};

}  // namespace libfpsdk
