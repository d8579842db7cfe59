// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "FingerprintDevice.hpp"
#include "context/Context.hpp"
#include "native/ErrorMapping.hpp"
#include "exception/FpsException.hpp"
#include "logger/Logger.hpp"
#include "utils/Utils.hpp"

namespace libfpsdk {

/**
 * @brief Marks the device busy for the lifetime of one operation and provides the cancellable handed to the native call.
 */
class FingerprintDevice::OperationGuard {
public:
    OperationGuard(FingerprintDevice *owner, const char *operation) : owner_(owner), operation_(operation) {
        bool expected = false;
        if(!owner_->busy_.compare_exchange_strong(expected, true)) {
            throw wrong_api_call_sequence_exception(utils::string::to_string()
                                                        << "Device " << owner_->getName() << " is busy with another operation, " << operation_ << " rejected",
                                                    FPS_ERROR_DEVICE_BUSY);
        }
        cancellable_.reset(g_cancellable_new());
        std::lock_guard<std::mutex> lock(owner_->cancellableMutex_);
        owner_->cancellable_ = native::GObjectHandle<GCancellable>::ref(cancellable_.get());
    }

    ~OperationGuard() noexcept {
        {
            std::lock_guard<std::mutex> lock(owner_->cancellableMutex_);
            owner_->cancellable_.reset();
        }
        owner_->busy_ = false;
    }

    GCancellable *getCancellable() const {
        return cancellable_.get();
    }

private:
    FingerprintDevice                  *owner_;
    const char                         *operation_;
    native::GObjectHandle<GCancellable> cancellable_;
};

FingerprintDevice::FingerprintDevice(std::shared_ptr<Context> context, FpDevice *device)
    : context_(std::move(context)),
      fpDevice_(native::GObjectHandle<FpDevice>::ref(device)),
      busy_(false),
      openedByWrapper_(false),
      autoCloseOnRelease_(true) {
    context_->getEnvConfig()->getBooleanValue("Device.AutoCloseOnRelease", autoCloseOnRelease_);
    LOG_DEBUG("Device wrapper created: {} [driver={}, id={}]", getName(), getDriver(), getDeviceId());
}

FingerprintDevice::~FingerprintDevice() noexcept {
    if(openedByWrapper_ && autoCloseOnRelease_ && fp_device_is_open(fpDevice_.get())) {
        LOG_INFO("Device {} released while open, closing it", getName());
        native::GErrorHolder error;
        if(!fp_device_close_sync(fpDevice_.get(), nullptr, error.out())) {
            LOG_WARN("Failed to close device {} on release: {}", getName(), error ? error.get()->message : "unknown error");
        }
    }
    LOG_DEBUG("Device wrapper destroyed: {}", getName());
}

const char *FingerprintDevice::getName() const {
    auto name = fp_device_get_name(fpDevice_.get());
    return name ? name : "";
}

const char *FingerprintDevice::getDriver() const {
    auto driver = fp_device_get_driver(fpDevice_.get());
    return driver ? driver : "";
}

const char *FingerprintDevice::getDeviceId() const {
    auto id = fp_device_get_device_id(fpDevice_.get());
    return id ? id : "";
}

FPSDeviceType FingerprintDevice::getDeviceType() const {
    return static_cast<FPSDeviceType>(fp_device_get_device_type(fpDevice_.get()));
}

FPSScanType FingerprintDevice::getScanType() const {
    return static_cast<FPSScanType>(fp_device_get_scan_type(fpDevice_.get()));
}

uint32_t FingerprintDevice::getEnrollStages() const {
    auto stages = fp_device_get_nr_enroll_stages(fpDevice_.get());
    return stages > 0 ? static_cast<uint32_t>(stages) : 0;
}

uint32_t FingerprintDevice::getFeatures() const {
    return static_cast<uint32_t>(fp_device_get_features(fpDevice_.get()));
}

bool FingerprintDevice::hasFeature(FPSDeviceFeature feature) const {
    return fp_device_has_feature(fpDevice_.get(), static_cast<FpDeviceFeature>(feature));
}

uint32_t FingerprintDevice::getFingerStatus() const {
    return static_cast<uint32_t>(fp_device_get_finger_status(fpDevice_.get()));
}

bool FingerprintDevice::isOpen() const {
    return fp_device_is_open(fpDevice_.get());
}

void FingerprintDevice::checkOpen(const char *operation) const {
    if(!fp_device_is_open(fpDevice_.get())) {
        throw wrong_api_call_sequence_exception(utils::string::to_string() << "Device " << getName() << " is not open, " << operation << " rejected",
                                                FPS_ERROR_DEVICE_NOT_OPEN);
    }
}

void FingerprintDevice::open() {
    OperationGuard       guard(this, "open");
    native::GErrorHolder error;
    LOG_DEBUG("Opening device {}", getName());
    if(!fp_device_open_sync(fpDevice_.get(), guard.getCancellable(), error.out())) {
        native::ErrorMapping::throwNativeError("fp_device_open_sync", error.get());
    }
    openedByWrapper_ = true;
    LOG_INFO("Device {} opened [driver={}, id={}, enroll stages={}]", getName(), getDriver(), getDeviceId(), getEnrollStages());
}

void FingerprintDevice::close() {
    OperationGuard       guard(this, "close");
    native::GErrorHolder error;
    LOG_DEBUG("Closing device {}", getName());
    if(!fp_device_close_sync(fpDevice_.get(), guard.getCancellable(), error.out())) {
        native::ErrorMapping::throwNativeError("fp_device_close_sync", error.get());
    }
    openedByWrapper_ = false;
    LOG_INFO("Device {} closed", getName());
}

native::GObjectHandle<FpPrint> FingerprintDevice::createTemplatePrint() const {
    // fp_print_new returns a floating reference
    auto print = native::GObjectHandle<FpPrint>::refSink(fp_print_new(fpDevice_.get()));
    if(!print) {
        throw native_exception("fp_print_new failed", FPS_ERROR_GENERAL, "", 0);
    }
    return print;
}

void FingerprintDevice::onEnrollProgress(FpDevice *device, gint completedStages, FpPrint *print, gpointer userData, GError *error) {
    utils::unusedVar(device);
    auto ctx = static_cast<CallbackContext<EnrollProgressHandler> *>(userData);
    if(error) {
        LOG_DEBUG("Enroll progress: {} stage(s) completed, retry requested: {}", completedStages, error->message);
    }
    else {
        LOG_DEBUG("Enroll progress: {} stage(s) completed", completedStages);
    }
    if(!ctx->handler || ctx->exception) {
        return;
    }
    try {
        ctx->handler(completedStages > 0 ? static_cast<uint32_t>(completedStages) : 0, print, error);
    }
    catch(...) {
        // delivered to the caller once the native call has returned
        ctx->exception = std::current_exception();
        LOG_WARN("Enroll progress callback raised an exception, cancelling enrollment");
        ctx->owner->cancel();
    }
}

void FingerprintDevice::onMatch(FpDevice *device, FpPrint *match, FpPrint *print, gpointer userData, GError *error) {
    utils::unusedVar(device);
    auto ctx = static_cast<CallbackContext<MatchHandler> *>(userData);
    if(error) {
        LOG_DEBUG("Match report: retry requested: {}", error->message);
    }
    else {
        LOG_DEBUG("Match report: {}", match ? "matched" : "no match");
    }
    if(!ctx->handler || ctx->exception) {
        return;
    }
    try {
        ctx->handler(match, print, error);
    }
    catch(...) {
        ctx->exception = std::current_exception();
        LOG_WARN("Match callback raised an exception, cancelling the operation");
        ctx->owner->cancel();
    }
}

native::GObjectHandle<FpPrint> FingerprintDevice::enroll(FpPrint *templatePrint, EnrollProgressHandler handler) {
    OperationGuard guard(this, "enroll");
    checkOpen("enroll");

    native::GObjectHandle<FpPrint> templateHolder;
    if(templatePrint) {
        templateHolder = native::GObjectHandle<FpPrint>::ref(templatePrint);
    }
    else {
        templateHolder = createTemplatePrint();
    }

    CallbackContext<EnrollProgressHandler> ctx{ this, std::move(handler), nullptr };
    native::GErrorHolder                   error;
    LOG_INFO("Enroll started on device {}, {} stage(s) required", getName(), getEnrollStages());
    native::GObjectHandle<FpPrint> enrolled(fp_device_enroll_sync(fpDevice_.get(), templateHolder.get(), guard.getCancellable(),
                                                                  &FingerprintDevice::onEnrollProgress, &ctx, error.out()));
    if(ctx.exception) {
        std::rethrow_exception(ctx.exception);
    }
    if(!enrolled) {
        native::ErrorMapping::throwNativeError("fp_device_enroll_sync", error.get());
    }
    LOG_INFO("Enroll finished on device {}", getName());
    return enrolled;
}

NativeVerifyResult FingerprintDevice::verify(FpPrint *enrolledPrint, MatchHandler handler) {
    OperationGuard guard(this, "verify");
    checkOpen("verify");

    CallbackContext<MatchHandler> ctx{ this, std::move(handler), nullptr };
    native::GErrorHolder          error;
    gboolean                      matched = FALSE;
    FpPrint                      *scanned = nullptr;
    LOG_INFO("Verify started on device {}", getName());
    auto ok = fp_device_verify_sync(fpDevice_.get(), enrolledPrint, guard.getCancellable(), &FingerprintDevice::onMatch, &ctx, &matched, &scanned,
                                    error.out());

    NativeVerifyResult result;
    result.scannedPrint.reset(scanned);
    if(ctx.exception) {
        std::rethrow_exception(ctx.exception);
    }
    if(!ok) {
        native::ErrorMapping::throwNativeError("fp_device_verify_sync", error.get());
    }
    result.matched = matched ? true : false;
    LOG_INFO("Verify finished on device {}: {}", getName(), result.matched ? "match" : "no match");
    return result;
}

NativeIdentifyResult FingerprintDevice::identify(const std::vector<FpPrint *> &gallery, MatchHandler handler) {
    OperationGuard guard(this, "identify");
    checkOpen("identify");

    native::GPtrArrayHandle prints(g_ptr_array_new_full(static_cast<guint>(gallery.size()), g_object_unref));
    for(auto print: gallery) {
        g_ptr_array_add(prints.get(), g_object_ref(print));
    }

    CallbackContext<MatchHandler> ctx{ this, std::move(handler), nullptr };
    native::GErrorHolder          error;
    FpPrint                      *match   = nullptr;
    FpPrint                      *scanned = nullptr;
    LOG_INFO("Identify started on device {}, gallery size: {}", getName(), gallery.size());
    auto ok = fp_device_identify_sync(fpDevice_.get(), prints.get(), guard.getCancellable(), &FingerprintDevice::onMatch, &ctx, &match, &scanned,
                                      error.out());

    // match is a new reference to one of the gallery prints, the caller keeps its own
    native::GObjectHandle<FpPrint> matchHolder(match);
    NativeIdentifyResult           result;
    result.scannedPrint.reset(scanned);
    if(ctx.exception) {
        std::rethrow_exception(ctx.exception);
    }
    if(!ok) {
        native::ErrorMapping::throwNativeError("fp_device_identify_sync", error.get());
    }
    result.match = matchHolder.get();
    LOG_INFO("Identify finished on device {}: {}", getName(), result.match ? "match" : "no match");
    return result;
}

native::GObjectHandle<FpImage> FingerprintDevice::capture(bool waitForFinger) {
    OperationGuard guard(this, "capture");
    checkOpen("capture");

    native::GErrorHolder error;
    LOG_INFO("Capture started on device {}", getName());
    native::GObjectHandle<FpImage> image(fp_device_capture_sync(fpDevice_.get(), waitForFinger, guard.getCancellable(), error.out()));
    if(!image) {
        native::ErrorMapping::throwNativeError("fp_device_capture_sync", error.get());
    }
    LOG_INFO("Capture finished on device {}: {}x{}", getName(), fp_image_get_width(image.get()), fp_image_get_height(image.get()));
    return image;
}

std::vector<native::GObjectHandle<FpPrint>> FingerprintDevice::listPrints() {
    OperationGuard guard(this, "listPrints");
    checkOpen("listPrints");

    native::GErrorHolder    error;
    native::GPtrArrayHandle stored(fp_device_list_prints_sync(fpDevice_.get(), guard.getCancellable(), error.out()));
    if(!stored.get()) {
        native::ErrorMapping::throwNativeError("fp_device_list_prints_sync", error.get());
    }

    std::vector<native::GObjectHandle<FpPrint>> prints;
    for(guint i = 0; i < stored.size(); i++) {
        prints.push_back(native::GObjectHandle<FpPrint>::ref(static_cast<FpPrint *>(stored.at(i))));
    }
    LOG_DEBUG("Device {} stores {} print(s)", getName(), prints.size());
    return prints;
}

void FingerprintDevice::deletePrint(FpPrint *print) {
    OperationGuard guard(this, "deletePrint");
    checkOpen("deletePrint");

    native::GErrorHolder error;
    if(!fp_device_delete_print_sync(fpDevice_.get(), print, guard.getCancellable(), error.out())) {
        native::ErrorMapping::throwNativeError("fp_device_delete_print_sync", error.get());
    }
    LOG_INFO("Print deleted from device {}", getName());
}

void FingerprintDevice::clearStorage() {
    OperationGuard guard(this, "clearStorage");
    checkOpen("clearStorage");

    native::GErrorHolder error;
    if(!fp_device_clear_storage_sync(fpDevice_.get(), guard.getCancellable(), error.out())) {
        native::ErrorMapping::throwNativeError("fp_device_clear_storage_sync", error.get());
    }
    LOG_INFO("Storage of device {} cleared", getName());
}

void FingerprintDevice::cancel() {
    native::GObjectHandle<GCancellable> cancellable;
    {
        std::lock_guard<std::mutex> lock(cancellableMutex_);
        if(!cancellable_) {
            LOG_DEBUG("Cancel requested on device {} with no operation in flight", getName());
            return;
        }
        cancellable = native::GObjectHandle<GCancellable>::ref(cancellable_.get());
    }
    LOG_INFO("Cancelling the operation in flight on device {}", getName());
    g_cancellable_cancel(cancellable.get());
}

FpDevice *FingerprintDevice::getNativeDevice() const {
    return fpDevice_.get();
}

std::shared_ptr<Context> FingerprintDevice::getContext() const {
    return context_;
}

}  // namespace libfpsdk
