// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "ImplTypes.hpp"
#include "native/ErrorMapping.hpp"
#include "fpsdk/hpp/Print.hpp"

void translate_exception(const char *name, const std::string &args) {
    try {
        throw;
    }
    catch(const fps::Error &) {
        // already translated by a nested public call (e.g. from inside a callback)
        throw;
    }
    catch(const libfpsdk::native_exception &e) {
        throw fps::Error(e.get_error_kind(), e.get_message(), name, args, e.get_native_domain(), e.get_native_code());
    }
    catch(const libfpsdk::libfpsdk_exception &e) {
        throw fps::Error(e.get_error_kind(), e.get_message(), name, args);
    }
    catch(const std::logic_error &e) {
        throw fps::Error(FPS_ERROR_INVALID_VALUE, e.what(), name, args);
    }
    catch(const std::exception &e) {
        throw fps::Error(FPS_ERROR_STD_EXCEPTION, e.what(), name, args);
    }
}

std::shared_ptr<fps::Print> createPrint(libfpsdk::native::GObjectHandle<FpPrint> print) {
    std::unique_ptr<fps_print> impl(new fps_print());
    impl->print  = std::move(print);
    auto wrapper = std::make_shared<fps::Print>(impl.get());
    impl.release();
    return wrapper;
}

fps::Error createNativeError(const GError *error, const char *function) {
    auto kind = libfpsdk::native::ErrorMapping::toErrorKind(error);
    return fps::Error(kind, error->message, function, "", libfpsdk::native::ErrorMapping::domainName(error->domain), error->code);
}
