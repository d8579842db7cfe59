// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

/**
 * @file Error.hpp
 * @brief The exception type thrown by every FpsSDK call.
 */
#pragma once

#include "fpsdk/h/FpsTypes.h"

#include <exception>
#include <string>

namespace fps {

/**
 * @brief Error raised by a failing SDK call.
 *
 * Carries the error kind, the message, the name of the SDK function that failed and its arguments. When the failure comes from the
 * native fingerprint library the native error domain and code are kept as well.
 */
class FPS_EXPORT Error : public std::exception {
private:
    fps_error_kind kind_;
    std::string    message_;
    std::string    function_;
    std::string    args_;
    std::string    nativeDomain_;
    int            nativeCode_;

public:
    Error(fps_error_kind kind, const std::string &message, const std::string &function = "", const std::string &args = "",
          const std::string &nativeDomain = "", int nativeCode = 0)
        : kind_(kind), message_(message), function_(function), args_(args), nativeDomain_(nativeDomain), nativeCode_(nativeCode) {}

    ~Error() noexcept override = default;

    /**
     * @brief Get the detailed error message.
     */
    const char *what() const noexcept override {
        return message_.c_str();
    }

    /**
     * @brief Get the kind of the error.
     */
    fps_error_kind getKind() const noexcept {
        return kind_;
    }

    /**
     * @brief Get the name of the SDK function where the error occurred.
     */
    const char *getFunction() const noexcept {
        return function_.c_str();
    }

    /**
     * @brief Get the arguments passed to the failing function.
     */
    const char *getArgs() const noexcept {
        return args_.c_str();
    }

    /**
     * @brief Get the native error domain name, empty for errors raised by the SDK itself.
     */
    const char *getNativeDomain() const noexcept {
        return nativeDomain_.c_str();
    }

    /**
     * @brief Get the native error code, only meaningful when getNativeDomain() is not empty.
     */
    int getNativeCode() const noexcept {
        return nativeCode_;
    }

    bool isNative() const noexcept {
        return !nativeDomain_.empty();
    }
};

}  // namespace fps
