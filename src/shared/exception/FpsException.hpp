// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once

#include <cstring>
#include <string>
#include <exception>
#include <stdexcept>
#include <typeinfo>
#include "fpsdk/h/FpsTypes.h"
#include "logger/Logger.hpp"

#ifdef _WIN32
#define __FILENAME__ (strrchr(__FILE__, '\\') ? strrchr(__FILE__, '\\') + 1 : __FILE__)
#else
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)
#endif

namespace libfpsdk {
class libfpsdk_exception : public std::exception {
public:
    const char *get_message() const noexcept {
        return _msg.c_str();
    }

    fps_error_kind get_error_kind() const noexcept {
        return _error_kind;
    }

    const char *what() const noexcept override {
        return _msg.c_str();
    }

public:
    libfpsdk_exception(const std::string &msg, fps_error_kind error_kind) noexcept : _msg(msg), _error_kind(error_kind) {}

private:
    std::string    _msg;
    fps_error_kind _error_kind;
};

class recoverable_exception : public libfpsdk_exception {
public:
    recoverable_exception(const std::string &msg, fps_error_kind error_kind) noexcept;
};

class unrecoverable_exception : public libfpsdk_exception {
public:
    unrecoverable_exception(const std::string &msg, fps_error_kind error_kind) noexcept : libfpsdk_exception(msg, error_kind) {
        LOG_WARN(msg);
    }
};

class native_init_exception : public unrecoverable_exception {
public:
    native_init_exception(const std::string &msg) noexcept : unrecoverable_exception(msg, FPS_ERROR_NATIVE_INIT_FAILURE) {}
};

class invalid_value_exception : public recoverable_exception {
public:
    invalid_value_exception(const std::string &msg) noexcept : recoverable_exception(msg, FPS_ERROR_INVALID_VALUE) {}
};

class invalid_data_exception : public recoverable_exception {
public:
    invalid_data_exception(const std::string &msg) noexcept : recoverable_exception(msg, FPS_ERROR_DATA_INVALID) {}
};

// the device is in a state where the call is not allowed (closed, or busy with another operation)
class wrong_api_call_sequence_exception : public recoverable_exception {
public:
    wrong_api_call_sequence_exception(const std::string &msg, fps_error_kind error_kind) noexcept : recoverable_exception(msg, error_kind) {}
};

// failure reported by the native library, keeps the native error domain and code
class native_exception : public recoverable_exception {
public:
    native_exception(const std::string &msg, fps_error_kind error_kind, const std::string &domain, int code) noexcept
        : recoverable_exception(msg, error_kind), _domain(domain), _code(code) {}

    const char *get_native_domain() const noexcept {
        return _domain.c_str();
    }

    int get_native_code() const noexcept {
        return _code;
    }

private:
    std::string _domain;
    int         _code;
};

#define BEGIN_TRY_EXECUTE(statement) \
    try {                            \
        statement;                   \
    }

#define CATCH_EXCEPTION_AND_EXECUTE(statement)                                                                                                               \
    catch(const libfpsdk::libfpsdk_exception &e) {                                                                                                           \
        LOG_WARN("Execute failure! A libfpsdk_exception has occurred!\n - where: {0}({1}):{2}\n - msg: {3}\n - type: {4}", __FILENAME__, __LINE__,           \
                 __FUNCTION__, e.get_message(), typeid(e).name());                                                                                           \
        statement;                                                                                                                                           \
    }                                                                                                                                                        \
    catch(const std::exception &e) {                                                                                                                         \
        LOG_WARN("Execute failure! A std::exception has occurred!\n - where: {0}({1}):{2}\n - msg: {3}\n - type: {4}", __FILENAME__, __LINE__, __FUNCTION__, \
                 e.what(), typeid(e).name());                                                                                                                \
        statement;                                                                                                                                           \
    }

#define VALIDATE_NOT_NULL(ARG)                                             \
    if(!(ARG)) {                                                           \
        std::string msg = "NULL pointer passed for argument \"" #ARG "\""; \
        LOG_WARN(msg);                                                     \
        throw std::logic_error(msg);                                       \
    }

#define VALIDATE_ENUM(ARG, COUNT)                                         \
    if(!(((ARG) >= 0) && ((ARG) < (COUNT)))) {                            \
        std::string msg = "Invalid enum value for argument \"" #ARG "\""; \
        LOG_WARN(msg);                                                    \
        throw std::logic_error(msg);                                      \
    }

#define VALIDATE_RANGE(ARG, MIN, MAX)                                     \
    if((ARG) < (MIN) || (ARG) > (MAX)) {                                  \
        std::string msg = "Out of range value for argument \"" #ARG "\""; \
        LOG_WARN(msg);                                                    \
        throw std::logic_error(msg);                                      \
    }

#define VALIDATE_UNSIGNED_INDEX(ARG, COUNT)                                \
    if((ARG) >= (COUNT)) {                                                 \
        std::string msg = "Invalid index value for argument \"" #ARG "\""; \
        LOG_WARN(msg);                                                     \
        throw std::logic_error(msg);                                       \
    }
}  // namespace libfpsdk
