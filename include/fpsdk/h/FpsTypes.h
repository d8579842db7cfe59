// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

/**
 * @file FpsTypes.h
 * @brief Provides the enum and handle types shared by all FpsSDK headers.
 */
#pragma once

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>

#if defined(_WIN32) || defined(__CYGWIN__)
#ifdef FPS_BUILD_DLL
#define FPS_EXPORT __declspec(dllexport)
#else
#define FPS_EXPORT __declspec(dllimport)
#endif
#else
#define FPS_EXPORT __attribute__((visibility("default")))
#endif

struct fps_context_t;
struct fps_device_t;
struct fps_print_t;
struct fps_image_t;

typedef struct fps_context_t fps_context;  ///< Wraps the native device registry
typedef struct fps_device_t  fps_device;   ///< Wraps one native sensor
typedef struct fps_print_t   fps_print;    ///< Wraps one native fingerprint template
typedef struct fps_image_t   fps_image;    ///< Wraps one native fingerprint image

/**
 * @brief Classification of every error the SDK can report.
 *
 * The first block mirrors the native error classes, FPS_ERROR_UNKNOWN_NATIVE is the catch-all for any native domain/code pair
 * without a dedicated entry. The original native domain and code are always kept on the error object.
 */
typedef enum {
    FPS_ERROR_UNKNOWN_NATIVE = 0,    /**< Native error without a dedicated kind */
    FPS_ERROR_NATIVE_INIT_FAILURE,   /**< The native library could not be initialized */
    FPS_ERROR_DEVICE_BUSY,           /**< The device is busy with another operation */
    FPS_ERROR_DEVICE_NOT_SUPPORTED,  /**< The device does not support the requested operation */
    FPS_ERROR_PERMISSION_DENIED,     /**< The current user has no access to the device */
    FPS_ERROR_OPERATION_CANCELLED,   /**< The operation was cancelled */
    FPS_ERROR_DATA_INVALID,          /**< Print or template data is malformed */
    FPS_ERROR_DATA_NOT_FOUND,        /**< Requested print does not exist on the device */
    FPS_ERROR_DATA_FULL,             /**< On-device storage is full */
    FPS_ERROR_DATA_DUPLICATE,        /**< The print is already enrolled */
    FPS_ERROR_DEVICE_NOT_OPEN,       /**< The device has not been opened */
    FPS_ERROR_DEVICE_ALREADY_OPEN,   /**< The device is already open */
    FPS_ERROR_DEVICE_REMOVED,        /**< The device was unplugged */
    FPS_ERROR_PROTOCOL,              /**< Device protocol error */
    FPS_ERROR_GENERAL,               /**< Unspecified device failure */
    FPS_ERROR_IO,                    /**< General I/O failure */
    FPS_ERROR_SCAN_RETRY,            /**< The scan must be repeated: passed to enroll callbacks, raised by verify and identify */
    FPS_ERROR_INVALID_VALUE,         /**< Invalid argument passed by the caller */
    FPS_ERROR_STD_EXCEPTION,         /**< A standard exception was raised (e.g. by a user callback) */
    FPS_ERROR_KIND_COUNT,
} fps_error_kind,
    FPSErrorKind;

/**
 * @brief Log severity, the levels above the configured one are output.
 */
typedef enum {
    FPS_LOG_SEVERITY_DEBUG, /**< debug */
    FPS_LOG_SEVERITY_INFO,  /**< information */
    FPS_LOG_SEVERITY_WARN,  /**< warning */
    FPS_LOG_SEVERITY_ERROR, /**< error */
    FPS_LOG_SEVERITY_FATAL, /**< fatal error */
    FPS_LOG_SEVERITY_OFF    /**< off (close LOG) */
} fps_log_severity,
    FPSLogSeverity;

/**
 * @brief Finger identifier, values follow the native enumeration.
 */
typedef enum {
    FPS_FINGER_UNKNOWN = 0,
    FPS_FINGER_LEFT_THUMB,
    FPS_FINGER_LEFT_INDEX,
    FPS_FINGER_LEFT_MIDDLE,
    FPS_FINGER_LEFT_RING,
    FPS_FINGER_LEFT_LITTLE,
    FPS_FINGER_RIGHT_THUMB,
    FPS_FINGER_RIGHT_INDEX,
    FPS_FINGER_RIGHT_MIDDLE,
    FPS_FINGER_RIGHT_RING,
    FPS_FINGER_RIGHT_LITTLE,
} fps_finger,
    FPSFinger;

/**
 * @brief Finger presence flags reported by the device.
 */
typedef enum {
    FPS_FINGER_STATUS_NONE    = 0,
    FPS_FINGER_STATUS_NEEDED  = 1 << 0, /**< The device is waiting for a finger */
    FPS_FINGER_STATUS_PRESENT = 1 << 1, /**< A finger is on the sensor */
} fps_finger_status,
    FPSFingerStatus;

typedef enum {
    FPS_SCAN_TYPE_SWIPE = 0,
    FPS_SCAN_TYPE_PRESS,
} fps_scan_type,
    FPSScanType;

typedef enum {
    FPS_DEVICE_TYPE_VIRTUAL = 0,
    FPS_DEVICE_TYPE_USB,
    FPS_DEVICE_TYPE_UDEV,
} fps_device_type,
    FPSDeviceType;

/**
 * @brief Device capability flags, values follow the native enumeration.
 */
typedef enum {
    FPS_DEVICE_FEATURE_NONE             = 0,
    FPS_DEVICE_FEATURE_CAPTURE          = 1 << 0,
    FPS_DEVICE_FEATURE_IDENTIFY         = 1 << 1,
    FPS_DEVICE_FEATURE_VERIFY           = 1 << 2,
    FPS_DEVICE_FEATURE_STORAGE          = 1 << 3,
    FPS_DEVICE_FEATURE_STORAGE_LIST     = 1 << 4,
    FPS_DEVICE_FEATURE_STORAGE_DELETE   = 1 << 5,
    FPS_DEVICE_FEATURE_STORAGE_CLEAR    = 1 << 6,
    FPS_DEVICE_FEATURE_DUPLICATES_CHECK = 1 << 7,
    FPS_DEVICE_FEATURE_ALWAYS_ON        = 1 << 8,
    FPS_DEVICE_FEATURE_UPDATE_PRINT     = 1 << 9,
} fps_device_feature,
    FPSDeviceFeature;

/**
 * @brief Calendar date attached to a print at enrollment.
 */
typedef struct {
    uint16_t year;
    uint8_t  month;
    uint8_t  day;
} fps_date, FPSDate;

#ifdef __cplusplus
}
#endif
