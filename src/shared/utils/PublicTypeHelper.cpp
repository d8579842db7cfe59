// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "PublicTypeHelper.hpp"

#include <map>
#include <utility>

namespace libfpsdk {
namespace utils {

static const std::string unknownStr = "unknown";

const std::string &errorKindToStr(FPSErrorKind kind) {
    static const std::map<FPSErrorKind, std::string> kindToStrMap = {
        { FPS_ERROR_UNKNOWN_NATIVE, "FPS_ERROR_UNKNOWN_NATIVE" },
        { FPS_ERROR_NATIVE_INIT_FAILURE, "FPS_ERROR_NATIVE_INIT_FAILURE" },
        { FPS_ERROR_DEVICE_BUSY, "FPS_ERROR_DEVICE_BUSY" },
        { FPS_ERROR_DEVICE_NOT_SUPPORTED, "FPS_ERROR_DEVICE_NOT_SUPPORTED" },
        { FPS_ERROR_PERMISSION_DENIED, "FPS_ERROR_PERMISSION_DENIED" },
        { FPS_ERROR_OPERATION_CANCELLED, "FPS_ERROR_OPERATION_CANCELLED" },
        { FPS_ERROR_DATA_INVALID, "FPS_ERROR_DATA_INVALID" },
        { FPS_ERROR_DATA_NOT_FOUND, "FPS_ERROR_DATA_NOT_FOUND" },
        { FPS_ERROR_DATA_FULL, "FPS_ERROR_DATA_FULL" },
        { FPS_ERROR_DATA_DUPLICATE, "FPS_ERROR_DATA_DUPLICATE" },
        { FPS_ERROR_DEVICE_NOT_OPEN, "FPS_ERROR_DEVICE_NOT_OPEN" },
        { FPS_ERROR_DEVICE_ALREADY_OPEN, "FPS_ERROR_DEVICE_ALREADY_OPEN" },
        { FPS_ERROR_DEVICE_REMOVED, "FPS_ERROR_DEVICE_REMOVED" },
        { FPS_ERROR_PROTOCOL, "FPS_ERROR_PROTOCOL" },
        { FPS_ERROR_GENERAL, "FPS_ERROR_GENERAL" },
        { FPS_ERROR_IO, "FPS_ERROR_IO" },
        { FPS_ERROR_SCAN_RETRY, "FPS_ERROR_SCAN_RETRY" },
        { FPS_ERROR_INVALID_VALUE, "FPS_ERROR_INVALID_VALUE" },
        { FPS_ERROR_STD_EXCEPTION, "FPS_ERROR_STD_EXCEPTION" },
    };
    auto it = kindToStrMap.find(kind);
    if(it == kindToStrMap.end()) {
        return unknownStr;
    }
    return it->second;
}

const std::string &fingerToStr(FPSFinger finger) {
    static const std::map<FPSFinger, std::string> fingerToStrMap = {
        { FPS_FINGER_UNKNOWN, "unknown" },
        { FPS_FINGER_LEFT_THUMB, "left-thumb" },
        { FPS_FINGER_LEFT_INDEX, "left-index-finger" },
        { FPS_FINGER_LEFT_MIDDLE, "left-middle-finger" },
        { FPS_FINGER_LEFT_RING, "left-ring-finger" },
        { FPS_FINGER_LEFT_LITTLE, "left-little-finger" },
        { FPS_FINGER_RIGHT_THUMB, "right-thumb" },
        { FPS_FINGER_RIGHT_INDEX, "right-index-finger" },
        { FPS_FINGER_RIGHT_MIDDLE, "right-middle-finger" },
        { FPS_FINGER_RIGHT_RING, "right-ring-finger" },
        { FPS_FINGER_RIGHT_LITTLE, "right-little-finger" },
    };
    auto it = fingerToStrMap.find(finger);
    if(it == fingerToStrMap.end()) {
        return unknownStr;
    }
    return it->second;
}

const std::string &scanTypeToStr(FPSScanType type) {
    static const std::string swipeStr = "swipe";
    static const std::string pressStr = "press";
    switch(type) {
    case FPS_SCAN_TYPE_SWIPE:
        return swipeStr;
    case FPS_SCAN_TYPE_PRESS:
        return pressStr;
    default:
        return unknownStr;
    }
}

const std::string &deviceTypeToStr(FPSDeviceType type) {
    static const std::string virtualStr = "virtual";
    static const std::string usbStr     = "usb";
    static const std::string udevStr    = "udev";
    switch(type) {
    case FPS_DEVICE_TYPE_VIRTUAL:
        return virtualStr;
    case FPS_DEVICE_TYPE_USB:
        return usbStr;
    case FPS_DEVICE_TYPE_UDEV:
        return udevStr;
    default:
        return unknownStr;
    }
}

std::string deviceFeaturesToStr(uint32_t features) {
    static const std::pair<FPSDeviceFeature, const char *> featureNames[] = {
        { FPS_DEVICE_FEATURE_CAPTURE, "capture" },
        { FPS_DEVICE_FEATURE_IDENTIFY, "identify" },
        { FPS_DEVICE_FEATURE_VERIFY, "verify" },
        { FPS_DEVICE_FEATURE_STORAGE, "storage" },
        { FPS_DEVICE_FEATURE_STORAGE_LIST, "storage-list" },
        { FPS_DEVICE_FEATURE_STORAGE_DELETE, "storage-delete" },
        { FPS_DEVICE_FEATURE_STORAGE_CLEAR, "storage-clear" },
        { FPS_DEVICE_FEATURE_DUPLICATES_CHECK, "duplicates-check" },
        { FPS_DEVICE_FEATURE_ALWAYS_ON, "always-on" },
        { FPS_DEVICE_FEATURE_UPDATE_PRINT, "update-print" },
    };
    std::string str;
    for(auto &item: featureNames) {
        if(features & item.first) {
            if(!str.empty()) {
                str += "|";
            }
            str += item.second;
        }
    }
    if(str.empty()) {
        str = "none";
    }
    return str;
}

}  // namespace utils
}  // namespace libfpsdk

std::ostream &operator<<(std::ostream &os, const FPSErrorKind &kind) {
    os << libfpsdk::utils::errorKindToStr(kind);
    return os;
}

std::ostream &operator<<(std::ostream &os, const FPSFinger &finger) {
    os << libfpsdk::utils::fingerToStr(finger);
    return os;
}
