// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fpsdk/FpsSDK.hpp>

#include "TestUtils.hpp"

#include <iostream>
#include <memory>
#include <vector>

static bool containsPrint(const std::vector<std::shared_ptr<fps::Print>> &prints, const fps::Print &print) {
    for(const auto &stored: prints) {
        if(stored->equals(print)) {
            return true;
        }
    }
    return false;
}

int main() {
    fps::Context::setLoggerToConsole(FPS_LOG_SEVERITY_WARN);
    fps_test::VirtualDeviceSocket socket("FP_VIRTUAL_DEVICE_STORAGE");
    fps::Context                  context;
    auto                          device = fps_test::findVirtualDeviceOrSkip(context, "virtual_device_storage");

    fps_test::checkFpsError([&] {
        fps_test::check(device->hasFeature(FPS_DEVICE_FEATURE_STORAGE), "storage feature");
        fps_test::check(device->hasFeature(FPS_DEVICE_FEATURE_STORAGE_LIST), "storage list feature");
        fps_test::check(device->hasFeature(FPS_DEVICE_FEATURE_STORAGE_DELETE), "storage delete feature");
        device->open();
        fps_test::check(device->listPrints().empty(), "storage starts empty");

        auto first  = fps_test::enrollVirtualPrint(socket, device, "stored-finger-1");
        auto second = fps_test::enrollVirtualPrint(socket, device, "stored-finger-2");
        fps_test::check(first->isDeviceStored(), "enrolled print is stored on the device");
        fps_test::check(second->isDeviceStored(), "second enrolled print is stored on the device");

        auto stored = device->listPrints();
        fps_test::check(stored.size() == 2, "two prints listed");
        fps_test::check(containsPrint(stored, *first), "first print listed");
        fps_test::check(containsPrint(stored, *second), "second print listed");
        for(const auto &print: stored) {
            fps_test::check(print->isDeviceStored(), "listed prints are device stored");
            fps_test::check(print->isCompatible(*device), "listed prints belong to the device");
        }

        device->deletePrint(first);
        stored = device->listPrints();
        fps_test::check(stored.size() == 1, "one print left after delete");
        fps_test::check(containsPrint(stored, *second), "the other print survives the delete");
        fps_test::expectError(FPS_ERROR_DATA_NOT_FOUND, "deleting a print that is not stored", [&] { device->deletePrint(first); });
        fps_test::expectError(FPS_ERROR_INVALID_VALUE, "deleting without a print", [&] { device->deletePrint(nullptr); });

        if(device->hasFeature(FPS_DEVICE_FEATURE_STORAGE_CLEAR)) {
            device->clearStorage();
            fps_test::check(device->listPrints().empty(), "storage empty after clear");
        }
        else {
            fps_test::expectError(FPS_ERROR_DEVICE_NOT_SUPPORTED, "clearStorage without clear support", [&] { device->clearStorage(); });
        }

        device->close();
    });

    std::cout << "storage_test passed" << std::endl;
    return 0;
}
