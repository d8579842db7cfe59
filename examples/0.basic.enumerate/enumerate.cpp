// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fpsdk/FpsSDK.hpp>

#include "utils.hpp"

#include <iostream>

int main(void) try {
    // Create a Context, the native registry enumerates the connected sensors.
    fps::Context context;

    // Query the list of connected devices
    auto deviceList = context.getDevices();
    if(deviceList->getCount() < 1) {
        std::cout << "Not found device !" << std::endl;
        return 0;
    }

    std::cout << "enumerated devices: " << std::endl;
    for(uint32_t index = 0; index < deviceList->getCount(); index++) {
        auto device = deviceList->getDevice(index);
        std::cout << " - " << index << ". name: " << device->getName() << " driver: " << device->getDriver() << " id: " << device->getDeviceId()
                  << std::endl;
        std::cout << "     type: " << fps::TypeHelper::convertDeviceTypeToString(device->getDeviceType())
                  << ", scan type: " << fps::TypeHelper::convertScanTypeToString(device->getScanType())
                  << ", enroll stages: " << device->getEnrollStages() << std::endl;
        std::cout << "     features: " << fps::TypeHelper::convertDeviceFeaturesToString(device->getFeatures()) << std::endl;
    }
    return 0;
}
catch(fps::Error &e) {
    fps_smpl::printError(e);
    exit(EXIT_FAILURE);
}
