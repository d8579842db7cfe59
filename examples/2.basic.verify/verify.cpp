// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fpsdk/FpsSDK.hpp>

#include "utils.hpp"

#include <iostream>
#include <string>

// Usage: fps_verify [print file]
int main(int argc, char **argv) try {
    std::string printFile = argc > 1 ? argv[1] : "enrolled.fpprint";
    auto        enrolled  = fps_smpl::loadPrint(printFile);

    fps::Context context;
    auto         device = fps_smpl::selectFirstDevice(context);
    if(!device) {
        std::cout << "Not found device !" << std::endl;
        return -1;
    }

    device->open();
    if(!enrolled->isCompatible(*device)) {
        std::cout << "The print in " << printFile << " was not enrolled with " << device->getName() << std::endl;
        device->close();
        return -1;
    }

    std::cout << "Place your " << fps::TypeHelper::convertFingerToString(enrolled->getFinger()) << " on the sensor" << std::endl;
    auto result = device->verify(enrolled, [](std::shared_ptr<fps::Print> match, std::shared_ptr<fps::Print> scan, const fps::Error *error) {
        (void)scan;
        if(error) {
            std::cout << "Scan failed, please retry: " << error->what() << std::endl;
            return;
        }
        std::cout << "Driver reported: " << (match ? "match" : "no match") << std::endl;
    });

    std::cout << (result.matched ? "Verified" : "Not verified") << std::endl;
    device->close();
    return result.matched ? 0 : 1;
}
catch(fps::Error &e) {
    fps_smpl::printError(e);
    exit(EXIT_FAILURE);
}
catch(std::exception &e) {
    std::cerr << e.what() << std::endl;
    exit(EXIT_FAILURE);
}
