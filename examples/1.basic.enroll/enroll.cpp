// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fpsdk/FpsSDK.hpp>

#include "utils.hpp"

#include <iostream>
#include <string>

// Usage: fps_enroll [print file] [username]
int main(int argc, char **argv) try {
    std::string printFile = argc > 1 ? argv[1] : "enrolled.fpprint";
    std::string username  = argc > 2 ? argv[2] : "";

    fps::Context context;
    auto         device = fps_smpl::selectFirstDevice(context);
    if(!device) {
        std::cout << "Not found device !" << std::endl;
        return -1;
    }

    device->open();
    std::cout << "Enrolling right index finger on " << device->getName() << ", " << device->getEnrollStages() << " scans needed" << std::endl;

    // The template carries the metadata of the new print
    auto templatePrint = std::make_shared<fps::Print>(device);
    templatePrint->setFinger(FPS_FINGER_RIGHT_INDEX);
    templatePrint->setUsername(username);

    auto totalStages = device->getEnrollStages();
    auto print       = device->enroll(templatePrint, [totalStages](uint32_t completedStages, std::shared_ptr<fps::Print> scan, const fps::Error *error) {
        (void)scan;
        if(error) {
            std::cout << "Scan failed, please retry: " << error->what() << std::endl;
            return;
        }
        std::cout << "Enroll stage " << completedStages << "/" << totalStages << " done" << std::endl;
    });

    fps_smpl::savePrint(print, printFile);
    std::cout << "Enrolled " << fps::TypeHelper::convertFingerToString(print->getFinger()) << ", print saved to " << printFile << std::endl;

    device->close();
    return 0;
}
catch(fps::Error &e) {
    fps_smpl::printError(e);
    exit(EXIT_FAILURE);
}
catch(std::exception &e) {
    std::cerr << e.what() << std::endl;
    exit(EXIT_FAILURE);
}
