// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fpsdk/FpsSDK.hpp>

#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

// Usage: fps_identify <print file> [print file...]
int main(int argc, char **argv) try {
    if(argc < 2) {
        std::cout << "Usage: " << argv[0] << " <print file> [print file...]" << std::endl;
        return -1;
    }

    std::vector<std::shared_ptr<fps::Print>> gallery;
    std::vector<std::string>                 files;
    for(int i = 1; i < argc; i++) {
        gallery.push_back(fps_smpl::loadPrint(argv[i]));
        files.push_back(argv[i]);
    }

    fps::Context context;
    auto         device = fps_smpl::selectFirstDevice(context);
    if(!device) {
        std::cout << "Not found device !" << std::endl;
        return -1;
    }
    if(!device->hasFeature(FPS_DEVICE_FEATURE_IDENTIFY)) {
        std::cout << device->getName() << " does not support identification" << std::endl;
        return -1;
    }

    device->open();
    std::cout << "Place a finger on the sensor" << std::endl;
    auto result = device->identify(gallery);
    if(result.match) {
        for(size_t i = 0; i < gallery.size(); i++) {
            if(gallery[i] == result.match) {
                std::cout << "Identified: " << files[i] << " (" << result.match->getUsername() << ")" << std::endl;
            }
        }
    }
    else {
        std::cout << "No match in the gallery" << std::endl;
    }
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
