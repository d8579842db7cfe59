// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fpsdk/FpsSDK.hpp>

#include "utils.hpp"

#include <iostream>
#include <string>

// Usage: fps_storage [list|delete <index>|clear]
int main(int argc, char **argv) try {
    std::string command = argc > 1 ? argv[1] : "list";

    fps::Context context;
    auto         device = fps_smpl::selectFirstDevice(context);
    if(!device) {
        std::cout << "Not found device !" << std::endl;
        return -1;
    }
    if(!device->hasFeature(FPS_DEVICE_FEATURE_STORAGE)) {
        std::cout << device->getName() << " has no print storage" << std::endl;
        return -1;
    }

    device->open();
    if(command == "list" || command == "delete") {
        auto prints = device->listPrints();
        std::cout << prints.size() << " print(s) stored on " << device->getName() << std::endl;
        for(size_t i = 0; i < prints.size(); i++) {
            std::cout << " - " << i << ". " << fps::TypeHelper::convertFingerToString(prints[i]->getFinger()) << " " << prints[i]->getUsername()
                      << std::endl;
        }
        if(command == "delete" && argc > 2) {
            auto index = std::stoul(argv[2]);
            if(index < prints.size()) {
                device->deletePrint(prints[index]);
                std::cout << "Print " << index << " deleted" << std::endl;
            }
        }
    }
    else if(command == "clear") {
        device->clearStorage();
        std::cout << "Storage cleared" << std::endl;
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
