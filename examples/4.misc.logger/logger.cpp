// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fpsdk/FpsSDK.hpp>

#include "utils.hpp"

#include <iostream>
#include <functional>

int main() try {
    // Configure the log level output to the terminal.
    fps::Context::setLoggerToConsole(FPS_LOG_SEVERITY_ERROR);

    // Configure the log level and path output to the file.
    fps::Context::setLoggerToFile(FPS_LOG_SEVERITY_DEBUG, "Log/Custom/");

    // Register a log callback, you can get log information in the callback.
    fps::Context::setLoggerToCallback(FPS_LOG_SEVERITY_DEBUG, [](FPSLogSeverity severity, const char *logMsg) {
        std::cout << "[CallbackMessage][Level:" << severity << "]" << logMsg;
    });

    // Create a context and open the first device, everything the SDK does is logged through the configured sinks
    fps::Context context;
    auto         device = fps_smpl::selectFirstDevice(context);
    if(device) {
        device->open();
        device->close();
    }

    fps::Context::setLoggerToCallback(FPS_LOG_SEVERITY_OFF, nullptr);
    return 0;
}
catch(fps::Error &e) {
    fps_smpl::printError(e);
    exit(EXIT_FAILURE);
}
