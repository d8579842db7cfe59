// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fpsdk/FpsSDK.hpp>

#include "TestUtils.hpp"
#include "utils.hpp"

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

int main() {
    fps::Context::setLoggerToConsole(FPS_LOG_SEVERITY_WARN);

    // input validation does not need a device
    fps_test::expectError(FPS_ERROR_DATA_INVALID, "deserialize empty data", [] { fps::Print::deserialize(std::vector<uint8_t>()); });
    fps_test::expectError(FPS_ERROR_DATA_INVALID, "deserialize garbage", [] {
        std::vector<uint8_t> garbage = { 'n', 'o', 't', ' ', 'a', ' ', 'p', 'r', 'i', 'n', 't' };
        fps::Print::deserialize(garbage);
    });

    fps_test::VirtualDeviceSocket socket;
    fps::Context                  context;
    auto                          device = fps_test::findVirtualDeviceOrSkip(context);

    // metadata on a fresh template
    fps_test::checkFpsError([&] {
        fps::Print templatePrint(device);
        fps_test::check(templatePrint.getFinger() == FPS_FINGER_UNKNOWN, "template finger unset");
        templatePrint.setFinger(FPS_FINGER_RIGHT_THUMB);
        fps_test::check(templatePrint.getFinger() == FPS_FINGER_RIGHT_THUMB, "finger");
        templatePrint.setUsername("dana");
        fps_test::check(templatePrint.getUsername() == "dana", "username");
        templatePrint.setDescription("office door");
        fps_test::check(templatePrint.getDescription() == "office door", "description");
        FPSDate date = { 2024, 2, 29 };
        templatePrint.setEnrollDate(date);
        auto read = templatePrint.getEnrollDate();
        fps_test::check(read.year == 2024 && read.month == 2 && read.day == 29, "enroll date");
        fps_test::check(templatePrint.isCompatible(*device), "template compatible with its device");
        fps_test::check(!templatePrint.isDeviceStored(), "template not stored on the device");
        fps_test::check(templatePrint.getImage() == nullptr, "template carries no image");
    });
    fps_test::expectError(FPS_ERROR_INVALID_VALUE, "invalid enroll date", [&] {
        fps::Print templatePrint(device);
        FPSDate    date = { 2023, 2, 30 };
        templatePrint.setEnrollDate(date);
    });
    fps_test::expectError(FPS_ERROR_INVALID_VALUE, "template without device", [] {
        std::shared_ptr<fps::Device> noDevice;
        fps::Print                   templatePrint(noDevice);
    });

    // serialization round trip keeps the exact bytes
    fps_test::checkFpsError([&] {
        device->open();
        socket.sendScans("serialize-me", device->getEnrollStages());
        auto templatePrint = std::make_shared<fps::Print>(device);
        templatePrint->setFinger(FPS_FINGER_LEFT_RING);
        templatePrint->setUsername("erin");
        auto print = device->enroll(templatePrint);

        auto bytes = print->serialize();
        fps_test::check(!bytes.empty(), "serialized bytes");

        auto restored = fps::Print::deserialize(bytes);
        fps_test::check(restored->serialize() == bytes, "serialize(deserialize(bytes)) == bytes");
        fps_test::check(restored->equals(*print), "restored print equals the original");
        fps_test::check(restored->getFinger() == FPS_FINGER_LEFT_RING, "finger survives serialization");
        fps_test::check(restored->getUsername() == "erin", "username survives serialization");
        fps_test::check(std::string(restored->getDriver()) == device->getDriver(), "driver survives serialization");
        fps_test::check(restored->isCompatible(*device), "restored print compatible with the device");

        // the example helpers store and reload prints, and report failed writes
        const std::string printFile = "print_test_saved.fpp";
        fps_smpl::savePrint(print, printFile);
        fps_test::check(fps_smpl::loadPrint(printFile)->serialize() == bytes, "loadPrint(savePrint(print)) keeps the bytes");
        std::remove(printFile.c_str());

        bool writeFailed = false;
        try {
            fps_smpl::savePrint(print, "/dev/full");
        }
        catch(const std::runtime_error &) {
            writeFailed = true;
        }
        fps_test::check(writeFailed, "savePrint to a full device throws");

        // a restored print is usable for matching
        socket.sendCommand("SCAN serialize-me");
        fps_test::check(device->verify(restored).matched, "restored print verifies");

        // a moved-from print owns nothing
        fps::Print moved(std::move(*restored));
        fps_test::check(moved.getUsername() == "erin", "move keeps the native print");
        fps_test::expectError(FPS_ERROR_INVALID_VALUE, "moved-from print", [&] { restored->getUsername(); });

        device->close();
    });

    std::cout << "print_test passed" << std::endl;
    return 0;
}
