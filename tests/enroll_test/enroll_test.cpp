// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include <fpsdk/FpsSDK.hpp>

#include <fprint.h>

#include "TestUtils.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

struct ProgressEvent {
    uint32_t     completedStages;
    bool         hasError;
    FPSErrorKind errorKind;
};

// stages reported without error must count up one by one, each exactly once
static void checkStageOrder(const std::vector<ProgressEvent> &events, uint32_t stages) {
    uint32_t expected = 1;
    for(auto &event: events) {
        if(event.hasError) {
            continue;
        }
        fps_test::check(event.completedStages == expected, "stage " + std::to_string(expected) + " reported in order");
        expected++;
    }
    fps_test::check(expected == stages + 1, "every stage reported");
}

int main() {
    fps::Context::setLoggerToConsole(FPS_LOG_SEVERITY_WARN);
    fps_test::VirtualDeviceSocket socket;
    fps::Context                  context;
    auto                          device = fps_test::findVirtualDeviceOrSkip(context);
    fps_test::checkFpsError([&] { device->open(); });
    auto stages = device->getEnrollStages();

    // plain enrollment, one progress event per stage and one final print
    {
        std::vector<ProgressEvent> events;
        socket.sendScans("enroll-plain", stages);
        std::shared_ptr<fps::Print> print;
        fps_test::checkFpsError([&] {
            auto templatePrint = std::make_shared<fps::Print>(device);
            templatePrint->setFinger(FPS_FINGER_LEFT_INDEX);
            templatePrint->setUsername("plain");
            print = device->enroll(templatePrint, [&events](uint32_t completedStages, std::shared_ptr<fps::Print> scan, const fps::Error *error) {
                (void)scan;
                events.push_back({ completedStages, error != nullptr, error ? error->getKind() : FPS_ERROR_UNKNOWN_NATIVE });
            });
        });
        fps_test::check(print != nullptr, "enrolled print returned");
        fps_test::check(events.size() == stages, "one progress event per stage");
        checkStageOrder(events, stages);
        fps_test::check(print->getFinger() == FPS_FINGER_LEFT_INDEX, "finger kept from the template");
        fps_test::check(print->getUsername() == "plain", "username kept from the template");
        fps_test::check(std::string(print->getDriver()) == "virtual_device", "print driver");
    }

    // a retry request is reported through the callback and does not end the enrollment
    {
        std::vector<ProgressEvent> events;
        socket.sendCommand("SCAN enroll-retry");
        socket.sendCommand("RETRY " + std::to_string(FP_DEVICE_RETRY_TOO_SHORT));
        socket.sendScans("enroll-retry", stages - 1);
        std::shared_ptr<fps::Print> print;
        fps_test::checkFpsError([&] {
            print = device->enroll([&events](uint32_t completedStages, std::shared_ptr<fps::Print> scan, const fps::Error *error) {
                (void)scan;
                events.push_back({ completedStages, error != nullptr, error ? error->getKind() : FPS_ERROR_UNKNOWN_NATIVE });
            });
        });
        fps_test::check(print != nullptr, "enrolled print after retry");
        fps_test::check(events.size() == stages + 1, "retry reported as an extra progress event");
        fps_test::check(events[1].hasError && events[1].errorKind == FPS_ERROR_SCAN_RETRY, "retry event carries FPS_ERROR_SCAN_RETRY");
        fps_test::check(events[1].completedStages == 1, "retry does not advance the stage count");
        checkStageOrder(events, stages);
    }

    // a driver error ends the enrollment with the mapped kind and keeps the native code
    {
        socket.sendCommand("ERROR " + std::to_string(FP_DEVICE_ERROR_PROTO));
        bool thrown = false;
        try {
            device->enroll(nullptr, nullptr);
        }
        catch(const fps::Error &e) {
            thrown = true;
            fps_test::checkErrorKind(e, FPS_ERROR_PROTOCOL, "driver error");
            fps_test::check(e.isNative() && e.getNativeCode() == FP_DEVICE_ERROR_PROTO, "native code preserved");
        }
        fps_test::check(thrown, "driver error thrown");
    }

    // cancelling from the callback
    {
        socket.sendCommand("SCAN enroll-cancel");
        fps_test::expectError(FPS_ERROR_OPERATION_CANCELLED, "cancel from progress callback", [&] {
            device->enroll([&device](uint32_t completedStages, std::shared_ptr<fps::Print>, const fps::Error *) {
                if(completedStages == 1) {
                    device->cancel();
                }
            });
        });
    }

    // other operations are rejected while the enrollment is in flight
    {
        socket.sendScans("enroll-busy", stages);
        std::vector<FPSErrorKind> nestedErrors;
        auto                      other = std::make_shared<fps::Print>(device);
        fps_test::checkFpsError([&] {
            device->enroll([&](uint32_t completedStages, std::shared_ptr<fps::Print>, const fps::Error *) {
                if(completedStages != 1) {
                    return;
                }
                try {
                    device->verify(other);
                }
                catch(const fps::Error &e) {
                    nestedErrors.push_back(e.getKind());
                }
                try {
                    device->close();
                }
                catch(const fps::Error &e) {
                    nestedErrors.push_back(e.getKind());
                }
            });
        });
        fps_test::check(nestedErrors.size() == 2, "nested calls rejected");
        fps_test::check(nestedErrors[0] == FPS_ERROR_DEVICE_BUSY && nestedErrors[1] == FPS_ERROR_DEVICE_BUSY, "nested calls fail with FPS_ERROR_DEVICE_BUSY");
        fps_test::check(device->isOpen(), "device still open after the rejected close");
    }

    // an exception escaping the callback cancels the enrollment and reaches the caller
    {
        socket.sendCommand("SCAN enroll-throw");
        bool thrown = false;
        try {
            device->enroll([](uint32_t, std::shared_ptr<fps::Print>, const fps::Error *) { throw std::runtime_error("callback failure"); });
        }
        catch(const fps::Error &e) {
            thrown = true;
            fps_test::checkErrorKind(e, FPS_ERROR_STD_EXCEPTION, "callback exception");
            fps_test::check(std::string(e.what()) == "callback failure", "callback exception message");
        }
        fps_test::check(thrown, "callback exception rethrown");
    }

    // the device is usable again after all of the above
    fps_test::checkFpsError([&] {
        auto print = fps_test::enrollVirtualPrint(socket, device, "enroll-final");
        fps_test::check(print != nullptr, "enrollment after failures");
        device->close();
    });

    std::cout << "enroll_test passed" << std::endl;
    return 0;
}
