// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "TestUtils.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace fps_test {

void check(bool condition, const std::string &what) {
    if(!condition) {
        std::cerr << "Check failed: " << what << std::endl;
        exit(-1);
    }
}

void checkErrorKind(const fps::Error &e, FPSErrorKind expected, const std::string &what) {
    if(e.getKind() != expected) {
        std::cerr << "Check failed: " << what << ", expected " << fps::TypeHelper::convertErrorKindToString(expected) << " but got "
                  << fps::TypeHelper::convertErrorKindToString(e.getKind()) << " (" << e.what() << ")" << std::endl;
        exit(-1);
    }
}

void expectError(FPSErrorKind expected, const std::string &what, const std::function<void()> &func) {
    try {
        func();
    }
    catch(const fps::Error &e) {
        checkErrorKind(e, expected, what);
        return;
    }
    std::cerr << "Check failed: " << what << ", expected " << fps::TypeHelper::convertErrorKindToString(expected) << " but nothing was thrown"
              << std::endl;
    exit(-1);
}

void checkFpsError(const std::function<void()> &func) {
    try {
        func();
    }
    catch(const fps::Error &e) {
        std::cerr << "Error: " << e.what() << "\n - function: " << e.getFunction() << "\n - args: " << e.getArgs()
                  << "\n - kind: " << fps::TypeHelper::convertErrorKindToString(e.getKind()) << std::endl;
        exit(-1);
    }
}

VirtualDeviceSocket::VirtualDeviceSocket(const std::string &envName) {
    char dirTemplate[] = "/tmp/fpsdk-test-XXXXXX";
    if(!mkdtemp(dirTemplate)) {
        throw std::runtime_error("mkdtemp failed: " + std::string(strerror(errno)));
    }
    dir_  = dirTemplate;
    path_ = dir_ + "/virtual-device.socket";
    setenv(envName.c_str(), path_.c_str(), 1);
}

VirtualDeviceSocket::~VirtualDeviceSocket() noexcept {
    unlink(path_.c_str());
    rmdir(dir_.c_str());
}

int VirtualDeviceSocket::connectToDriver() const {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if(fd < 0) {
        throw std::runtime_error("socket failed: " + std::string(strerror(errno)));
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
    if(connect(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0) {
        auto err = std::string(strerror(errno));
        close(fd);
        throw std::runtime_error("connect to " + path_ + " failed: " + err);
    }
    return fd;
}

void VirtualDeviceSocket::writeAll(int fd, const void *data, size_t size) const {
    auto   bytes = static_cast<const char *>(data);
    size_t sent  = 0;
    while(sent < size) {
        auto rc = write(fd, bytes + sent, size - sent);
        if(rc < 0) {
            throw std::runtime_error("write to " + path_ + " failed: " + std::string(strerror(errno)));
        }
        sent += static_cast<size_t>(rc);
    }
}

void VirtualDeviceSocket::sendCommand(const std::string &command) const {
    int fd = connectToDriver();
    try {
        writeAll(fd, command.data(), command.size());
    }
    catch(const std::exception &) {
        close(fd);
        throw;
    }
    close(fd);
}

void VirtualDeviceSocket::sendScans(const std::string &printId, uint32_t count) const {
    for(uint32_t i = 0; i < count; i++) {
        sendCommand("SCAN " + printId);
    }
}

const std::string &VirtualDeviceSocket::getPath() const {
    return path_;
}

VirtualImageSocket::VirtualImageSocket() : VirtualDeviceSocket("FP_VIRTUAL_IMAGE") {}

VirtualImageSocket::~VirtualImageSocket() noexcept {
    if(connection_ >= 0) {
        close(connection_);
    }
}

void VirtualImageSocket::sendImage(uint32_t width, uint32_t height, const std::vector<uint8_t> &pixels) {
    if(pixels.size() != static_cast<size_t>(width) * height) {
        throw std::invalid_argument("image data does not match its size");
    }
    if(connection_ >= 0) {
        close(connection_);
        connection_ = -1;
    }
    connection_ = connectToDriver();

    int32_t header[2] = { static_cast<int32_t>(width), static_cast<int32_t>(height) };
    writeAll(connection_, header, sizeof(header));
    writeAll(connection_, pixels.data(), pixels.size());
}

std::shared_ptr<fps::Device> findVirtualDeviceOrSkip(fps::Context &context, const std::string &driver) {
    auto deviceList = context.getDevices();
    for(uint32_t i = 0; i < deviceList->getCount(); i++) {
        auto device = deviceList->getDevice(i);
        if(std::string(device->getDriver()) == driver) {
            return device;
        }
    }
    std::cout << "libfprint " << driver << " driver not available, skipping" << std::endl;
    exit(SKIP_EXIT_CODE);
}

std::shared_ptr<fps::Print> enrollVirtualPrint(const VirtualDeviceSocket &socket, const std::shared_ptr<fps::Device> &device, const std::string &printId) {
    socket.sendScans(printId, device->getEnrollStages());
    auto templatePrint = std::make_shared<fps::Print>(device);
    templatePrint->setUsername(printId);
    return device->enroll(templatePrint);
}

}  // namespace fps_test
