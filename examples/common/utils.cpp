// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "utils.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace fps_smpl {

void printError(const fps::Error &e) {
    std::cerr << "function:" << e.getFunction() << "\nargs:" << e.getArgs() << "\nmessage:" << e.what()
              << "\nkind:" << fps::TypeHelper::convertErrorKindToString(e.getKind()) << std::endl;
    if(e.isNative()) {
        std::cerr << "native error:" << e.getNativeDomain() << "/" << e.getNativeCode() << std::endl;
    }
}

std::shared_ptr<fps::Device> selectFirstDevice(fps::Context &context) {
    auto deviceList = context.getDevices();
    if(deviceList->getCount() < 1) {
        return nullptr;
    }
    return deviceList->getDevice(0);
}

void savePrint(const std::shared_ptr<fps::Print> &print, const std::string &filePath) {
    auto          data = print->serialize();
    std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
    if(!file) {
        throw std::runtime_error("Failed to open " + filePath + " for writing");
    }
    file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if(!file.good()) {
        throw std::runtime_error("Failed to write " + std::to_string(data.size()) + " bytes to " + filePath);
    }
}

std::shared_ptr<fps::Print> loadPrint(const std::string &filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if(!file) {
        throw std::runtime_error("Failed to open " + filePath);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return fps::Print::deserialize(data);
}

}  // namespace fps_smpl
