// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once
#include <fpsdk/FpsSDK.hpp>

#include <memory>
#include <string>

namespace fps_smpl {

// Print the failing function, its arguments, the message and the error kind of an SDK error.
void printError(const fps::Error &e);

// Return the first device reported by the context, or nullptr when there is none.
std::shared_ptr<fps::Device> selectFirstDevice(fps::Context &context);

// Store the serialized bytes of a print in a file.
void savePrint(const std::shared_ptr<fps::Print> &print, const std::string &filePath);

// Load a print previously stored with savePrint().
std::shared_ptr<fps::Print> loadPrint(const std::string &filePath);

}  // namespace fps_smpl
