// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

/**
 * \file FpsSDK.hpp
 * \brief This is the main entry point for the FpsSDK C++ library.
 *        It includes all necessary header files for using the library.
 */
#pragma once

#include "fpsdk/hpp/Context.hpp"
#include "fpsdk/hpp/Device.hpp"
#include "fpsdk/hpp/Error.hpp"
#include "fpsdk/hpp/Image.hpp"
#include "fpsdk/hpp/Print.hpp"
#include "fpsdk/hpp/TypeHelper.hpp"
#include "fpsdk/hpp/Types.hpp"
