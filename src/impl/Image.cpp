// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "fpsdk/hpp/Image.hpp"

#include "ImplTypes.hpp"

namespace fps {

Image::Image(fps_image *impl) : impl_(impl) {}

Image::~Image() noexcept {
    delete impl_;
}

uint32_t Image::getWidth() const BEGIN_API_CALL {
    return fp_image_get_width(impl_->image.get());
}
HANDLE_EXCEPTIONS_AND_THROW(this)

uint32_t Image::getHeight() const BEGIN_API_CALL {
    return fp_image_get_height(impl_->image.get());
}
HANDLE_EXCEPTIONS_AND_THROW(this)

double Image::getPpmm() const BEGIN_API_CALL {
    return fp_image_get_ppmm(impl_->image.get());
}
HANDLE_EXCEPTIONS_AND_THROW(this)

std::vector<uint8_t> Image::getData() const BEGIN_API_CALL {
    gsize size = 0;
    auto  data = fp_image_get_data(impl_->image.get(), &size);
    if(!data) {
        return std::vector<uint8_t>();
    }
    return std::vector<uint8_t>(data, data + size);
}
HANDLE_EXCEPTIONS_AND_THROW(this)

std::vector<uint8_t> Image::getBinarized() const BEGIN_API_CALL {
    gsize size = 0;
    auto  data = fp_image_get_binarized(impl_->image.get(), &size);
    if(!data) {
        return std::vector<uint8_t>();
    }
    return std::vector<uint8_t>(data, data + size);
}
HANDLE_EXCEPTIONS_AND_THROW(this)

}  // namespace fps
