// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "fpsdk/hpp/Print.hpp"
#include "fpsdk/hpp/Device.hpp"
#include "fpsdk/hpp/Image.hpp"

#include "ImplTypes.hpp"
#include "native/ErrorMapping.hpp"

namespace fps {

// a moved-from Print no longer owns a native print
static FpPrint *nativePrint(const fps_print *impl) {
    if(!impl || !impl->print) {
        throw libfpsdk::invalid_value_exception("The print has been moved from and holds no native print");
    }
    return impl->print.get();
}

Print::Print(fps_print *impl) : impl_(impl) {}

Print::Print(std::shared_ptr<Device> device) BEGIN_API_CALL {
    VALIDATE_NOT_NULL(device);
    std::unique_ptr<fps_print> impl(new fps_print());
    impl->print = device->getImpl()->device->createTemplatePrint();
    impl_       = impl.release();
}
HANDLE_EXCEPTIONS_AND_THROW(device)

Print::~Print() noexcept {
    delete impl_;
}

Print::Print(Print &&print) noexcept : impl_(print.impl_) {
    print.impl_ = nullptr;
}

Print &Print::operator=(Print &&print) noexcept {
    if(this != &print) {
        delete impl_;
        impl_       = print.impl_;
        print.impl_ = nullptr;
    }
    return *this;
}

std::shared_ptr<Print> Print::deserialize(const uint8_t *data, size_t size) BEGIN_API_CALL {
    if(!data || size == 0) {
        throw libfpsdk::invalid_data_exception("Cannot deserialize a print from empty data");
    }
    libfpsdk::native::GErrorHolder           error;
    libfpsdk::native::GObjectHandle<FpPrint> print(fp_print_deserialize(data, size, error.out()));
    if(!print) {
        libfpsdk::native::ErrorMapping::throwNativeError("fp_print_deserialize", error.get());
    }
    return createPrint(std::move(print));
}
HANDLE_EXCEPTIONS_AND_THROW(size)

std::shared_ptr<Print> Print::deserialize(const std::vector<uint8_t> &data) {
    return deserialize(data.data(), data.size());
}

std::vector<uint8_t> Print::serialize() const BEGIN_API_CALL {
    libfpsdk::native::GErrorHolder        error;
    libfpsdk::native::GFreeHandle<guchar> data;
    gsize                                 size = 0;
    if(!fp_print_serialize(nativePrint(impl_), data.out(), &size, error.out())) {
        libfpsdk::native::ErrorMapping::throwNativeError("fp_print_serialize", error.get());
    }
    return std::vector<uint8_t>(data.get(), data.get() + size);
}
HANDLE_EXCEPTIONS_AND_THROW(this)

const char *Print::getDriver() const BEGIN_API_CALL {
    auto driver = fp_print_get_driver(nativePrint(impl_));
    return driver ? driver : "";
}
HANDLE_EXCEPTIONS_AND_THROW(this)

const char *Print::getDeviceId() const BEGIN_API_CALL {
    auto id = fp_print_get_device_id(nativePrint(impl_));
    return id ? id : "";
}
HANDLE_EXCEPTIONS_AND_THROW(this)

bool Print::isDeviceStored() const BEGIN_API_CALL {
    return fp_print_get_device_stored(nativePrint(impl_));
}
HANDLE_EXCEPTIONS_AND_THROW(this)

FPSFinger Print::getFinger() const BEGIN_API_CALL {
    return static_cast<FPSFinger>(fp_print_get_finger(nativePrint(impl_)));
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Print::setFinger(FPSFinger finger) BEGIN_API_CALL {
    VALIDATE_RANGE(finger, FPS_FINGER_UNKNOWN, FPS_FINGER_RIGHT_LITTLE);
    fp_print_set_finger(nativePrint(impl_), static_cast<FpFinger>(finger));
}
HANDLE_EXCEPTIONS_AND_THROW(this, finger)

std::string Print::getUsername() const BEGIN_API_CALL {
    auto username = fp_print_get_username(nativePrint(impl_));
    return username ? username : "";
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Print::setUsername(const std::string &username) BEGIN_API_CALL {
    fp_print_set_username(nativePrint(impl_), username.c_str());
}
HANDLE_EXCEPTIONS_AND_THROW(this, username)

std::string Print::getDescription() const BEGIN_API_CALL {
    auto description = fp_print_get_description(nativePrint(impl_));
    return description ? description : "";
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Print::setDescription(const std::string &description) BEGIN_API_CALL {
    fp_print_set_description(nativePrint(impl_), description.c_str());
}
HANDLE_EXCEPTIONS_AND_THROW(this, description)

FPSDate Print::getEnrollDate() const BEGIN_API_CALL {
    FPSDate date  = { 0, 0, 0 };
    auto    gdate = fp_print_get_enroll_date(nativePrint(impl_));
    if(gdate && g_date_valid(gdate)) {
        date.year  = static_cast<uint16_t>(g_date_get_year(gdate));
        date.month = static_cast<uint8_t>(g_date_get_month(gdate));
        date.day   = static_cast<uint8_t>(g_date_get_day(gdate));
    }
    return date;
}
HANDLE_EXCEPTIONS_AND_THROW(this)

void Print::setEnrollDate(const FPSDate &date) BEGIN_API_CALL {
    if(!g_date_valid_dmy(date.day, static_cast<GDateMonth>(date.month), date.year)) {
        throw libfpsdk::invalid_value_exception(libfpsdk::utils::string::to_string()
                                                << "Invalid enroll date " << date.year << "-" << static_cast<int>(date.month) << "-" << static_cast<int>(date.day));
    }
    libfpsdk::native::GDateHandle gdate(g_date_new_dmy(date.day, static_cast<GDateMonth>(date.month), date.year));
    fp_print_set_enroll_date(nativePrint(impl_), gdate.get());
}
HANDLE_EXCEPTIONS_AND_THROW(this)

std::shared_ptr<Image> Print::getImage() const BEGIN_API_CALL {
    // transfer none, most drivers keep no image
    auto image = fp_print_get_image(nativePrint(impl_));
    if(!image) {
        return nullptr;
    }
    std::unique_ptr<fps_image> imageImpl(new fps_image());
    imageImpl->image = libfpsdk::native::GObjectHandle<FpImage>::ref(image);
    auto wrapper     = std::make_shared<Image>(imageImpl.get());
    imageImpl.release();
    return wrapper;
}
HANDLE_EXCEPTIONS_AND_THROW(this)

bool Print::isCompatible(const Device &device) const BEGIN_API_CALL {
    return fp_print_compatible(nativePrint(impl_), device.getImpl()->device->getNativeDevice());
}
HANDLE_EXCEPTIONS_AND_THROW(this)

bool Print::equals(const Print &other) const BEGIN_API_CALL {
    return fp_print_equal(nativePrint(impl_), nativePrint(other.impl_));
}
HANDLE_EXCEPTIONS_AND_THROW(this)

}  // namespace fps
