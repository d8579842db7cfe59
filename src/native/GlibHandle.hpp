// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once

#include <glib.h>
#include <glib-object.h>

#include <utility>

namespace libfpsdk {
namespace native {

/**
 * @brief Owns one reference of a GObject (FpContext, FpDevice, FpPrint, FpImage, GCancellable).
 *
 * The reference is dropped exactly once: release() hands it to the caller, reset() and the destructor unref it.
 */
template <typename T> class GObjectHandle {
public:
    GObjectHandle() : object_(nullptr) {}

    // takes over a reference the caller already owns (transfer full)
    explicit GObjectHandle(T *object) : object_(object) {}

    ~GObjectHandle() noexcept {
        reset();
    }

    GObjectHandle(GObjectHandle &&other) noexcept : object_(other.release()) {}

    GObjectHandle &operator=(GObjectHandle &&other) noexcept {
        if(this != &other) {
            reset(other.release());
        }
        return *this;
    }

    GObjectHandle(const GObjectHandle &)            = delete;
    GObjectHandle &operator=(const GObjectHandle &) = delete;

    // adds a reference to an object the caller does not own (transfer none)
    static GObjectHandle ref(T *object) {
        if(object) {
            g_object_ref(object);
        }
        return GObjectHandle(object);
    }

    // sinks the floating reference of a freshly created object
    static GObjectHandle refSink(T *object) {
        if(object) {
            g_object_ref_sink(object);
        }
        return GObjectHandle(object);
    }

    T *get() const {
        return object_;
    }

    T *release() {
        T *object = object_;
        object_   = nullptr;
        return object;
    }

    void reset(T *object = nullptr) {
        T *old  = object_;
        object_ = object;
        if(old) {
            g_object_unref(old);
        }
    }

    explicit operator bool() const {
        return object_ != nullptr;
    }

private:
    T *object_;
};

/**
 * @brief Out-parameter holder for a GError, freed on destruction.
 */
class GErrorHolder {
public:
    GErrorHolder() : error_(nullptr) {}

    ~GErrorHolder() noexcept {
        g_clear_error(&error_);
    }

    GErrorHolder(const GErrorHolder &)            = delete;
    GErrorHolder &operator=(const GErrorHolder &) = delete;

    // clears any previous error, so the holder can be passed to several native calls in a row
    GError **out() {
        g_clear_error(&error_);
        return &error_;
    }

    const GError *get() const {
        return error_;
    }

    explicit operator bool() const {
        return error_ != nullptr;
    }

private:
    GError *error_;
};

/**
 * @brief Owns a GPtrArray reference.
 */
class GPtrArrayHandle {
public:
    explicit GPtrArrayHandle(GPtrArray *array = nullptr) : array_(array) {}

    ~GPtrArrayHandle() noexcept {
        if(array_) {
            g_ptr_array_unref(array_);
        }
    }

    GPtrArrayHandle(const GPtrArrayHandle &)            = delete;
    GPtrArrayHandle &operator=(const GPtrArrayHandle &) = delete;

    GPtrArray *get() const {
        return array_;
    }

    guint size() const {
        return array_ ? array_->len : 0;
    }

    gpointer at(guint index) const {
        return g_ptr_array_index(array_, index);
    }

private:
    GPtrArray *array_;
};

/**
 * @brief Owns a buffer allocated by GLib (g_malloc) such as serialized print data or a duplicated string.
 */
template <typename T> class GFreeHandle {
public:
    GFreeHandle() : data_(nullptr) {}

    ~GFreeHandle() noexcept {
        g_free(data_);
    }

    GFreeHandle(const GFreeHandle &)            = delete;
    GFreeHandle &operator=(const GFreeHandle &) = delete;

    T **out() {
        g_free(data_);
        data_ = nullptr;
        return &data_;
    }

    T *get() const {
        return data_;
    }

private:
    T *data_;
};

/**
 * @brief Owns a GDate.
 */
class GDateHandle {
public:
    explicit GDateHandle(GDate *date = nullptr) : date_(date) {}

    ~GDateHandle() noexcept {
        if(date_) {
            g_date_free(date_);
        }
    }

    GDateHandle(const GDateHandle &)            = delete;
    GDateHandle &operator=(const GDateHandle &) = delete;

    GDate *get() const {
        return date_;
    }

private:
    GDate *date_;
};

}  // namespace native
}  // namespace libfpsdk
