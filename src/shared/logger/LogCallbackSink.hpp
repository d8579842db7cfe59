// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

// Purpose: Defines a custom sink for spdlog that forwards every formatted log line to a callback.
#pragma once

#include <spdlog/sinks/base_sink.h>

#include <mutex>
#include <functional>
#include <string>

namespace libfpsdk {
typedef std::function<void(spdlog::level::level_enum logLevel, std::string msg)> SinkCallback;

template <typename Mutex> class CallbackSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit CallbackSink(SinkCallback callback) : callback_(callback) {}
    CallbackSink(const CallbackSink &)            = delete;
    CallbackSink &operator=(const CallbackSink &) = delete;

protected:
    void sink_it_(const spdlog::details::log_msg &msg) override {
        if(callback_) {
            spdlog::memory_buf_t formatted;
            spdlog::sinks::base_sink<Mutex>::formatter_->format(msg, formatted);
            callback_(msg.level, std::string(formatted.data(), formatted.size()));
        }
    }
    void flush_() override {}

private:
    SinkCallback callback_;
};

using CallbackSinkMt = CallbackSink<std::mutex>;

}  // namespace libfpsdk
