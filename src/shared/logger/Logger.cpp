// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "Logger.hpp"
#include "LogCallbackSink.hpp"

#include "environment/EnvConfig.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/async_logger.h>
#include <spdlog/async.h>

#include <map>

namespace libfpsdk {

const std::map<FPSLogSeverity, spdlog::level::level_enum> FPSLogSeverityToSpdlogLevel = {
#ifdef _DEBUG
    { FPS_LOG_SEVERITY_DEBUG, spdlog::level::level_enum::trace },
#else
    { FPS_LOG_SEVERITY_DEBUG, spdlog::level::level_enum::debug },
#endif
    { FPS_LOG_SEVERITY_INFO, spdlog::level::level_enum::info },   { FPS_LOG_SEVERITY_WARN, spdlog::level::level_enum::warn },
    { FPS_LOG_SEVERITY_ERROR, spdlog::level::level_enum::err },   { FPS_LOG_SEVERITY_FATAL, spdlog::level::level_enum::critical },
    { FPS_LOG_SEVERITY_OFF, spdlog::level::level_enum::off },
};

const std::map<spdlog::level::level_enum, FPSLogSeverity> SpdlogLevelToFPSLogSeverity = {
    { spdlog::level::level_enum::trace, FPS_LOG_SEVERITY_DEBUG }, { spdlog::level::level_enum::debug, FPS_LOG_SEVERITY_DEBUG },
    { spdlog::level::level_enum::info, FPS_LOG_SEVERITY_INFO },   { spdlog::level::level_enum::warn, FPS_LOG_SEVERITY_WARN },
    { spdlog::level::level_enum::err, FPS_LOG_SEVERITY_ERROR },   { spdlog::level::level_enum::critical, FPS_LOG_SEVERITY_FATAL },
    { spdlog::level::level_enum::off, FPS_LOG_SEVERITY_OFF },
};

const char *FPS_DEFAULT_LOG_FILE_PATH = "Log/";

const FPSLogSeverity FPS_DEFAULT_LOG_SEVERITY  = FPS_LOG_SEVERITY_INFO;
const std::string    FPS_DEFAULT_LOG_FMT       = "[%m/%d %H:%M:%S.%f][%l][%t][%s:%#] %v";
const uint64_t       FPS_DEFAULT_MAX_FILE_SIZE = 1024 * 1024 * 100;
const uint16_t       FPS_DEFAULT_MAX_FILE_NUM  = 3;
const std::string    FPS_DEFAULT_LOG_FILE_NAME = "FpsSDK.log.txt";

struct Logger::LoggerConfig {
    bool           loadFileLogSeverityFromEnvConfig = true;
    FPSLogSeverity fileLogSeverity                  = FPS_LOG_SEVERITY_OFF;

    bool        loadFileLogPathFromEnvConfig = true;
    std::string fileLogOutputDir             = FPS_DEFAULT_LOG_FILE_PATH;
    std::string fileLogFileName              = FPS_DEFAULT_LOG_FILE_NAME;
    uint64_t    fileLogMaxFileSize           = FPS_DEFAULT_MAX_FILE_SIZE;
    uint64_t    fileLogMaxFileNum            = FPS_DEFAULT_MAX_FILE_NUM;

    bool           loadConsoleLogSeverityFromEnvConfig = true;
    FPSLogSeverity consoleLogSeverity                  = FPS_DEFAULT_LOG_SEVERITY;

    bool           loadCallbackLogSeverityFromEnvConfig = true;
    FPSLogSeverity callbackLogSeverity                  = FPS_DEFAULT_LOG_SEVERITY;
    LogCallback    logCallback                          = nullptr;

    bool async = false;
};

Logger::LoggerConfig    Logger::config_;
std::mutex              Logger::instanceMutex_;
std::weak_ptr<Logger>   Logger::instanceWeakPtr_;
std::shared_ptr<Logger> Logger::getInstance() {
    std::lock_guard<std::mutex> lock(instanceMutex_);
    auto                        instance = instanceWeakPtr_.lock();
    if(!instance) {
        instance         = std::shared_ptr<Logger>(new Logger());
        instanceWeakPtr_ = instance;
    }
    return instance;
}

Logger::Logger() : spdlogRegistry_(spdlog::details::registry::instance_ptr()) {
    spdlog::set_pattern(FPS_DEFAULT_LOG_FMT);

    loadEnvConfig();
    createConsoleSink();
    createFileSink();
    createCallbackSink();
    updateDefaultSpdLogger();
}

Logger::~Logger() noexcept {
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("EmptySinksLogger"));

    if(consoleSink_) {
        consoleSink_->flush();
        consoleSink_.reset();
    }
    if(fileSink_) {
        fileSink_->flush();
        fileSink_.reset();
    }
    if(callbackSink_) {
        callbackSink_->flush();
        callbackSink_.reset();
    }

    if(config_.async) {
        spdlog::shutdown();
    }
    spdlogRegistry_.reset();
}

void Logger::createFileSink() {
    if(fileSink_) {
        fileSink_->flush();
        fileSink_.reset();
    }
    if(config_.fileLogSeverity != FPS_LOG_SEVERITY_OFF) {
        auto  path     = config_.fileLogOutputDir + "/" + config_.fileLogFileName;
        auto &fileSize = config_.fileLogMaxFileSize;
        auto &fileNum  = config_.fileLogMaxFileNum;
        try {
            fileSink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, fileSize, fileNum);
        }
        catch(const std::exception &e) {
            LOG_ERROR("Error creating file sink for logger! {}", e.what());
            fileSink_ = nullptr;
        }
        if(fileSink_) {
            auto fileLogLevel = FPSLogSeverityToSpdlogLevel.find(config_.fileLogSeverity)->second;
            fileSink_->set_level(fileLogLevel);
        }
    }
}

void Logger::createConsoleSink() {
    if(consoleSink_) {
        consoleSink_->flush();
        consoleSink_.reset();
    }
    if(config_.consoleLogSeverity != FPS_LOG_SEVERITY_OFF) {
        consoleSink_         = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto consoleLogLevel = FPSLogSeverityToSpdlogLevel.find(config_.consoleLogSeverity)->second;
        consoleSink_->set_level(consoleLogLevel);
    }
}

void Logger::createCallbackSink() {
    if(callbackSink_) {
        callbackSink_->flush();
        callbackSink_.reset();
    }
    if(config_.logCallback != nullptr && config_.callbackLogSeverity != FPS_LOG_SEVERITY_OFF) {
        callbackSink_ = std::make_shared<CallbackSinkMt>([](spdlog::level::level_enum logLevel, std::string msg) {
            if(config_.logCallback) {
                config_.logCallback(SpdlogLevelToFPSLogSeverity.find(logLevel)->second, msg);
            }
        });
        auto callbackLogLevel = FPSLogSeverityToSpdlogLevel.find(config_.callbackLogSeverity)->second;
        callbackSink_->set_level(callbackLogLevel);
    }
}

void Logger::updateDefaultSpdLogger() {
    std::vector<spdlog::sink_ptr> sinks;
    if(consoleSink_) {
        sinks.push_back(consoleSink_);
    }
    if(fileSink_) {
        sinks.push_back(fileSink_);
    }
    if(callbackSink_) {
        sinks.push_back(callbackSink_);
    }

    std::shared_ptr<spdlog::logger> spdLogger;
    if(config_.async) {
        spdlog::init_thread_pool(1024, 1);  // queue with 1k items and 1 threads, multiple threads will cause the log output order to be disordered

        // Asynchronous logger
        spdLogger = std::make_shared<spdlog::async_logger>("FpsSDK", sinks.begin(), sinks.end(),  //
                                                           spdlog::thread_pool(), spdlog::async_overflow_policy::block);

        spdlog::flush_every(std::chrono::seconds(1));
    }
    else {
        // Synchronize logger
        spdLogger = std::make_shared<spdlog::logger>("FpsSDK", sinks.begin(), sinks.end());
    }

    spdlog::set_default_logger(spdLogger);
    spdlog::set_level(spdlog::level::trace);  // the sinks filter by their own level
    spdlog::flush_on(spdlog::level::trace);
    spdlog::set_pattern(FPS_DEFAULT_LOG_FMT);
}

void Logger::loadEnvConfig() {
    auto envConfig       = EnvConfig::getInstance();
    int  globalLogLevel  = -1;
    int  fileLogLevel    = -1;
    int  consoleLogLevel = -1;
    if(!envConfig->getIntValue("Log.LogLevel", globalLogLevel)) {
        globalLogLevel = FPS_DEFAULT_LOG_SEVERITY;
    }
    if(!envConfig->getIntValue("Log.FileLogLevel", fileLogLevel)) {
        fileLogLevel = -1;
    }
    if(!envConfig->getIntValue("Log.ConsoleLogLevel", consoleLogLevel) && globalLogLevel >= FPS_LOG_SEVERITY_DEBUG) {
        consoleLogLevel = globalLogLevel;
    }

    if(config_.loadFileLogSeverityFromEnvConfig && fileLogLevel >= FPS_LOG_SEVERITY_DEBUG && fileLogLevel <= FPS_LOG_SEVERITY_OFF) {
        config_.fileLogSeverity = (FPSLogSeverity)fileLogLevel;
    }

    if(config_.loadConsoleLogSeverityFromEnvConfig && consoleLogLevel >= FPS_LOG_SEVERITY_DEBUG && consoleLogLevel <= FPS_LOG_SEVERITY_OFF) {
        config_.consoleLogSeverity = (FPSLogSeverity)consoleLogLevel;
    }

    std::string dir;
    envConfig->getStringValue("Log.OutputDir", dir);
    if(dir.empty()) {
        dir = FPS_DEFAULT_LOG_FILE_PATH;
    }

    std::string fileName;
    envConfig->getStringValue("Log.FileName", fileName);
    if(fileName.empty()) {
        fileName = FPS_DEFAULT_LOG_FILE_NAME;
    }

    int maxFileSize = 0;
    envConfig->getIntValue("Log.MaxFileSize", maxFileSize);
    uint64_t maxFileSizeBytes = static_cast<uint64_t>(maxFileSize) * 1024 * 1024;  // MB to Byte
    if(maxFileSizeBytes == 0) {
        maxFileSizeBytes = FPS_DEFAULT_MAX_FILE_SIZE;
    }

    int maxFileNum = 0;
    envConfig->getIntValue("Log.MaxFileNum", maxFileNum);
    if(maxFileNum <= 0) {
        maxFileNum = FPS_DEFAULT_MAX_FILE_NUM;
    }

    if(config_.loadFileLogPathFromEnvConfig) {
        config_.fileLogOutputDir   = dir;
        config_.fileLogFileName    = fileName;
        config_.fileLogMaxFileSize = maxFileSizeBytes;
        config_.fileLogMaxFileNum  = maxFileNum;
    }

    bool async = false;
    if(envConfig->getBooleanValue("Log.Async", async)) {
        config_.async = async;
    }
}

void Logger::setLogSeverity(FPSLogSeverity severity) {
    config_.loadFileLogSeverityFromEnvConfig     = false;
    config_.fileLogSeverity                      = severity;
    config_.loadConsoleLogSeverityFromEnvConfig  = false;
    config_.consoleLogSeverity                   = severity;
    config_.loadCallbackLogSeverityFromEnvConfig = false;
    config_.callbackLogSeverity                  = severity;

    std::lock_guard<std::mutex> lock(instanceMutex_);
    auto                        instance = instanceWeakPtr_.lock();
    if(instance) {
        instance->createFileSink();
        instance->createConsoleSink();
        instance->createCallbackSink();
        instance->updateDefaultSpdLogger();
    }
}

void Logger::setConsoleLogSeverity(FPSLogSeverity severity) {
    config_.loadConsoleLogSeverityFromEnvConfig = false;
    config_.consoleLogSeverity                  = severity;

    std::lock_guard<std::mutex> lock(instanceMutex_);
    auto                        instance = instanceWeakPtr_.lock();
    if(instance) {
        instance->createConsoleSink();
        instance->updateDefaultSpdLogger();
    }
}

void Logger::setFileLogConfig(FPSLogSeverity severity, const std::string &directory, uint32_t maxFileSize, uint32_t maxFileNum) {
    config_.loadFileLogSeverityFromEnvConfig = false;
    config_.fileLogSeverity                  = severity;
    config_.loadFileLogPathFromEnvConfig     = false;
    config_.fileLogOutputDir                 = directory;
    config_.fileLogMaxFileSize               = static_cast<uint64_t>(maxFileSize) * 1024 * 1024;  // MB to Byte
    config_.fileLogMaxFileNum                = maxFileNum;
    if(directory.empty()) {
        config_.fileLogOutputDir = FPS_DEFAULT_LOG_FILE_PATH;
    }
    if(maxFileSize == 0) {
        config_.fileLogMaxFileSize = FPS_DEFAULT_MAX_FILE_SIZE;
    }
    if(maxFileNum == 0) {
        config_.fileLogMaxFileNum = FPS_DEFAULT_MAX_FILE_NUM;
    }

    std::lock_guard<std::mutex> lock(instanceMutex_);
    auto                        instance = instanceWeakPtr_.lock();
    if(instance) {
        instance->createFileSink();
        instance->updateDefaultSpdLogger();
    }
}

void Logger::setLogCallback(FPSLogSeverity severity, LogCallback logCallback) {
    config_.loadCallbackLogSeverityFromEnvConfig = false;
    config_.callbackLogSeverity                  = severity;
    config_.logCallback                          = logCallback;

    std::lock_guard<std::mutex> lock(instanceMutex_);
    auto                        instance = instanceWeakPtr_.lock();
    if(instance) {
        instance->createCallbackSink();
        instance->updateDefaultSpdLogger();
    }
}

}  // namespace libfpsdk
