// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "EnvConfig.hpp"
#include "utils/Utils.hpp"
#include "exception/FpsException.hpp"
#include "logger/Logger.hpp"

namespace libfpsdk {

std::mutex               EnvConfig::instanceMutex_;
std::weak_ptr<EnvConfig> EnvConfig::instanceWeakPtr_;

std::shared_ptr<EnvConfig> EnvConfig::getInstance(const std::string &configFilePath) {
    std::unique_lock<std::mutex> lock(instanceMutex_);
    auto                         instance = instanceWeakPtr_.lock();
    if(!instance) {
        instance         = std::shared_ptr<EnvConfig>(new EnvConfig(configFilePath));
        instanceWeakPtr_ = instance;
    }
    else if(!configFilePath.empty() && configFilePath != instance->configFilePath_) {
        LOG_WARN("Config file {} ignored, the configuration loaded from {} is still in use", configFilePath, instance->configFilePath_);
    }
    return instance;
}

constexpr const char *defaultConfigFile = "./FpsSDKConfig.xml";

EnvConfig::EnvConfig(const std::string &configFile) {
    auto extConfigFile = configFile;
    if(extConfigFile.empty()) {
        extConfigFile = defaultConfigFile;
    }
    if(utils::fileExists(extConfigFile.c_str())) {
        BEGIN_TRY_EXECUTE({
            auto xmlReader = std::make_shared<XmlReader>(extConfigFile);
            xmlReaders_.push_back(xmlReader);
            configFilePath_ = extConfigFile;
        })
        CATCH_EXCEPTION_AND_EXECUTE({ configFilePath_.clear(); })
    }
    else if(!configFile.empty()) {
        LOG_WARN("Config file {} not found, built-in defaults are used", configFile);
    }
}

bool EnvConfig::getIntValue(const std::string &nodePathName, int &t) {
    for(auto &xmlReader: xmlReaders_) {
        if(xmlReader->getIntValue(nodePathName, t)) {
            return true;
        }
    }
    return false;
}

bool EnvConfig::getBooleanValue(const std::string &nodePathName, bool &t) {
    for(auto &xmlReader: xmlReaders_) {
        if(xmlReader->getBooleanValue(nodePathName, t)) {
            return true;
        }
    }
    return false;
}

bool EnvConfig::getStringValue(const std::string &nodePathName, std::string &t) {
    for(auto &xmlReader: xmlReaders_) {
        if(xmlReader->getStringValue(nodePathName, t)) {
            return true;
        }
    }
    return false;
}

const std::string &EnvConfig::getConfigFilePath() const {
    return configFilePath_;
}

}  // namespace libfpsdk
