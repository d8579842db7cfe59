// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once
#include "xml/XmlReader.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace libfpsdk {

/**
 * @brief SDK configuration, read from the XML file given to the context or from "./FpsSDKConfig.xml".
 *
 * Every getter returns false when the node is missing, the caller then keeps its built-in default.
 */
class EnvConfig {

    explicit EnvConfig(const std::string &configFilePath);

    static std::mutex               instanceMutex_;
    static std::weak_ptr<EnvConfig> instanceWeakPtr_;

public:
    static std::shared_ptr<EnvConfig> getInstance(const std::string &configFilePath = "");

    ~EnvConfig() noexcept = default;

    bool getIntValue(const std::string &nodePathName, int &t);
    bool getBooleanValue(const std::string &nodePathName, bool &t);
    bool getStringValue(const std::string &nodePathName, std::string &t);

    const std::string &getConfigFilePath() const;

private:
    std::string                             configFilePath_;
    std::vector<std::shared_ptr<XmlReader>> xmlReaders_;
};

}  // namespace libfpsdk
