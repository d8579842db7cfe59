// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "xml/XmlReader.hpp"
#include "environment/EnvConfig.hpp"
#include "exception/FpsException.hpp"
#include "TestUtils.hpp"

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <unistd.h>

static const char *configXml = R"(<?xml version="1.0" encoding="UTF-8"?>
<FpsSDKConfig>
    <Log>
        <LogLevel>1</LogLevel>
        <ConsoleLogLevel> 3 </ConsoleLogLevel>
        <OutputDir>Log/Test/</OutputDir>
        <MaxFileSize>10</MaxFileSize>
        <Async>false</Async>
    </Log>
    <Device>
        <AutoCloseOnRelease>false</AutoCloseOnRelease>
    </Device>
</FpsSDKConfig>
)";

int main() {
    // reader over an in-memory document
    libfpsdk::XmlReader reader(configXml, strlen(configXml));
    int                 intValue = -1;
    fps_test::check(reader.getIntValue("Log.LogLevel", intValue) && intValue == 1, "Log.LogLevel");
    fps_test::check(reader.getIntValue("Log.ConsoleLogLevel", intValue) && intValue == 3, "Log.ConsoleLogLevel with surrounding spaces");
    bool boolValue = true;
    fps_test::check(reader.getBooleanValue("Device.AutoCloseOnRelease", boolValue) && !boolValue, "Device.AutoCloseOnRelease");
    std::string stringValue;
    fps_test::check(reader.getStringValue("Log.OutputDir", stringValue) && stringValue == "Log/Test/", "Log.OutputDir");
    fps_test::check(!reader.getStringValue("Device.Missing", stringValue), "missing node");
    fps_test::check(!reader.getStringValue("Log", stringValue), "node without text");
    fps_test::check(!reader.getIntValue("Log.OutputDir", intValue), "non numeric text is not an int");

    // malformed documents are rejected
    const char *broken = "<FpsSDKConfig><Log></FpsSDKConfig>";
    bool        thrown = false;
    try {
        libfpsdk::XmlReader brokenReader(broken, strlen(broken));
    }
    catch(const libfpsdk::invalid_value_exception &) {
        thrown = true;
    }
    fps_test::check(thrown, "malformed xml throws invalid_value_exception");

    // configuration loaded from a file given explicitly
    char dirTemplate[] = "/tmp/fpsdk-config-XXXXXX";
    fps_test::check(mkdtemp(dirTemplate) != nullptr, "mkdtemp");
    std::string configPath = std::string(dirTemplate) + "/FpsSDKConfig.xml";
    {
        std::ofstream file(configPath);
        file << configXml;
    }
    {
        auto envConfig = libfpsdk::EnvConfig::getInstance(configPath);
        fps_test::check(envConfig->getConfigFilePath() == configPath, "config file path");
        fps_test::check(envConfig->getIntValue("Log.MaxFileSize", intValue) && intValue == 10, "EnvConfig Log.MaxFileSize");
        fps_test::check(envConfig->getBooleanValue("Device.AutoCloseOnRelease", boolValue) && !boolValue, "EnvConfig Device.AutoCloseOnRelease");
        fps_test::check(!envConfig->getIntValue("Log.MaxFileNum", intValue), "absent key keeps the built-in default");

        // the instance is shared while it is alive
        fps_test::check(libfpsdk::EnvConfig::getInstance() == envConfig, "EnvConfig instance is shared");
    }

    // a missing file falls back to the built-in defaults
    {
        auto envConfig = libfpsdk::EnvConfig::getInstance(std::string(dirTemplate) + "/missing.xml");
        fps_test::check(envConfig->getConfigFilePath().empty(), "no config file loaded");
        fps_test::check(!envConfig->getIntValue("Log.LogLevel", intValue), "defaults without config file");
    }

    unlink(configPath.c_str());
    rmdir(dirTemplate);
    std::cout << "config_test passed" << std::endl;
    return 0;
}
