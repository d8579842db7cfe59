// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#pragma once

#include <memory>
#include <string>

namespace tinyxml2 {
class XMLDocument;
class XMLElement;
}  // namespace tinyxml2

namespace libfpsdk {

/**
 * @brief Read-only access to an XML document by dotted node path, e.g. "Log.ConsoleLogLevel" addresses <Root><Log><ConsoleLogLevel>.
 */
class XmlReader final {

public:
    explicit XmlReader(const std::string &filePath);
    XmlReader(const char *buffer, size_t size);

    ~XmlReader() noexcept;

public:
    bool                  getIntValue(const std::string &nodePathName, int &t);
    bool                  getBooleanValue(const std::string &nodePathName, bool &t);
    bool                  getStringValue(const std::string &nodePathName, std::string &t);

private:
    bool getTextOfLeafNode(const std::string &nodePathName, std::string &t);

private:
    std::shared_ptr<tinyxml2::XMLDocument> doc_;
    tinyxml2::XMLElement                  *rootXMLElement_ = nullptr;
};
}  // namespace libfpsdk
