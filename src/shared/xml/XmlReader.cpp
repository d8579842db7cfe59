// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "XmlReader.hpp"

#include <tinyxml2.h>

#include "logger/Logger.hpp"
#include "exception/FpsException.hpp"
#include "utils/Utils.hpp"

namespace libfpsdk {
XmlReader::XmlReader(const std::string &filePath) {
    doc_ = std::make_shared<tinyxml2::XMLDocument>();
    if(filePath.empty()) {
        throw invalid_value_exception("XmlReader::XmlReader: filePath is empty!");
    }

    if(!utils::fileExists(filePath.c_str())) {
        throw invalid_value_exception("XmlReader::XmlReader: file not exist! path=" + filePath);
    }

    auto rc = doc_->LoadFile(filePath.c_str());
    if(rc != tinyxml2::XML_SUCCESS) {
        throw invalid_value_exception(utils::string::to_string() << "XmlReader::XmlReader: load file failed!, rc=" << rc << ", path=" << filePath);
    }

    rootXMLElement_ = doc_->RootElement();
    if(!rootXMLElement_) {
        throw invalid_value_exception("XmlReader::XmlReader: root element is null!");
    }
}

XmlReader::XmlReader(const char *buffer, size_t size) {
    doc_ = std::make_shared<tinyxml2::XMLDocument>();

    if(!buffer || size == 0) {
        throw invalid_value_exception("XmlReader::XmlReader: buffer is null or size is 0!");
    }

    auto rc = doc_->Parse(buffer, size);
    if(rc != tinyxml2::XML_SUCCESS) {
        throw invalid_value_exception(utils::string::to_string() << "XmlReader::XmlReader: parse buffer failed!, rc=" << rc);
    }

    rootXMLElement_ = doc_->RootElement();
    if(!rootXMLElement_) {
        throw invalid_value_exception("XmlReader::XmlReader: root element is null!");
    }
}

XmlReader::~XmlReader() noexcept = default;

bool XmlReader::getTextOfLeafNode(const std::string &nodePathName, std::string &text) {
    if(nodePathName.empty()) {
        return false;
    }
    auto nodeList = utils::string::split(nodePathName, ".");
    if(nodeList.empty()) {
        return false;
    }

    tinyxml2::XMLElement *currentElement = rootXMLElement_;
    for(const auto &nodeName: nodeList) {
        currentElement = currentElement->FirstChildElement(nodeName.c_str());
        if(!currentElement) {
            return false;
        }
    }

    if(!currentElement->FirstChild() || !currentElement->FirstChild()->ToText()) {
        return false;
    }
    text = currentElement->GetText();
    return true;
}

bool XmlReader::getBooleanValue(const std::string &nodePathName, bool &t) {
    std::string text;
    if(!getTextOfLeafNode(nodePathName, text)) {
        return false;
    }
    return utils::string::cvt2Boolean(text, t);
}

bool XmlReader::getIntValue(const std::string &nodePathName, int &t) {
    std::string text;
    if(!getTextOfLeafNode(nodePathName, text)) {
        return false;
    }
    return utils::string::cvt2Int(text, t);
}

bool XmlReader::getStringValue(const std::string &nodePathName, std::string &t) {
    std::string text;
    if(!getTextOfLeafNode(nodePathName, text)) {
        return false;
    }
    text = utils::string::clearHeadAndTailSpace(text);
    if(text.empty()) {
        return false;
    }
    t = text;
    return true;
}

}  // namespace libfpsdk
