// Copyright (c) FpsSDK Contributors. All Rights Reserved.
// Licensed under the MIT License.

#include "StringUtils.hpp"
#include <cstdlib>

namespace libfpsdk {
namespace utils {
namespace string {

std::vector<std::string> split(const std::string &s, const std::string &separator) {
    std::vector<std::string> res;
    if(s.empty()) {
        return res;
    }
    size_t start = 0;
    while(start <= s.size()) {
        auto pos = s.find_first_of(separator, start);
        if(pos == std::string::npos) {
            pos = s.size();
        }
        if(pos > start) {
            res.push_back(s.substr(start, pos - start));
        }
        start = pos + 1;
    }
    return res;
}

static std::string toLower(const std::string &s) {
    std::string outStr = s;
    for(auto &c: outStr) {
        if(c >= 'A' && c <= 'Z') {
            c = c - 'A' + 'a';
        }
    }
    return outStr;
}

std::string clearHeadAndTailSpace(const std::string &str) {
    std::string temp = str;
    if(temp.empty()) {
        return temp;
    }
    const char *spaces = " \t\r\n";
    temp.erase(0, temp.find_first_not_of(spaces));
    auto last = temp.find_last_not_of(spaces);
    if(last == std::string::npos) {
        return "";
    }
    temp.erase(last + 1);
    return temp;
}

bool cvt2Boolean(const std::string &string, bool &dst) {
    std::string tempStr = toLower(clearHeadAndTailSpace(string));
    if(tempStr.empty()) {
        return false;
    }
    if(tempStr == "true") {
        dst = true;
        return true;
    }
    if(tempStr == "false") {
        dst = false;
        return true;
    }
    if(tempStr.size() == 1 && (tempStr[0] == '0' || tempStr[0] == '1')) {
        dst = tempStr[0] == '1';
        return true;
    }
    return false;
}

bool cvt2Int(const std::string &string, int &dst) {
    std::string temp = clearHeadAndTailSpace(string);
    if(!temp.empty()) {
        if(temp.size() == 1) {
            if(*temp.c_str() >= '0' && *temp.c_str() <= '9') {
                dst = std::atoi(temp.c_str());
                return true;
            }
            else {
                return false;
            }
        }
        else {
            int value = std::atoi(temp.c_str());
            if(std::to_string(value).size() != temp.size()) {
                return false;
            }
            dst = value;
            return true;
        }
    }
    return false;
}

}  // namespace string
}  // namespace utils
}  // namespace libfpsdk
