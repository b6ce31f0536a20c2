#pragma once

#include <string>

namespace tripseg {

class PasswordDigest {
public:
    static std::string md5Hex(const std::string& input);
    static std::string urlEncode(const std::string& value);
    
private:
    static std::string toHex(const unsigned char* data, size_t length);
};

} // namespace tripseg
