#pragma once

#include <string>
#include <stdexcept>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>

namespace chathub {

class IdGenerator {
public:
    // Random version-4 UUID in canonical 8-4-4-4-12 form.
    static std::string generate_id() {
        unsigned char buffer[16];
        if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
            throw std::runtime_error("CSPRNG failure while generating connection id");
        }

        buffer[6] = static_cast<unsigned char>((buffer[6] & 0x0F) | 0x40);
        buffer[8] = static_cast<unsigned char>((buffer[8] & 0x3F) | 0x80);

        std::stringstream ss;
        for (int i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)buffer[i];
        }
        return ss.str();
    }

    static std::string default_name(const std::string& id) {
        return "guest-" + id.substr(0, 6);
    }
};

}
