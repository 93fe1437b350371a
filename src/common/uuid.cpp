#include "common/uuid.hpp"
#include "common/errors.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <regex>
#include <sstream>
#include <iomanip>

namespace uuid {

namespace {
const std::string kNilUUID = "00000000-0000-0000-0000-000000000000";
}

bool isValid(const std::string& value) {
    static const std::regex pattern(
        "^[a-fA-F0-9]{8}-[a-fA-F0-9]{4}-[a-fA-F0-9]{4}-[a-fA-F0-9]{4}-[a-fA-F0-9]{12}$");
    if (value == kNilUUID) {
        return false;
    }
    return std::regex_match(value, pattern);
}

std::string generate() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw EnvironmentError("random number generator unavailable, cannot generate a UUID: " +
                                 std::string(ERR_error_string(ERR_get_error(), nullptr)));
    }

    // Version 4, RFC 4122 variant.
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

std::vector<std::string> resolveDiskUUIDs(size_t diskCount,
                                          const std::optional<std::vector<std::string>>& supplied) {
    if (supplied) {
        if (supplied->size() != diskCount) {
            throw ConfigurationError(
                "the number of '-oo rhv-disk-uuid' parameters passed on the command line has to "
                "match the number of guest disk images (for this guest: " +
                std::to_string(diskCount) + ")");
        }
        for (const auto& value : *supplied) {
            if (!isValid(value)) {
                throw ConfigurationError("invalid UUID for -oo rhv-disk-uuid: " + value);
            }
        }
        return *supplied;
    }

    std::vector<std::string> uuids;
    uuids.reserve(diskCount);
    for (size_t i = 0; i < diskCount; ++i) {
        uuids.push_back(generate());
    }
    return uuids;
}

} // namespace uuid
