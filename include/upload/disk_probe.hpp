#pragma once

#include <cstdint>
#include <string>

class DiskProbe {
public:
    enum class Format {
        UNKNOWN,
        QCOW2,
        RAW
    };

    static Format detectFormat(const std::string& path);
    static std::string formatName(Format format);
    static bool isQCOW2(const std::string& path);

    // File size for regular files, BLKGETSIZE64 for block devices, 0 on error.
    static uint64_t getSize(const std::string& path);
};
