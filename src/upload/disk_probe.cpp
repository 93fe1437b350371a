#include "upload/disk_probe.hpp"
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

DiskProbe::Format DiskProbe::detectFormat(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Format::UNKNOWN;
    }
    return isQCOW2(path) ? Format::QCOW2 : Format::RAW;
}

std::string DiskProbe::formatName(Format format) {
    switch (format) {
        case Format::QCOW2: return "qcow2";
        case Format::RAW:   return "raw";
        default:            return "unknown";
    }
}

bool DiskProbe::isQCOW2(const std::string& path) {
    // QCOW2 magic number: QFI\xfb
    const char* qcow2_magic = "QFI\xfb";
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    char magic[4];
    file.read(magic, 4);
    return file.gcount() == 4 && memcmp(magic, qcow2_magic, 4) == 0;
}

uint64_t DiskProbe::getSize(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return 0;
    }
    if (S_ISREG(st.st_mode)) {
        return static_cast<uint64_t>(st.st_size);
    }
    if (!S_ISBLK(st.st_mode)) {
        return 0;
    }

    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return 0;
    }

    uint64_t size = 0;
    if (ioctl(fd, BLKGETSIZE64, &size) == -1) {
        close(fd);
        return 0;
    }

    close(fd);
    return size;
}
