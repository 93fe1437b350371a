#include <gtest/gtest.h>
#include "test_fakes.hpp"
#include "upload/disk_copier.hpp"
#include "common/errors.hpp"
#include <fstream>

class DiskCopierTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = makeTempDir();
        tools_.copyTool = dir_ + "/qemu-img";
    }

    void TearDown() override { removeTree(dir_); }

    // The fake records one argument per line.
    void installCopyTool(int exitStatus) {
        writeExecutable(tools_.copyTool,
                        "#!/bin/sh\n"
                        "for a in \"$@\"; do echo \"$a\"; done > '" + dir_ + "/args'\n"
                        "exit " + std::to_string(exitStatus) + "\n");
    }

    std::vector<std::string> recordedArgs() const {
        std::ifstream in(dir_ + "/args");
        std::vector<std::string> args;
        std::string line;
        while (std::getline(in, line)) {
            args.push_back(line);
        }
        return args;
    }

    std::string dir_;
    ToolConfig tools_;
};

TEST_F(DiskCopierTest, ConvertsIntoTheExportSocket) {
    installCopyTool(0);
    QemuImgCopier copier(tools_);
    copier.copy("/images/guest.qcow2", "qcow2", "raw", "/var/tmp/run/out0");

    std::vector<std::string> expected = {
        "convert", "-n", "-f", "qcow2", "-O", "raw", "/images/guest.qcow2",
        "nbd+unix:///?socket=%2Fvar%2Ftmp%2Frun%2Fout0"
    };
    EXPECT_EQ(recordedArgs(), expected);
}

TEST_F(DiskCopierTest, FailedCopyIsProcessError) {
    installCopyTool(1);
    QemuImgCopier copier(tools_);
    EXPECT_THROW(copier.copy("/images/guest.img", "raw", "raw", dir_ + "/out0"), ProcessError);
}
