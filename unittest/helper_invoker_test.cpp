#include <gtest/gtest.h>
#include "test_fakes.hpp"
#include "upload/helper_invoker.hpp"
#include "common/errors.hpp"
#include <fstream>
#include <sstream>

// Helpers are shell scripts here; the interpreter is /bin/sh.
class ScriptHelperInvokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        helperDir_ = makeTempDir();
        workDir_ = makeTempDir();
        tools_.interpreter = "/bin/sh";
        tools_.helperDir = helperDir_;
    }

    void TearDown() override {
        removeTree(helperDir_);
        removeTree(workDir_);
    }

    void writeHelper(Helper helper, const std::string& body) {
        writeExecutable(helperDir_ + "/" + helperScript(helper), body);
    }

    std::string readFile(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string helperDir_;
    std::string workDir_;
    ToolConfig tools_;
};

TEST_F(ScriptHelperInvokerTest, PassesParamsFileAndParsesResult) {
    writeHelper(Helper::Precheck,
                "cp \"$1\" \"$(dirname \"$1\")/seen.json\"\n"
                "echo '{\"rhv_storagedomain_uuid\": \"sd\", \"rhv_cluster_uuid\": \"c\"}'\n");

    ScriptHelperInvoker invoker(tools_, workDir_);
    HelperParams params;
    params.set("output_conn", "https://engine/api");

    HelperResult result = invoker.invoke(Helper::Precheck, params, {}, true);
    ASSERT_TRUE(result.succeeded());
    ASSERT_TRUE(result.output.has_value());
    EXPECT_EQ(requireString(*result.output, "rhv_storagedomain_uuid", "precheck"), "sd");
    EXPECT_EQ(readFile(workDir_ + "/seen.json"), R"({"output_conn":"https://engine/api"})");
}

TEST_F(ScriptHelperInvokerTest, NonZeroExitIsReturnedNotThrown) {
    writeHelper(Helper::VmCheck, "echo 'vm already exists' >&2\nexit 1\n");

    ScriptHelperInvoker invoker(tools_, workDir_);
    HelperResult result = invoker.invoke(Helper::VmCheck, HelperParams());
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exitStatus, 1);
    EXPECT_FALSE(result.output.has_value());
}

TEST_F(ScriptHelperInvokerTest, UnparsableResultIsRemoteRejection) {
    writeHelper(Helper::Transfer, "echo 'Traceback (most recent call last):'\n");

    ScriptHelperInvoker invoker(tools_, workDir_);
    EXPECT_THROW(invoker.invoke(Helper::Transfer, HelperParams(), {}, true), RemoteRejection);
}

TEST_F(ScriptHelperInvokerTest, NonObjectResultIsRemoteRejection) {
    writeHelper(Helper::Transfer, "echo '[1, 2]'\n");

    ScriptHelperInvoker invoker(tools_, workDir_);
    EXPECT_THROW(invoker.invoke(Helper::Transfer, HelperParams(), {}, true), RemoteRejection);
}

TEST_F(ScriptHelperInvokerTest, PositionalArgumentsFollowParams) {
    writeHelper(Helper::CreateVm, "[ \"$2\" = /tmp/vm.ovf ] || exit 9\nexit 0\n");

    ScriptHelperInvoker invoker(tools_, workDir_);
    EXPECT_TRUE(invoker.invoke(Helper::CreateVm, HelperParams(), {"/tmp/vm.ovf"}).succeeded());
    EXPECT_EQ(invoker.invoke(Helper::CreateVm, HelperParams(), {"/tmp/other"}).exitStatus, 9);
}

TEST_F(ScriptHelperInvokerTest, EachCallGetsItsOwnParamsFile) {
    writeHelper(Helper::Cancel, "exit 0\n");

    ScriptHelperInvoker invoker(tools_, workDir_);
    HelperParams first;
    first.set("n", 1);
    HelperParams second;
    second.set("n", 2);
    invoker.invoke(Helper::Cancel, first);
    invoker.invoke(Helper::Cancel, second);

    EXPECT_EQ(readFile(workDir_ + "/cancel-0.params.json"), R"({"n":1})");
    EXPECT_EQ(readFile(workDir_ + "/cancel-1.params.json"), R"({"n":2})");
}

TEST(HelperNamesTest, ScriptsAreNamedAfterHelpers) {
    EXPECT_EQ(helperScript(Helper::Precheck), "precheck.py");
    EXPECT_EQ(helperScript(Helper::CreateVm), "createvm.py");
    EXPECT_EQ(helperName(Helper::CreateOvf), "createovf");
}
