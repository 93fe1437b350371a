#include <gtest/gtest.h>
#include "upload/helper_params.hpp"
#include "common/errors.hpp"

TEST(HelperParamsTest, KeepsInsertionOrder) {
    HelperParams params;
    params.set("output_conn", "https://engine/api");
    params.set("insecure", true);
    params.set("disk_size", 42);

    EXPECT_EQ(params.dump(), R"({"output_conn":"https://engine/api","insecure":true,"disk_size":42})");
}

TEST(HelperParamsTest, WithLeavesOriginalUntouched) {
    HelperParams shared;
    shared.set("output_name", "guest");

    HelperParams perDisk = shared.with("disk_uuid", "123e4567-e89b-12d3-a456-426614174000");
    EXPECT_TRUE(perDisk.contains("disk_uuid"));
    EXPECT_TRUE(perDisk.contains("output_name"));
    EXPECT_FALSE(shared.contains("disk_uuid"));
}

TEST(HelperParamsTest, StringListsBecomeArrays) {
    HelperParams params;
    params.setStringList("transfer_ids", {"a", "b"});
    params.setStringList("disk_uuids", {});

    EXPECT_EQ(params.at("transfer_ids"), HelperDocument::array({"a", "b"}));
    EXPECT_TRUE(params.at("disk_uuids").is_array());
    EXPECT_TRUE(params.at("disk_uuids").empty());
}

TEST(HelperParamsTest, RequiredResultFields) {
    HelperDocument doc = {{"transfer_id", "t-1"}, {"is_ovirt_host", false}, {"count", 3}};

    EXPECT_EQ(requireString(doc, "transfer_id", "transfer"), "t-1");
    EXPECT_FALSE(requireBool(doc, "is_ovirt_host", "transfer"));
    EXPECT_THROW(requireString(doc, "destination_url", "transfer"), RemoteRejection);
    EXPECT_THROW(requireString(doc, "count", "transfer"), RemoteRejection);
    EXPECT_THROW(requireBool(doc, "transfer_id", "transfer"), RemoteRejection);
}
