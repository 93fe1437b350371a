#define OPENSSL_SUPPRESS_DEPRECATED
#include <gtest/gtest.h>
#include "common/uuid.hpp"
#include "common/errors.hpp"
#include <openssl/rand.h>
#include <set>

TEST(UuidTest, AcceptsCanonicalForm) {
    EXPECT_TRUE(uuid::isValid("123e4567-e89b-12d3-a456-426614174000"));
    EXPECT_TRUE(uuid::isValid("123E4567-E89B-12D3-A456-426614174000"));
}

TEST(UuidTest, RejectsNilAndMalformed) {
    EXPECT_FALSE(uuid::isValid("00000000-0000-0000-0000-000000000000"));
    EXPECT_FALSE(uuid::isValid("not-a-uuid"));
    EXPECT_FALSE(uuid::isValid(""));
    EXPECT_FALSE(uuid::isValid("123e4567e89b12d3a456426614174000"));
    EXPECT_FALSE(uuid::isValid("123e4567-e89b-12d3-a456-42661417400"));
    EXPECT_FALSE(uuid::isValid("123e4567-e89b-12d3-a456-4266141740000"));
    EXPECT_FALSE(uuid::isValid("g23e4567-e89b-12d3-a456-426614174000"));
    EXPECT_FALSE(uuid::isValid(" 123e4567-e89b-12d3-a456-426614174000"));
}

TEST(UuidTest, GeneratedUuidsAreValidVersion4AndDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        std::string value = uuid::generate();
        EXPECT_TRUE(uuid::isValid(value)) << value;
        EXPECT_EQ(value[14], '4');
        EXPECT_NE(std::string("89ab").find(value[19]), std::string::npos);
        seen.insert(value);
    }
    EXPECT_EQ(seen.size(), 64u);
}

TEST(UuidTest, ResolveGeneratesOnePerDisk) {
    auto uuids = uuid::resolveDiskUUIDs(3, std::nullopt);
    ASSERT_EQ(uuids.size(), 3u);
    EXPECT_NE(uuids[0], uuids[1]);
    EXPECT_NE(uuids[1], uuids[2]);
}

TEST(UuidTest, ResolveKeepsSuppliedOrder) {
    std::vector<std::string> supplied = {
        "123e4567-e89b-12d3-a456-426614174002",
        "123e4567-e89b-12d3-a456-426614174001"
    };
    EXPECT_EQ(uuid::resolveDiskUUIDs(2, supplied), supplied);
}

TEST(UuidTest, ResolveRejectsCountMismatch) {
    std::vector<std::string> supplied = {"123e4567-e89b-12d3-a456-426614174000"};
    try {
        uuid::resolveDiskUUIDs(2, supplied);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("for this guest: 2"), std::string::npos);
    }
}

TEST(UuidTest, ResolveRejectsInvalidEntry) {
    std::vector<std::string> supplied = {"00000000-0000-0000-0000-000000000000"};
    EXPECT_THROW(uuid::resolveDiskUUIDs(1, supplied), ConfigurationError);
}

namespace {

int failingBytes(unsigned char*, int) {
    return 0;
}

int failingStatus() {
    return 0;
}

}

TEST(UuidTest, GenerateReportsBrokenRandomSource) {
    RAND_METHOD broken = {nullptr, failingBytes, nullptr, nullptr, failingBytes, failingStatus};
    const RAND_METHOD* previous = RAND_get_rand_method();
    ASSERT_EQ(RAND_set_rand_method(&broken), 1);

    EXPECT_THROW(uuid::generate(), EnvironmentError);
    EXPECT_THROW(uuid::resolveDiskUUIDs(2, std::nullopt), EnvironmentError);

    RAND_set_rand_method(previous);
    EXPECT_TRUE(uuid::isValid(uuid::generate()));
}
