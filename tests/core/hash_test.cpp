#include "edgexfer/core/hash.hpp"
#include "edgexfer/core/ids.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace edgexfer::core;

namespace {

constexpr const char* kEmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

} // namespace

TEST(Sha256Test, KnownDigests) {
    EXPECT_EQ(sha256_hex(std::string_view{}), kEmptyDigest);
    EXPECT_EQ(sha256_hex(std::string_view{"abc"}), kAbcDigest);
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    Sha256 hasher;
    hasher.update(std::string_view{"a"});
    hasher.update(std::vector<std::uint8_t>{'b'});
    hasher.update("c", 1);
    EXPECT_EQ(hasher.hex_digest(), kAbcDigest);
}

TEST(Sha256Test, HexValidation) {
    EXPECT_TRUE(is_sha256_hex(kAbcDigest));
    EXPECT_FALSE(is_sha256_hex("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    EXPECT_FALSE(is_sha256_hex("abc"));
    EXPECT_FALSE(is_sha256_hex(std::string(64, 'g')));
}

TEST(Sha256Test, HashesFileContents) {
    const auto path = fs::temp_directory_path() / ("edgexfer-hash-" + generate_uuid());
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }

    auto digest = sha256_file(path);
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), kAbcDigest);

    fs::remove(path);
}

TEST(Sha256Test, MissingFileIsIoError) {
    auto digest = sha256_file(fs::temp_directory_path() / ("edgexfer-missing-" + generate_uuid()));
    ASSERT_TRUE(digest.is_error());
    EXPECT_EQ(digest.error().kind, edgexfer::ErrorKind::Io);
}

TEST(UuidTest, GeneratesDistinctCanonicalIds) {
    const auto a = generate_uuid();
    const auto b = generate_uuid();
    EXPECT_NE(a, b);
    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[14], '4');
}
