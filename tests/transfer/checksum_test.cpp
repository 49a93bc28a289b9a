#include "labsync/transfer/checksum.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

using namespace labsync;
using labsync::test_support::TempDir;

TEST(Md5File, KnownDigests) {
    TempDir dir;
    test_support::write_file(dir / "abc", "abc");
    test_support::write_file(dir / "empty", "");

    auto abc = transfer::md5_file(dir / "abc");
    ASSERT_TRUE(abc.is_ok());
    EXPECT_EQ(abc.value(), "900150983cd24fb0d6963f7d28e17f72");

    auto empty = transfer::md5_file(dir / "empty");
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(empty.value(), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(Md5File, MissingFileIsLocalIoError) {
    TempDir dir;
    auto digest = transfer::md5_file(dir / "absent");
    ASSERT_TRUE(digest.is_error());
    EXPECT_EQ(digest.error().kind, ErrorKind::LocalIo);
}

TEST(Md5File, CanceledToken) {
    TempDir dir;
    test_support::write_file(dir / "big", test_support::pattern_bytes(3 * 1024 * 1024));
    CancellationToken token;
    token.cancel();
    auto digest = transfer::md5_file(dir / "big", token);
    ASSERT_TRUE(digest.is_error());
    EXPECT_EQ(digest.error().kind, ErrorKind::Canceled);
}
