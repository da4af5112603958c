#include <gtest/gtest.h>

#include "core/tasks/ResultSelector.hpp"
#include "TestUtils.hpp"

namespace umedia::core::tasks {

using umedia::test::TempDir;
using umedia::test::writeFile;

TEST(result_selector, partial_suffix) {
    EXPECT_TRUE(isPartialArtifact("/d/video.mp4.part"));
    EXPECT_FALSE(isPartialArtifact("/d/video.mp4"));
    EXPECT_FALSE(isPartialArtifact("/d/part"));
}

TEST(result_selector, prefers_container_extension) {
    TempDir dir;
    auto partial = writeFile(dir / "a.part", 50000);
    auto mp4 = writeFile(dir / "b.mp4", 900);
    auto webm = writeFile(dir / "c.webm", 5000);

    auto result = selectPrimaryArtifact({partial.string(), mp4.string(), webm.string()}, "mp4");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->path, mp4);
    EXPECT_EQ(result->size, std::optional<uint64_t>(900));
}

TEST(result_selector, largest_when_no_preferred) {
    TempDir dir;
    auto small = writeFile(dir / "x.webm", 100);
    auto large = writeFile(dir / "y.webm", 9000);

    auto result = selectPrimaryArtifact({small.string(), large.string()}, "mp4");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->path, large);
    EXPECT_EQ(result->size, std::optional<uint64_t>(9000));
}

TEST(result_selector, largest_preferred_and_case_insensitive) {
    TempDir dir;
    auto first = writeFile(dir / "one.MP4", 300);
    auto second = writeFile(dir / "two.mp4", 700);
    auto other = writeFile(dir / "three.mkv", 10000);

    auto result = selectPrimaryArtifact({first.string(), second.string(), other.string()}, "MP4");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->path, second);
}

TEST(result_selector, first_wins_ties) {
    TempDir dir;
    auto first = writeFile(dir / "first.m4a", 256);
    auto second = writeFile(dir / "second.m4a", 256);

    auto result = selectPrimaryArtifact({first.string(), second.string()}, "mp3");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->path, first);
}

TEST(result_selector, nothing_left) {
    TempDir dir;
    auto partial = writeFile(dir / "only.mp4.part", 10);

    EXPECT_FALSE(selectPrimaryArtifact({}, "mp4").has_value());
    EXPECT_FALSE(selectPrimaryArtifact({partial.string()}, "mp4").has_value());
    EXPECT_FALSE(selectPrimaryArtifact({(dir / "gone.mp4").string()}, "mp4").has_value());
}

} // namespace umedia::core::tasks
