// =============================================================================
// Media Selection Tests
// =============================================================================

#include <gtest/gtest.h>
#include "worker/media_selector.hpp"
#include <algorithm>

namespace {

ArchiveEntry entry(const std::string& name, bool is_dir = false) {
    ArchiveEntry e;
    e.name   = name;
    e.is_dir = is_dir;
    e.read   = [] { return std::vector<u8>(); };
    return e;
}

} // namespace

TEST(MediaSelectorTest, NativeAndTranscodableSets) {
    for (const char* ext : {"mp4", "webm", "ogg", "m4v"}) {
        EXPECT_TRUE(media_select::is_native(ext)) << ext;
        EXPECT_FALSE(media_select::is_transcodable(ext)) << ext;
    }
    for (const char* ext : {"avi", "mkv", "flv", "wmv", "mov"}) {
        EXPECT_TRUE(media_select::is_transcodable(ext)) << ext;
        EXPECT_FALSE(media_select::is_native(ext)) << ext;
    }
    EXPECT_FALSE(media_select::is_native("txt"));
    EXPECT_FALSE(media_select::is_transcodable("mpg"));
}

TEST(MediaSelectorTest, MimeTypes) {
    EXPECT_EQ(media_select::mime_for("mp4"), "video/mp4");
    EXPECT_EQ(media_select::mime_for("m4v"), "video/mp4");
    EXPECT_EQ(media_select::mime_for("webm"), "video/webm");
    EXPECT_EQ(media_select::mime_for("ogg"), "video/ogg");
}

TEST(MediaSelectorTest, MediaExtensionIsCaseInsensitive) {
    EXPECT_EQ(media_select::media_extension("Holiday/CLIP.MKV"), "mkv");
    EXPECT_EQ(media_select::media_extension("a.b.webm"), "webm");
    EXPECT_EQ(media_select::media_extension("notes.txt"), "");
    EXPECT_EQ(media_select::media_extension("mp4"), "");
}

TEST(MediaSelectorTest, SkipsMetadataDotFilesAndDirectories) {
    EXPECT_TRUE(media_select::skip_entry(entry("__MACOSX/._clip.mp4")));
    EXPECT_TRUE(media_select::skip_entry(entry(".hidden.mp4")));
    EXPECT_TRUE(media_select::skip_entry(entry("videos.mp4/", true)));
    EXPECT_FALSE(media_select::skip_entry(entry("videos/clip.mp4")));
}

TEST(MediaSelectorTest, FirstMediaKeepsArchiveOrder) {
    std::vector<ArchiveEntry> entries = {
        entry("readme.txt"),
        entry("__MACOSX/._z.mp4"),
        entry("z.avi"),
        entry("a.mp4"),
    };
    const ArchiveEntry* first = media_select::first_media(entries);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->name, "z.avi");
}

TEST(MediaSelectorTest, FirstMediaNoneFound) {
    std::vector<ArchiveEntry> entries = {entry("readme.txt"), entry("dir/", true)};
    EXPECT_EQ(media_select::first_media(entries), nullptr);
}

TEST(MediaSelectorTest, AllMediaSortedByName) {
    std::vector<ArchiveEntry> entries = {
        entry("c.webm"),
        entry("notes.txt"),
        entry("a.avi"),
        entry(".b.mp4"),
        entry("b.mp4"),
    };
    auto all = media_select::all_media(entries);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]->name, "a.avi");
    EXPECT_EQ(all[1]->name, "b.mp4");
    EXPECT_EQ(all[2]->name, "c.webm");
}

TEST(MediaSelectorTest, InputExtensionFromUrl) {
    EXPECT_EQ(media_select::input_extension("http://host/clip.MKV"), "mkv");
    EXPECT_EQ(media_select::input_extension("http://host/clip.mov?x=1"), "mov");
    EXPECT_EQ(media_select::input_extension("http://host/stream"), "avi");
}

TEST(MediaSelectorTest, InputExtensionTakesLeftmostMatch) {
    // ".mov" appears before ".mp4"
    EXPECT_EQ(media_select::input_extension("http://host/a.mov.mp4"), "mov");
    // The host name contains no hint, so the path decides
    EXPECT_EQ(media_select::input_extension("http://cdn.example/x.flv"), "flv");
}

TEST(MediaSelectorTest, TranscodeArgsTargetH264Aac) {
    auto args = media_select::transcode_args("input.avi", "output.mp4");
    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ(args[0], "-i");
    EXPECT_EQ(args[1], "input.avi");
    EXPECT_EQ(args.back(), "output.mp4");
    EXPECT_NE(std::find(args.begin(), args.end(), "libx264"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "aac"), args.end());
}
