/**
 * @file test_source_classifier.cpp
 * @brief Unit tests for link classification
 */

#include <gtest/gtest.h>

#include <kcenon/orchestrator/core/source_classifier.h>

namespace kcenon::orchestrator::test {

class SourceClassifierTest : public ::testing::Test {
protected:
    source_classifier classifier_;
};

TEST_F(SourceClassifierTest, MagnetIsTorrent) {
    auto src = classifier_.classify("magnet:?xt=urn:btih:0123456789abcdef");
    ASSERT_TRUE(src.has_value());
    ASSERT_EQ(kind_of(src.value()), source_kind::torrent);
    EXPECT_EQ(std::get<torrent_source>(src.value()).uri, "magnet:?xt=urn:btih:0123456789abcdef");
    EXPECT_TRUE(std::get<torrent_source>(src.value()).selected_files.empty());
}

TEST_F(SourceClassifierTest, TorrentFileUrlIsTorrent) {
    auto src = classifier_.classify("https://tracker.example/files/ubuntu.TORRENT?key=1");
    ASSERT_TRUE(src.has_value());
    EXPECT_EQ(kind_of(src.value()), source_kind::torrent);

    auto local = classifier_.classify("/downloads/linux.torrent");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(kind_of(local.value()), source_kind::torrent);
}

TEST_F(SourceClassifierTest, ChatReferences) {
    auto tg = classifier_.classify("tg://file?id=abc");
    ASSERT_TRUE(tg.has_value());
    EXPECT_EQ(kind_of(tg.value()), source_kind::chat_file);

    auto chat = classifier_.classify("chat:-100200/77");
    ASSERT_TRUE(chat.has_value());
    EXPECT_EQ(std::get<chat_file_source>(chat.value()).reference, "chat:-100200/77");
}

TEST_F(SourceClassifierTest, VideoHostsIncludingSubdomains) {
    for (const char* link : {"https://www.youtube.com/watch?v=x", "https://youtu.be/x",
                             "http://m.vimeo.com/123", "https://YOUTUBE.com/shorts/1"}) {
        auto src = classifier_.classify(link);
        ASSERT_TRUE(src.has_value()) << link;
        ASSERT_EQ(kind_of(src.value()), source_kind::video_site) << link;
        EXPECT_EQ(std::get<video_site_source>(src.value()).format, "best");
    }
}

TEST_F(SourceClassifierTest, LookalikeHostIsDirectLink) {
    auto src = classifier_.classify("https://notyoutube.com/video.mp4");
    ASSERT_TRUE(src.has_value());
    EXPECT_EQ(kind_of(src.value()), source_kind::direct_link);
}

TEST_F(SourceClassifierTest, PlainLinksAreDirect) {
    auto https = classifier_.classify("  https://files.example.com/archive.zip  ");
    ASSERT_TRUE(https.has_value());
    ASSERT_EQ(kind_of(https.value()), source_kind::direct_link);
    EXPECT_EQ(std::get<direct_link_source>(https.value()).url,
              "https://files.example.com/archive.zip");

    auto ftp = classifier_.classify("ftp://mirror.example/pub/iso");
    ASSERT_TRUE(ftp.has_value());
    EXPECT_EQ(kind_of(ftp.value()), source_kind::direct_link);
}

TEST_F(SourceClassifierTest, FtpToVideoHostStaysDirect) {
    auto src = classifier_.classify("ftp://youtube.com/file");
    ASSERT_TRUE(src.has_value());
    EXPECT_EQ(kind_of(src.value()), source_kind::direct_link);
}

TEST_F(SourceClassifierTest, RejectsBadLinks) {
    auto empty = classifier_.classify("   ");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, error_code::invalid_source);
    EXPECT_EQ(empty.error().message, "empty link");

    auto scheme = classifier_.classify("file:///etc/passwd");
    ASSERT_FALSE(scheme.has_value());
    EXPECT_EQ(scheme.error().message, "unsupported link scheme: file");

    auto no_host = classifier_.classify("https:///path");
    ASSERT_FALSE(no_host.has_value());
    EXPECT_EQ(no_host.error().message, "link has no host");
}

TEST_F(SourceClassifierTest, CustomVideoHosts) {
    source_classifier custom({"Media.Example"});
    auto src = custom.classify("https://cdn.media.example/v/1");
    ASSERT_TRUE(src.has_value());
    EXPECT_EQ(kind_of(src.value()), source_kind::video_site);

    auto yt = custom.classify("https://youtube.com/watch?v=1");
    ASSERT_TRUE(yt.has_value());
    EXPECT_EQ(kind_of(yt.value()), source_kind::direct_link);

    custom.add_video_host("youtube.com");
    custom.add_video_host("YouTube.com");
    EXPECT_EQ(custom.video_hosts().size(), 2u);
    EXPECT_EQ(kind_of(custom.classify("https://youtube.com/watch?v=1").value()),
              source_kind::video_site);
}

// =============================================================================
// validate Tests
// =============================================================================

class SourceValidateTest : public ::testing::Test {};

TEST_F(SourceValidateTest, AcceptsWellFormedSources) {
    EXPECT_TRUE(source_classifier::validate(direct_link_source{"https://a.example/f", {}}));
    EXPECT_TRUE(source_classifier::validate(torrent_source{"magnet:?xt=1", {}}));
    EXPECT_TRUE(source_classifier::validate(torrent_source{"https://a.example/x.torrent", {}}));
    EXPECT_TRUE(source_classifier::validate(video_site_source{"https://vimeo.com/1"}));
    EXPECT_TRUE(source_classifier::validate(chat_file_source{"tg://file/1"}));
}

TEST_F(SourceValidateTest, RejectsMismatchedLocators) {
    auto empty = source_classifier::validate(direct_link_source{"  ", {}});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().message, "empty locator for direct_link source");

    EXPECT_FALSE(source_classifier::validate(direct_link_source{"magnet:?xt=1", {}}));
    EXPECT_FALSE(source_classifier::validate(direct_link_source{"http://", {}}));
    EXPECT_FALSE(source_classifier::validate(torrent_source{"https://a.example/x.zip", {}}));
    EXPECT_FALSE(source_classifier::validate(video_site_source{"ftp://vimeo.com/1"}));
    EXPECT_FALSE(source_classifier::validate(chat_file_source{"https://t.me/x"}));
}

}  // namespace kcenon::orchestrator::test
