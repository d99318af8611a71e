// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "page_renderer.hpp"

using namespace cloudphoto::site;

namespace {

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
  size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

}  // namespace

TEST(EscapeHtmlTest, EscapesMarkupCharacters) {
  EXPECT_EQ(escapeHtml("Tom & Jerry"), "Tom &amp; Jerry");
  EXPECT_EQ(escapeHtml("<script>"), "&lt;script&gt;");
  EXPECT_EQ(escapeHtml("say \"cheese\""), "say &quot;cheese&quot;");
  EXPECT_EQ(escapeHtml("it's"), "it&#39;s");
  EXPECT_EQ(escapeHtml("plain"), "plain");
}

TEST(EncodeUrlTest, KeepsUnreservedCharacters) {
  EXPECT_EQ(encodeUrlSegment("sunset-01_a.b~c.jpg"), "sunset-01_a.b~c.jpg");
}

TEST(EncodeUrlTest, EncodesSpacesAndReserved) {
  EXPECT_EQ(encodeUrlSegment("summer 2024"), "summer%202024");
  EXPECT_EQ(encodeUrlSegment("a&b?c#d"), "a%26b%3Fc%23d");
}

TEST(EncodeUrlTest, EncodesUtf8Bytes) {
  EXPECT_EQ(encodeUrlSegment("\xD0\xBB\xD0\xB5\xD1\x82\xD0\xBE"), "%D0%BB%D0%B5%D1%82%D0%BE");
}

TEST(LinkTest, PhotoSrcAndAlbumPageUrl) {
  EXPECT_EQ(photoSrc("summer trip", "a b.jpg"), "summer%20trip/a%20b.jpg");
  EXPECT_EQ(
    albumPageUrl("https://photos.website.yandexcloud.net", "a"),
    "https://photos.website.yandexcloud.net/a.html"
  );
  EXPECT_EQ(
    albumPageUrl("https://photos.website.yandexcloud.net/", "b c"),
    "https://photos.website.yandexcloud.net/b%20c.html"
  );
}

TEST(AlbumPageTest, ContainsTitleAndPhotosInGivenOrder) {
  std::vector<PhotoRef> photos = {{"z.jpg", "a/z.jpg"}, {"a.jpg", "a/a.jpg"}};
  std::string html = renderAlbumPage("Vacation", photos);

  EXPECT_NE(html.find("<title>Vacation</title>"), std::string::npos);
  EXPECT_NE(html.find("<h1>Vacation</h1>"), std::string::npos);
  auto first = html.find("src=\"a/z.jpg\"");
  auto second = html.find("src=\"a/a.jpg\"");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_EQ(countOccurrences(html, "<img "), 2u);
}

TEST(AlbumPageTest, ZeroPhotosIsStillAPage) {
  std::string html = renderAlbumPage("empty", {});
  EXPECT_EQ(html.rfind("<!doctype html>", 0), 0u);
  EXPECT_NE(html.find("</html>"), std::string::npos);
  EXPECT_EQ(countOccurrences(html, "<img "), 0u);
}

TEST(AlbumPageTest, TitleIsEscaped) {
  std::string html = renderAlbumPage("<b>bold</b>", {{"x\".jpg", "a/x%22.jpg"}});
  EXPECT_EQ(html.find("<b>bold</b>"), std::string::npos);
  EXPECT_NE(html.find("&lt;b&gt;bold&lt;/b&gt;"), std::string::npos);
  EXPECT_NE(html.find("alt=\"x&quot;.jpg\""), std::string::npos);
}

TEST(AlbumPageTest, RenderingIsDeterministic) {
  std::vector<PhotoRef> photos = {{"1.jpg", "a/1.jpg"}};
  EXPECT_EQ(renderAlbumPage("a", photos), renderAlbumPage("a", photos));
}

TEST(IndexPageTest, LinksEveryAlbum) {
  std::vector<AlbumLink> albums = {
    {"a", "https://b.website.yandexcloud.net/a.html"},
    {"b", "https://b.website.yandexcloud.net/b.html"},
  };
  std::string html = renderIndexPage("Photo archive", albums);

  EXPECT_NE(html.find("href=\"https://b.website.yandexcloud.net/a.html\""), std::string::npos);
  EXPECT_NE(html.find("href=\"https://b.website.yandexcloud.net/b.html\""), std::string::npos);
  EXPECT_NE(html.find(">a</a>"), std::string::npos);
  EXPECT_EQ(countOccurrences(html, "<li>"), 2u);
}

TEST(IndexPageTest, EmptyAlbumListIsValidDocument) {
  std::string html = renderIndexPage("Photo archive", {});
  EXPECT_EQ(html.rfind("<!doctype html>", 0), 0u);
  EXPECT_NE(html.find("<ul>"), std::string::npos);
  EXPECT_NE(html.find("</ul>"), std::string::npos);
  EXPECT_EQ(countOccurrences(html, "<li>"), 0u);
  EXPECT_NE(html.find("</html>"), std::string::npos);
}

TEST(ErrorPageTest, LinksBackToIndex) {
  std::string html = renderErrorPage("Photo archive");
  EXPECT_NE(html.find("href=\"index.html\""), std::string::npos);
}
