// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "page_renderer.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace cloudphoto {
namespace site {

namespace {

void writeHead(std::ostringstream& html, const std::string& title) {
  html << "<!doctype html>\n"
       << "<html>\n"
       << "  <head>\n"
       << "    <meta charset=\"utf-8\">\n"
       << "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
       << "    <title>" << escapeHtml(title) << "</title>\n"
       << "    <style>\n"
       << "      body { font-family: sans-serif; margin: 2em; }\n"
       << "      .gallery { display: flex; flex-wrap: wrap; gap: 1em; }\n"
       << "      .gallery figure { margin: 0; }\n"
       << "      .gallery img { max-width: 320px; max-height: 240px; }\n"
       << "    </style>\n"
       << "  </head>\n";
}

}  // namespace

std::string escapeHtml(const std::string& text) {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        result += "&amp;";
        break;
      case '<':
        result += "&lt;";
        break;
      case '>':
        result += "&gt;";
        break;
      case '"':
        result += "&quot;";
        break;
      case '\'':
        result += "&#39;";
        break;
      default:
        result += c;
    }
  }
  return result;
}

std::string encodeUrlSegment(const std::string& segment) {
  std::string result;
  result.reserve(segment.size());
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      result += static_cast<char>(c);
    } else {
      char buf[4];
      snprintf(buf, sizeof(buf), "%%%02X", c);
      result += buf;
    }
  }
  return result;
}

std::string photoSrc(const std::string& album, const std::string& filename) {
  return encodeUrlSegment(album) + "/" + encodeUrlSegment(filename);
}

std::string albumPageUrl(const std::string& website_url, const std::string& album) {
  std::string base = website_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/" + encodeUrlSegment(album) + ".html";
}

std::string renderAlbumPage(const std::string& title, const std::vector<PhotoRef>& photos) {
  std::ostringstream html;
  writeHead(html, title);
  html << "  <body>\n"
       << "    <h1>" << escapeHtml(title) << "</h1>\n"
       << "    <div class=\"gallery\">\n";
  for (const auto& photo : photos) {
    html << "      <figure>\n"
         << "        <img src=\"" << escapeHtml(photo.src) << "\" alt=\"" << escapeHtml(photo.name)
         << "\">\n"
         << "        <figcaption>" << escapeHtml(photo.name) << "</figcaption>\n"
         << "      </figure>\n";
  }
  html << "    </div>\n"
       << "    <p><a href=\"index.html\">Back to albums</a></p>\n"
       << "  </body>\n"
       << "</html>\n";
  return html.str();
}

std::string renderIndexPage(const std::string& title, const std::vector<AlbumLink>& albums) {
  std::ostringstream html;
  writeHead(html, title);
  html << "  <body>\n"
       << "    <h1>" << escapeHtml(title) << "</h1>\n";
  if (albums.empty()) {
    html << "    <p>No photo albums yet.</p>\n";
  }
  html << "    <ul>\n";
  for (size_t i = 0; i < albums.size(); ++i) {
    html << "      <li><a href=\"" << escapeHtml(albums[i].url) << "\">" << escapeHtml(albums[i].name)
         << "</a></li>\n";
  }
  html << "    </ul>\n"
       << "  </body>\n"
       << "</html>\n";
  return html.str();
}

std::string renderErrorPage(const std::string& title) {
  std::ostringstream html;
  writeHead(html, title);
  html << "  <body>\n"
       << "    <h1>Error</h1>\n"
       << "    <p>The page you requested does not exist.</p>\n"
       << "    <p><a href=\"index.html\">Back to albums</a></p>\n"
       << "  </body>\n"
       << "</html>\n";
  return html.str();
}

}  // namespace site
}  // namespace cloudphoto
