#include <gtest/gtest.h>
#include <net/http_client.hpp>
#include <platform/platform.hpp>

TEST(HttpHeaderLines, NameAndValueAreTrimmed) {
    HttpHeaders h;
    apply_header_line(h, "HTTP/2 200\r\n");
    apply_header_line(h, "X-RateLimit-Remaining:   0 \r\n");
    apply_header_line(h, "Content-Type:application/json\r\n");
    apply_header_line(h, "\r\n");

    ASSERT_EQ(h.size(), 2u);
    EXPECT_EQ(h["x-ratelimit-remaining"], "0");
    EXPECT_EQ(h["Content-Type"], "application/json");
}

TEST(HttpHeaderLines, ValueMayContainColons) {
    HttpHeaders h;
    apply_header_line(h, "Location: https://objects.example/a?b=c:d\r\n");
    EXPECT_EQ(h["Location"], "https://objects.example/a?b=c:d");
}

TEST(HttpHeaderLines, RepeatedHeaderKeepsLastValue) {
    HttpHeaders h;
    apply_header_line(h, "Retry-After: 10\r\n");
    apply_header_line(h, "retry-after: 30\r\n");
    ASSERT_EQ(h.size(), 1u);
    EXPECT_EQ(h["Retry-After"], "30");
}

TEST(HttpHeaderLines, RedirectHopResetsHeaders) {
    HttpHeaders h;
    apply_header_line(h, "HTTP/1.1 302 Found\r\n");
    apply_header_line(h, "Location: https://objects.example/asset.zip\r\n");
    apply_header_line(h, "X-RateLimit-Remaining: 59\r\n");
    apply_header_line(h, "\r\n");
    apply_header_line(h, "HTTP/1.1 200 OK\r\n");
    apply_header_line(h, "Content-Length: 1024\r\n");

    EXPECT_EQ(h.count("Location"), 0u);
    EXPECT_EQ(h.count("X-RateLimit-Remaining"), 0u);
    EXPECT_EQ(h["Content-Length"], "1024");
}

TEST(HttpHeaderLines, LinesWithoutNameAreIgnored) {
    HttpHeaders h;
    apply_header_line(h, "no colon here\r\n");
    apply_header_line(h, "   : orphan value\r\n");
    EXPECT_TRUE(h.empty());
}

TEST(HttpClient, DownloadToUnwritablePathIsError) {
    HttpClient client(HttpClientOptions{});
    fs::path dest = platform::temp_file("forgeloop_missing_dir") / "asset.zip";

    auto res = client.download("https://example.invalid/asset.zip", {}, dest);
    ASSERT_TRUE(res.is_err());
    EXPECT_NE(res.error.find("for writing"), std::string::npos);
    EXPECT_FALSE(fs::exists(dest));
}
