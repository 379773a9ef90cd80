#include <gtest/gtest.h>
#include "request_router.hpp"
#include "errors.hpp"
#include "format.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

TEST(RouteTest, ClassifiesByMethodAndSuffix) {
    ASSERT_EQ(RequestRouter::classify("POST", "/__upload"), Route::Upload);
    ASSERT_EQ(RequestRouter::classify("POST", "/photos/__upload"), Route::Upload);
    ASSERT_EQ(RequestRouter::classify("POST", "/__download"), Route::Download);
    ASSERT_EQ(RequestRouter::classify("POST", "/a/b/__download"), Route::Download);
    ASSERT_EQ(RequestRouter::classify("GET", "/photos/__upload"), Route::Static);
    ASSERT_EQ(RequestRouter::classify("HEAD", "/"), Route::Static);
    ASSERT_EQ(RequestRouter::classify("OPTIONS", "/"), Route::Preflight);
    ASSERT_EQ(RequestRouter::classify("POST", "/photos"), Route::Unsupported);
    ASSERT_EQ(RequestRouter::classify("DELETE", "/a.txt"), Route::Unsupported);
    ASSERT_EQ(RequestRouter::classify("PUT", "/__upload"), Route::Unsupported);
}

TEST(RequestPathTest, DropsQueryAndFragment) {
    ASSERT_EQ(RequestRouter::requestPath("/docs/a%20b.txt?x=1"), "/docs/a%20b.txt");
    ASSERT_EQ(RequestRouter::requestPath("/docs/#top"), "/docs/");
    ASSERT_EQ(RequestRouter::requestPath("/plain"), "/plain");
    ASSERT_EQ(RequestRouter::requestPath("?only=query"), "/");
}

TEST(ReadBodyTest, ReadsEverythingUnderLimit) {
    std::string payload(20000, 'x');
    std::istringstream in(payload);
    ASSERT_EQ(RequestRouter::readBody(in, payload.size(), "too big"), payload);
}

TEST(ReadBodyTest, ThrowsOnceLimitIsExceeded) {
    std::istringstream in(std::string(20001, 'x'));
    try {
        RequestRouter::readBody(in, 20000, "500MB max");
        FAIL() << "expected PayloadTooLargeException";
    } catch (const PayloadTooLargeException& e) {
        ASSERT_EQ(e.message(), "500MB max");
        ASSERT_EQ(statusFor(e), HTTPResponse::HTTP_REQUEST_ENTITY_TOO_LARGE);
    }
}

TEST(StatusForTest, MapsEveryErrorKind) {
    ASSERT_EQ(statusFor(PathEscapeException("x")), HTTPResponse::HTTP_FORBIDDEN);
    ASSERT_EQ(statusFor(ResourceNotFoundException("x")), HTTPResponse::HTTP_NOT_FOUND);
    ASSERT_EQ(statusFor(BadRequestException("x")), HTTPResponse::HTTP_BAD_REQUEST);
    ASSERT_EQ(statusFor(UnauthorizedException("x")), HTTPResponse::HTTP_UNAUTHORIZED);
    ASSERT_EQ(statusFor(InternalFailureException("x")), HTTPResponse::HTTP_INTERNAL_SERVER_ERROR);
}

TEST(FormatTest, SizesAndSegments) {
    ASSERT_EQ(formatSize(512), "512 B");
    ASSERT_EQ(formatSize(1536), "1.5 KB");
    ASSERT_EQ(formatSize(12ull * 1024 * 1024), "12.0 MB");
    ASSERT_EQ(formatSpeed(2048, 1000), "2.0 KB/s");
    ASSERT_EQ(encodePathSegment("a b/c#1"), "a%20b%2Fc%231");
}

class ListingPayloadTest : public ::testing::Test {
protected:
    fs::path root = fs::temp_directory_path() / "leak_test_listing_payload";

    void SetUp() override {
        fs::remove_all(root);
        fs::create_directories(root / "docs" / "sub dir");
        std::ofstream(root / "docs" / "report 1.txt") << "12345";
        std::ofstream(root / "docs" / "b.bin") << "123";
        std::ofstream(root / "docs" / ".hidden") << "no";
    }

    void TearDown() override {
        fs::remove_all(root);
    }
};

TEST_F(ListingPayloadTest, DescribesDirectory) {
    auto config = std::make_shared<const ServerConfig>(PathResolver(root), std::nullopt);
    RequestRouter router(config);

    json payload = router.listingPayload(config->resolver.resolve("/docs/"), "/docs/");
    ASSERT_EQ(payload[JsonKeys::PATH], "/docs");
    ASSERT_EQ(payload[JsonKeys::PARENT], "/");
    ASSERT_EQ(payload[JsonKeys::UPLOAD_TARGET], "/docs/__upload");
    ASSERT_EQ(payload[JsonKeys::DOWNLOAD_TARGET], "/docs/__download");
    ASSERT_EQ(payload[JsonKeys::FOLDERS], 1);
    ASSERT_EQ(payload[JsonKeys::FILES], 2);
    ASSERT_EQ(payload[JsonKeys::TOTAL_SIZE], 8);

    const json& entries = payload[JsonKeys::ENTRIES];
    ASSERT_EQ(entries.size(), 3u);
    ASSERT_EQ(entries[0][JsonKeys::NAME], "sub dir");
    ASSERT_EQ(entries[0][JsonKeys::HREF], "/docs/sub%20dir/");
    ASSERT_TRUE(entries[0][JsonKeys::IS_DIRECTORY].get<bool>());
    ASSERT_EQ(entries[1][JsonKeys::NAME], "b.bin");
    ASSERT_EQ(entries[2][JsonKeys::NAME], "report 1.txt");
    ASSERT_EQ(entries[2][JsonKeys::HREF], "/docs/report%201.txt");
    ASSERT_EQ(entries[2][JsonKeys::SIZE], 5);
}

TEST_F(ListingPayloadTest, RootHasNoParent) {
    auto config = std::make_shared<const ServerConfig>(PathResolver(root), std::nullopt);
    RequestRouter router(config);

    json payload = router.listingPayload(config->resolver.root(), "/");
    ASSERT_EQ(payload[JsonKeys::PATH], "/");
    ASSERT_FALSE(payload.contains(JsonKeys::PARENT));
    ASSERT_EQ(payload[JsonKeys::UPLOAD_TARGET], "/__upload");
}

TEST_F(ListingPayloadTest, NestedParent) {
    auto config = std::make_shared<const ServerConfig>(PathResolver(root), std::nullopt);
    RequestRouter router(config);

    json payload = router.listingPayload(config->resolver.resolve("/docs/sub%20dir"), "/docs/sub%20dir");
    ASSERT_EQ(payload[JsonKeys::PARENT], "/docs");
    ASSERT_EQ(payload[JsonKeys::UPLOAD_TARGET], "/docs/sub%20dir/__upload");
    ASSERT_TRUE(payload[JsonKeys::ENTRIES].empty());
}


int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
