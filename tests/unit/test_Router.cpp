#include "protocols/http/Router.hpp"
#include "Fakes.hpp"
#include "TempTree.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace bk::protocols::http;
using namespace bk::test;
using json = nlohmann::json;

class RouterTest : public ::testing::Test {
protected:
    TempTree ui;
    std::shared_ptr<FakeBucketService> bucket = std::make_shared<FakeBucketService>();
    std::unique_ptr<Router> router;

    void SetUp() override {
        ui.write("index.html", "<html>bucketeer</html>");
        ui.write("app.js", "console.log(1);");
        router = std::make_unique<Router>(bucket, ui.root());
    }

    static request make(const verb method, const std::string& target, const std::string& body = {}) {
        request req{method, target, 11};
        if (!body.empty()) {
            req.set(field::content_type, "application/json");
            req.body() = body;
            req.prepare_payload();
        }
        return req;
    }

    string_response call(const verb method, const std::string& target, const std::string& body = {}) const {
        auto res = router->route(make(method, target, body));
        return std::get<string_response>(std::move(res));
    }

    static json bodyOf(const string_response& res) { return json::parse(res.body()); }
};

TEST_F(RouterTest, test_HealthReportsOk) {
    const auto res = call(verb::get, "/api/health");
    EXPECT_EQ(res.result(), status::ok);
    EXPECT_EQ(bodyOf(res), json({{"ok", true}}));
    EXPECT_EQ(res[field::content_type], "application/json");
    EXPECT_EQ(res[field::access_control_allow_origin], "*");
}

TEST_F(RouterTest, test_ListFilesPassesDecodedPrefix) {
    bucket->objects = {
        {"photos/a.jpg", 10, "2024-01-01T00:00:00.000Z"},
        {"docs/b.txt", 3, "2024-01-02T00:00:00.000Z"},
    };

    const auto res = call(verb::get, "/api/files?prefix=photos%2F");
    ASSERT_EQ(res.result(), status::ok);
    EXPECT_EQ(bucket->lastPrefix, "photos/");

    const auto items = bodyOf(res)["items"];
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0]["key"], "photos/a.jpg");
    EXPECT_EQ(items[0]["size"], 10);
    EXPECT_EQ(items[0]["lastModified"], "2024-01-01T00:00:00.000Z");
}

TEST_F(RouterTest, test_ListFilesWithoutPrefixListsEverything) {
    bucket->objects = {{"a", 1, ""}, {"b", 2, ""}};
    const auto res = call(verb::get, "/api/files");
    EXPECT_EQ(bodyOf(res)["items"].size(), 2u);
    EXPECT_TRUE(bucket->lastPrefix.empty());
}

TEST_F(RouterTest, test_ListWithMalformedPrefixIs400) {
    bucket->lastPrefix = "untouched";
    const auto res = call(verb::get, "/api/files?prefix=%zz");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_TRUE(bodyOf(res).contains("error"));
    EXPECT_EQ(bucket->lastPrefix, "untouched");
}

TEST_F(RouterTest, test_ListFailureIs500) {
    bucket->fail = true;
    const auto res = call(verb::get, "/api/files");
    EXPECT_EQ(res.result(), status::internal_server_error);
    EXPECT_EQ(bodyOf(res), json({{"error", "Failed to list files"}}));
}

TEST_F(RouterTest, test_UploadUrlInfersContentType) {
    const auto res = call(verb::post, "/api/upload-url", R"({"key":"photos/cat.png"})");
    ASSERT_EQ(res.result(), status::ok);

    const auto j = bodyOf(res);
    EXPECT_EQ(j["key"], "photos/cat.png");
    EXPECT_EQ(j["contentType"], "image/png");
    EXPECT_EQ(j["url"], "https://store.test/bucket/photos/cat.png?sig=put");
    EXPECT_EQ(bucket->lastContentType, "image/png");
}

TEST_F(RouterTest, test_UploadUrlKeepsExplicitContentType) {
    const auto res = call(verb::post, "/api/upload-url", R"({"key":"notes","contentType":"text/markdown"})");
    EXPECT_EQ(bodyOf(res)["contentType"], "text/markdown");
    EXPECT_EQ(bucket->lastContentType, "text/markdown");
}

TEST_F(RouterTest, test_UploadUrlValidation) {
    auto res = call(verb::post, "/api/upload-url", R"({"contentType":"text/plain"})");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(bodyOf(res), json({{"error", "key is required"}}));

    res = call(verb::post, "/api/upload-url");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(bodyOf(res), json({{"error", "key is required"}}));

    res = call(verb::post, "/api/upload-url", "{not json");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(bodyOf(res), json({{"error", "Invalid JSON body"}}));

    bucket->fail = true;
    res = call(verb::post, "/api/upload-url", R"({"key":"a.txt"})");
    EXPECT_EQ(res.result(), status::internal_server_error);
    EXPECT_EQ(bodyOf(res), json({{"error", "Failed to create upload URL"}}));
}

TEST_F(RouterTest, test_DownloadUrl) {
    auto res = call(verb::get, "/api/download-url?key=dir%20a%2Fb.txt");
    ASSERT_EQ(res.result(), status::ok);
    EXPECT_EQ(bodyOf(res)["key"], "dir a/b.txt");
    EXPECT_EQ(bodyOf(res)["url"], "https://store.test/bucket/dir a/b.txt?sig=get");

    res = call(verb::get, "/api/download-url");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(bodyOf(res), json({{"error", "key is required"}}));

    bucket->fail = true;
    res = call(verb::get, "/api/download-url?key=x");
    EXPECT_EQ(res.result(), status::internal_server_error);
    EXPECT_EQ(bodyOf(res), json({{"error", "Failed to create download URL"}}));
}

TEST_F(RouterTest, test_DeleteFile) {
    auto res = call(verb::delete_, "/api/files", R"({"key":"old/report.pdf"})");
    ASSERT_EQ(res.result(), status::ok);
    EXPECT_EQ(bodyOf(res), json({{"ok", true}}));
    EXPECT_EQ(bucket->lastDeleted, "old/report.pdf");

    res = call(verb::delete_, "/api/files", "{}");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(bodyOf(res), json({{"error", "key is required"}}));

    bucket->fail = true;
    res = call(verb::delete_, "/api/files", R"({"key":"x"})");
    EXPECT_EQ(res.result(), status::internal_server_error);
    EXPECT_EQ(bodyOf(res), json({{"error", "Failed to delete file"}}));
}

TEST_F(RouterTest, test_PreflightAnswersNoContent) {
    auto req = make(verb::options, "/api/upload-url");
    req.set(field::access_control_request_headers, "content-type,x-custom");
    auto res = std::get<string_response>(router->route(std::move(req)));

    EXPECT_EQ(res.result(), status::no_content);
    EXPECT_EQ(res[field::access_control_allow_origin], "*");
    EXPECT_EQ(res[field::access_control_allow_methods], "GET,HEAD,PUT,PATCH,POST,DELETE");
    EXPECT_EQ(res[field::access_control_allow_headers], "content-type,x-custom");

    res = call(verb::options, "/anything");
    EXPECT_EQ(res[field::access_control_allow_headers], "Content-Type");
}

TEST_F(RouterTest, test_UnknownApiRouteIs404) {
    auto res = call(verb::get, "/api/nope");
    EXPECT_EQ(res.result(), status::not_found);
    EXPECT_EQ(bodyOf(res), json({{"error", "Not found"}}));

    res = call(verb::put, "/api/health");
    EXPECT_EQ(res.result(), status::not_found);
}

TEST_F(RouterTest, test_ServesStaticFiles) {
    auto res = router->route(make(verb::get, "/"));
    ASSERT_TRUE(std::holds_alternative<file_response>(res));
    auto& index = std::get<file_response>(res);
    EXPECT_EQ(index.result(), status::ok);
    EXPECT_EQ(index[field::content_type], "text/html");
    EXPECT_EQ(index[field::access_control_allow_origin], "*");

    res = router->route(make(verb::get, "/app.js?v=2"));
    ASSERT_TRUE(std::holds_alternative<file_response>(res));
    EXPECT_EQ(std::get<file_response>(res)[field::content_type], "application/javascript");
}

TEST_F(RouterTest, test_HeadReturnsHeadersOnly) {
    const auto res = call(verb::head, "/index.html");
    EXPECT_EQ(res.result(), status::ok);
    EXPECT_TRUE(res.body().empty());
    EXPECT_EQ(res[field::content_length], "22");
}

TEST_F(RouterTest, test_StaticTraversalAndMissingFiles) {
    auto res = call(verb::get, "/../etc/passwd");
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(bodyOf(res), json({{"error", "Invalid path"}}));

    res = call(verb::get, "/%2e%2e/secret");
    EXPECT_EQ(res.result(), status::bad_request);

    res = call(verb::get, "/missing.css");
    EXPECT_EQ(res.result(), status::not_found);
}

TEST(RouterHelpersTest, test_QueryParsing) {
    const auto params = parse_query_params("/api/files?prefix=a%20b%2F&flag&x=1+2");
    EXPECT_EQ(params.at("prefix"), "a b/");
    EXPECT_EQ(params.at("flag"), "");
    EXPECT_EQ(params.at("x"), "1 2");
    EXPECT_TRUE(parse_query_params("/api/files").empty());
    EXPECT_THROW((void)url_decode("%G1"), std::invalid_argument);
    EXPECT_THROW((void)url_decode("abc%2"), std::invalid_argument);
    EXPECT_THROW((void)url_decode("%4z"), std::invalid_argument);
    EXPECT_THROW((void)url_decode("x%z4y"), std::invalid_argument);
    EXPECT_EQ(url_decode("%4a%4A"), "JJ");
}
