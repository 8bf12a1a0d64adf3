#pragma once

#include <boost/beast/http.hpp>
#include <boost/beast/http/file_body.hpp>
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>

namespace bk::storage {
class BucketService;
}

namespace bk::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;

template<class Body>
using response = boost::beast::http::response<Body>;

using string_body = boost::beast::http::string_body;
using file_body   = boost::beast::http::file_body;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

using string_response = response<string_body>;
using file_response   = response<file_body>;

using Response = std::variant<string_response, file_response>;

// Throws std::invalid_argument on a malformed percent escape.
std::string url_decode(const std::string& value);

std::unordered_map<std::string, std::string> parse_query_params(const std::string& target);

// JSON API under /api plus the static UI for everything else.
class Router {
public:
    Router(std::shared_ptr<storage::BucketService> bucket, std::filesystem::path staticDir);

    // Every response carries the CORS headers.
    [[nodiscard]] Response route(request&& req) const;

    static string_response makeJsonResponse(const request& req, const nlohmann::json& j,
                                            status status = status::ok);

    static string_response makeErrorResponse(const request& req, const std::string& msg,
                                             status status = status::not_found);

private:
    std::shared_ptr<storage::BucketService> bucket_;
    std::filesystem::path staticDir_;

    [[nodiscard]] Response dispatch(request&& req) const;

    [[nodiscard]] string_response handleHealth(const request& req) const;
    [[nodiscard]] string_response handleListFiles(const request& req) const;
    [[nodiscard]] string_response handleUploadUrl(const request& req) const;
    [[nodiscard]] string_response handleDownloadUrl(const request& req) const;
    [[nodiscard]] string_response handleDeleteFile(const request& req) const;

    [[nodiscard]] static string_response handlePreflight(const request& req);

    [[nodiscard]] Response serveStatic(const request& req) const;
};

}
