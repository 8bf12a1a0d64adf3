#include "protocols/http/Router.hpp"
#include "storage/BucketService.hpp"
#include "util/files.hpp"
#include "util/mime.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>

using namespace bk::protocols::http;
using namespace bk::logging;
using json = nlohmann::json;

namespace {
constexpr auto ALLOWED_METHODS = "GET,HEAD,PUT,PATCH,POST,DELETE";

std::string_view pathOf(const request& req) {
    const auto t = req.target();
    const std::string_view target(t.data(), t.size());
    const auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

// nullopt for a body that is present but not JSON. An empty body reads as {}.
std::optional<json> parseBody(const request& req) {
    if (req.body().empty()) return json::object();
    try {
        return json::parse(req.body());
    } catch (const json::parse_error&) {
        return std::nullopt;
    }
}

std::string stringField(const json& j, const char* name) {
    if (!j.is_object()) return {};
    const auto it = j.find(name);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

template<class Res>
void applyCors(Res& res) {
    res.set(field::access_control_allow_origin, "*");
}
}

std::string bk::protocols::http::url_decode(const std::string& value) {
    std::ostringstream result;
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%' && i + 2 < value.length()) {
            const auto hi = static_cast<unsigned char>(value[i + 1]);
            const auto lo = static_cast<unsigned char>(value[i + 2]);
            if (!std::isxdigit(hi) || !std::isxdigit(lo)) throw std::invalid_argument("Invalid percent-encoding in URL");
            result << static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        }
        else if (value[i] == '%') throw std::invalid_argument("Truncated percent-encoding in URL");
        else if (value[i] == '+') result << ' ';
        else result << value[i];
    }
    return result.str();
}

std::unordered_map<std::string, std::string> bk::protocols::http::parse_query_params(const std::string& target) {
    std::unordered_map<std::string, std::string> params;

    const auto pos = target.find('?');
    if (pos == std::string::npos) return params;

    std::istringstream stream(target.substr(pos + 1));
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        if (eq == std::string::npos) params[url_decode(pair)] = "";
        else params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
    }

    return params;
}

Router::Router(std::shared_ptr<storage::BucketService> bucket, std::filesystem::path staticDir)
    : bucket_(std::move(bucket)), staticDir_(std::move(staticDir)) {
    if (!bucket_) throw std::invalid_argument("Router requires a bucket service");
}

Response Router::route(request&& req) const {
    auto res = dispatch(std::move(req));
    std::visit([](auto& r) { applyCors(r); }, res);
    return res;
}

Response Router::dispatch(request&& req) const {
    if (req.method() == verb::options) return handlePreflight(req);

    const auto path = pathOf(req);

    if (path == "/api/health" && req.method() == verb::get) return handleHealth(req);

    if (path == "/api/files") {
        if (req.method() == verb::get) return handleListFiles(req);
        if (req.method() == verb::delete_) return handleDeleteFile(req);
    }

    if (path == "/api/upload-url" && req.method() == verb::post) return handleUploadUrl(req);
    if (path == "/api/download-url" && req.method() == verb::get) return handleDownloadUrl(req);

    if (path == "/api" || path.starts_with("/api/"))
        return makeErrorResponse(req, "Not found", status::not_found);

    if (req.method() == verb::get || req.method() == verb::head) return serveStatic(req);

    return makeErrorResponse(req, "Not found", status::not_found);
}

string_response Router::handleHealth(const request& req) const {
    return makeJsonResponse(req, json{{"ok", true}});
}

string_response Router::handleListFiles(const request& req) const {
    std::string prefix;
    try {
        const auto params = parse_query_params(std::string(req.target()));
        if (const auto it = params.find("prefix"); it != params.end()) prefix = it->second;
    } catch (const std::invalid_argument& e) {
        return makeErrorResponse(req, e.what(), status::bad_request);
    }

    try {
        json items = json::array();
        for (const auto& o : bucket_->listObjects(prefix))
            items.push_back({{"key", o.key}, {"size", o.size}, {"lastModified", o.lastModified}});

        return makeJsonResponse(req, json{{"items", items}});
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Router] listFiles failed: {}", e.what());
        return makeErrorResponse(req, "Failed to list files", status::internal_server_error);
    }
}

string_response Router::handleUploadUrl(const request& req) const {
    const auto body = parseBody(req);
    if (!body) return makeErrorResponse(req, "Invalid JSON body", status::bad_request);

    const auto key = stringField(*body, "key");
    if (key.empty()) return makeErrorResponse(req, "key is required", status::bad_request);

    auto contentType = stringField(*body, "contentType");
    if (contentType.empty()) contentType = util::mimeTypeFor(key);

    try {
        const auto url = bucket_->presignPut(key, contentType);
        return makeJsonResponse(req, json{{"url", url}, {"key", key}, {"contentType", contentType}});
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Router] upload-url failed for {}: {}", key, e.what());
        return makeErrorResponse(req, "Failed to create upload URL", status::internal_server_error);
    }
}

string_response Router::handleDownloadUrl(const request& req) const {
    std::string key;
    try {
        const auto params = parse_query_params(std::string(req.target()));
        if (const auto it = params.find("key"); it != params.end()) key = it->second;
    } catch (const std::invalid_argument& e) {
        return makeErrorResponse(req, e.what(), status::bad_request);
    }

    if (key.empty()) return makeErrorResponse(req, "key is required", status::bad_request);

    try {
        const auto url = bucket_->presignGet(key);
        return makeJsonResponse(req, json{{"url", url}, {"key", key}});
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Router] download-url failed for {}: {}", key, e.what());
        return makeErrorResponse(req, "Failed to create download URL", status::internal_server_error);
    }
}

string_response Router::handleDeleteFile(const request& req) const {
    const auto body = parseBody(req);
    if (!body) return makeErrorResponse(req, "Invalid JSON body", status::bad_request);

    const auto key = stringField(*body, "key");
    if (key.empty()) return makeErrorResponse(req, "key is required", status::bad_request);

    try {
        bucket_->deleteObject(key);
        LogRegistry::http()->info("[Router] Deleted {}", key);
        return makeJsonResponse(req, json{{"ok", true}});
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Router] delete failed for {}: {}", key, e.what());
        return makeErrorResponse(req, "Failed to delete file", status::internal_server_error);
    }
}

string_response Router::handlePreflight(const request& req) {
    string_response res{status::no_content, req.version()};
    res.set(field::access_control_allow_methods, ALLOWED_METHODS);

    if (const auto requested = req[field::access_control_request_headers]; !requested.empty())
        res.set(field::access_control_allow_headers, requested);
    else
        res.set(field::access_control_allow_headers, "Content-Type");

    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

Response Router::serveStatic(const request& req) const {
    std::string decoded;
    try {
        decoded = url_decode(std::string(pathOf(req)));
    } catch (const std::invalid_argument& e) {
        return makeErrorResponse(req, e.what(), status::bad_request);
    }

    std::filesystem::path rel = decoded.empty() || decoded == "/" ? "index.html" : decoded.substr(1);
    if (!rel.empty() && !rel.has_filename()) rel /= "index.html";

    if (!util::isSafeRelativePath(rel)) {
        LogRegistry::http()->warn("[Router] Rejected static path: {}", decoded);
        return makeErrorResponse(req, "Invalid path", status::bad_request);
    }

    auto abs = staticDir_ / rel;
    if (std::filesystem::is_directory(abs)) abs /= "index.html";
    if (!std::filesystem::is_regular_file(abs)) return makeErrorResponse(req, "Not found", status::not_found);

    boost::beast::error_code ec;
    file_body::value_type body;
    body.open(abs.c_str(), boost::beast::file_mode::scan, ec);
    if (ec) {
        LogRegistry::http()->error("[Router] Failed to open {}: {}", abs.string(), ec.message());
        return makeErrorResponse(req, "Not found", status::not_found);
    }

    const auto size = body.size();
    const auto mime = util::mimeTypeFor(abs.filename().string());

    if (req.method() == verb::head) {
        string_response res{status::ok, req.version()};
        res.set(field::content_type, mime);
        res.content_length(size);
        res.keep_alive(req.keep_alive());
        return res;
    }

    file_response res{
        std::piecewise_construct,
        std::make_tuple(std::move(body)),
        std::make_tuple(status::ok, req.version())
    };
    res.set(field::content_type, mime);
    res.content_length(size);
    res.keep_alive(req.keep_alive());
    return res;
}

string_response Router::makeJsonResponse(const request& req, const json& j, const status status) {
    string_response res{status, req.version()};
    res.set(field::content_type, "application/json");
    res.body() = j.dump();
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

string_response Router::makeErrorResponse(const request& req, const std::string& msg, const status status) {
    return makeJsonResponse(req, json{{"error", msg}}, status);
}
