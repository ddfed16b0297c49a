#ifndef JCX_MYLIST_HTTP_MY_LIST_HANDLER_H
#define JCX_MYLIST_HTTP_MY_LIST_HANDLER_H

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glaze/glaze.hpp>

#include "jcailloux/mylist/Error.h"
#include "jcailloux/mylist/Log.h"
#include "jcailloux/mylist/core/MyListService.h"
#include "jcailloux/mylist/http/ParseUtils.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/model/ListItem.h"
#include "jcailloux/mylist/model/Page.h"

namespace jcailloux::mylist::http {

struct HttpRequest {
    std::string method;                                         // "GET", "POST", ...
    std::string path;                                           // may carry "?query"
    std::string query;                                          // without the leading '?'
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /// First header named `name`, compared case-insensitively.
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const {
        for (const auto& [k, v] : headers)
            if (parse::iequals(k, name)) return std::string_view{v};
        return std::nullopt;
    }
};

struct HttpResponse {
    int status = 200;
    std::string body;
    std::string contentType = "application/json";
};

namespace dto {

struct AddRequest {
    std::string contentId;
    std::string contentType;
};

struct AddResponse {
    std::string message;
    ListItem item;
};

struct MessageResponse {
    std::string message;
};

struct ErrorResponse {
    std::string error;
    std::string message;
};

}  // namespace dto

/// HTTP status for an error code: client mistakes 400, backends 503.
[[nodiscard]] constexpr int statusFor(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidCursor:
        case ErrorCode::InvalidContent:
        case ErrorCode::Validation:
            return 400;
        case ErrorCode::StoreUnavailable:
        case ErrorCode::CacheUnavailable:
            return 503;
    }
    return 500;
}

// =============================================================================
// MyListHandler - framework-agnostic HTTP contract for the list
//
//   GET    /my-list?limit=&cursor=     x-user-id   200 Page
//   POST   /my-list  {contentId, contentType}     201 added / 200 already in list
//   DELETE /my-list/{contentId}                   200 removed / not in list
//
// Errors are {"error": CODE, "message": text}. The hosting server only has
// to translate its request type into HttpRequest and write HttpResponse back.
// =============================================================================

class MyListHandler {
public:
    explicit MyListHandler(MyListService& service) noexcept : service_(&service) {}

    io::Task<HttpResponse> handle(const HttpRequest& req) {
        std::string_view path = req.path;
        std::string_view query = req.query;
        if (auto q = path.find('?'); q != std::string_view::npos) {
            if (query.empty()) query = path.substr(q + 1);
            path = path.substr(0, q);
        }

        static constexpr std::string_view kBase = "/my-list";
        const bool isCollection = path == kBase || path == "/my-list/";
        const bool isItem = !isCollection && path.starts_with("/my-list/")
            && path.find('/', kBase.size() + 1) == std::string_view::npos;

        if (!isCollection && !isItem)
            co_return error(404, "NOT_FOUND", "no route for " + std::string(path));
        if (isCollection && req.method != "GET" && req.method != "POST")
            co_return error(405, "METHOD_NOT_ALLOWED", req.method + " not allowed on /my-list");
        if (isItem && req.method != "DELETE")
            co_return error(405, "METHOD_NOT_ALLOWED", req.method + " not allowed on /my-list/{contentId}");

        HttpResponse response;
        std::optional<HttpResponse> failure;
        try {
            if (isItem)
                response = co_await handleDelete(req, path.substr(kBase.size() + 1));
            else if (req.method == "GET")
                response = co_await handleGet(req, query);
            else
                response = co_await handlePost(req);
        } catch (const MyListError& e) {
            failure = error(statusFor(e.code()), std::string(errorCodeName(e.code())), e.what());
        } catch (const std::exception& e) {
            MYLIST_LOG_ERROR << "MyListHandler: unexpected error on " << req.method << ' '
                             << path << ": " << e.what();
            failure = error(500, "INTERNAL_ERROR", "internal error");
        }
        if (failure) co_return std::move(*failure);
        co_return response;
    }

private:
    static std::string requireUser(const HttpRequest& req) {
        auto user = req.header("x-user-id");
        if (!user || user->empty())
            throw ValidationError("x-user-id header is required");
        return std::string(*user);
    }

    static std::optional<std::string> decodedParam(std::string_view query, std::string_view name) {
        auto raw = parse::queryParam(query, name);
        if (!raw || raw->empty()) return std::nullopt;
        auto decoded = parse::percentDecode(*raw);
        if (!decoded)
            throw ValidationError(std::string(name) + " is not correctly percent-encoded");
        return decoded;
    }

    io::Task<HttpResponse> handleGet(const HttpRequest& req, std::string_view query) {
        auto user = requireUser(req);

        std::optional<int> limit;
        if (auto raw = decodedParam(query, "limit")) {
            limit = parse::toInt(*raw);
            if (!limit) throw ValidationError("limit must be an integer");
        }
        auto cursorToken = decodedParam(query, "cursor");

        std::optional<std::string_view> cursorView;
        if (cursorToken) cursorView = *cursorToken;

        auto page = co_await service_->getPage(user, cursorView, limit);
        auto json = page.toJson();
        if (json.empty())
            throw std::runtime_error("page could not be serialized");
        co_return ok(200, std::move(json));
    }

    io::Task<HttpResponse> handlePost(const HttpRequest& req) {
        auto user = requireUser(req);

        dto::AddRequest body;
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(body, req.body))
            throw ValidationError("request body must be JSON {contentId, contentType}: "
                                  + glz::format_error(ec, req.body));
        if (body.contentType.empty())
            throw ValidationError("contentType is required");

        auto added = co_await service_->add(user, body.contentId, body.contentType);
        dto::AddResponse out{added.created ? "Added to list" : "Already in list", std::move(added.item)};
        co_return ok(added.created ? 201 : 200, write(out));
    }

    io::Task<HttpResponse> handleDelete(const HttpRequest& req, std::string_view rawContentId) {
        auto user = requireUser(req);
        auto contentId = parse::pathDecode(rawContentId);
        if (!contentId)
            throw ValidationError("contentId is not correctly percent-encoded");

        bool removed = co_await service_->remove(user, *contentId);
        co_return ok(200, write(dto::MessageResponse{removed ? "Removed from list" : "Not in list"}));
    }

    template<typename T>
    static std::string write(const T& value) {
        std::string json;
        if (glz::write_json(value, json))
            throw std::runtime_error("response could not be serialized");
        return json;
    }

    static HttpResponse ok(int status, std::string body) {
        return HttpResponse{status, std::move(body)};
    }

    static HttpResponse error(int status, std::string code, std::string message) {
        return HttpResponse{status, write(dto::ErrorResponse{std::move(code), std::move(message)})};
    }

    MyListService* service_;
};

}  // namespace jcailloux::mylist::http

template<>
struct glz::meta<jcailloux::mylist::http::dto::AddRequest> {
    using T = jcailloux::mylist::http::dto::AddRequest;
    static constexpr auto value = glz::object(
        "contentId", &T::contentId,
        "contentType", &T::contentType
    );
};

template<>
struct glz::meta<jcailloux::mylist::http::dto::AddResponse> {
    using T = jcailloux::mylist::http::dto::AddResponse;
    static constexpr auto value = glz::object(
        "message", &T::message,
        "item", &T::item
    );
};

template<>
struct glz::meta<jcailloux::mylist::http::dto::MessageResponse> {
    using T = jcailloux::mylist::http::dto::MessageResponse;
    static constexpr auto value = glz::object("message", &T::message);
};

template<>
struct glz::meta<jcailloux::mylist::http::dto::ErrorResponse> {
    using T = jcailloux::mylist::http::dto::ErrorResponse;
    static constexpr auto value = glz::object(
        "error", &T::error,
        "message", &T::message
    );
};

#endif  // JCX_MYLIST_HTTP_MY_LIST_HANDLER_H
