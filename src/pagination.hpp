#pragma once

#include "api_error.hpp"
#include "cancellation.hpp"
#include "client.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace yourapi {

/// One page of a cursor-paginated listing:
/// { "items": [...], "nextCursor": string|null, "hasMore": bool }
template <typename T>
struct CursorPaginatedResponse {
    std::vector<T>             items;
    std::optional<std::string> nextCursor;
    bool                       hasMore = false;
};

/// One page of a page-numbered listing:
/// { "items": [...], "page": n, "perPage": n, "totalPages": n, "totalItems": n }
template <typename T>
struct PagePaginatedResponse {
    std::vector<T> items;
    unsigned int   page       = 0;
    unsigned int   perPage    = 0;
    unsigned int   totalPages = 0;
    unsigned int   totalItems = 0;
};

template <typename T>
void from_json(const nlohmann::json& j, CursorPaginatedResponse<T>& r) {
    r.items = j.at("items").get<std::vector<T>>();

    auto it = j.find("nextCursor");
    if (it != j.end() && !it->is_null()) {
        r.nextCursor = it->get<std::string>();
    } else {
        r.nextCursor.reset();
    }

    r.hasMore = j.at("hasMore").get<bool>();
}

template <typename T>
void to_json(nlohmann::json& j, const CursorPaginatedResponse<T>& r) {
    j = nlohmann::json{{"items", r.items}, {"hasMore", r.hasMore}};
    j["nextCursor"] = r.nextCursor ? nlohmann::json(*r.nextCursor) : nlohmann::json(nullptr);
}

template <typename T>
void from_json(const nlohmann::json& j, PagePaginatedResponse<T>& r) {
    r.items      = j.at("items").get<std::vector<T>>();
    r.page       = j.at("page").get<unsigned int>();
    r.perPage    = j.at("perPage").get<unsigned int>();
    r.totalPages = j.at("totalPages").get<unsigned int>();
    r.totalItems = j.at("totalItems").get<unsigned int>();
}

template <typename T>
void to_json(nlohmann::json& j, const PagePaginatedResponse<T>& r) {
    j = nlohmann::json{{"items", r.items},
                       {"page", r.page},
                       {"perPage", r.perPage},
                       {"totalPages", r.totalPages},
                       {"totalItems", r.totalItems}};
}

/// Counters for the last fetchAll() run of a paginator.
struct PaginationStats {
    std::size_t totalPages = 0;
    std::size_t totalItems = 0;
};

namespace detail {

/// Convert one page's items to T, appending to @p out.
template <typename T>
void appendItems(const std::vector<nlohmann::json>& items, std::vector<T>& out) {
    try {
        for (const auto& item : items) {
            out.push_back(item.get<T>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw APIError(std::string("Failed to parse paginated response: ") + e.what(),
                       std::nullopt, errc::kParseError);
    }
}

} // namespace detail

/// Walks a cursor-paginated endpoint through Client::get, following
/// nextCursor until the server reports no more pages.
class CursorPaginator {
public:
    using Stats = PaginationStats;

    explicit CursorPaginator(const Client& client,
                             const CancellationToken* cancel = nullptr);

    /// Fetch every page of @p path (which may already carry a query string)
    /// and return the items of all pages in order.
    /// @throws APIError on the first failed page; earlier items are dropped.
    template <typename T = nlohmann::json>
    std::vector<T> fetchAll(const std::string& path);

    /// Same, with @p params added to the query of every page request.
    template <typename T = nlohmann::json>
    std::vector<T> fetchAll(const std::string& path, const QueryParams& params) {
        return fetchAll<T>(appendQuery(path, params));
    }

    Stats getStats() const { return mStats; }

private:
    const Client&            mClient;
    const CancellationToken* mCancel;
    Stats                    mStats{};

    /// GET one page. std::nullopt when the server answers 204.
    /// @throws APIError with code PARSE_ERROR if the body is not a page.
    std::optional<CursorPaginatedResponse<nlohmann::json>>
    fetchPage(const std::string& currentPath);

    void logPage(const std::string& currentPath, std::size_t count) const;
};

template <typename T>
std::vector<T> CursorPaginator::fetchAll(const std::string& path) {
    mStats = Stats{};

    std::vector<T> allItems;
    std::optional<std::string> cursor;
    bool hasMore = true;

    while (hasMore) {
        const std::string currentPath = cursor ? appendCursor(path, *cursor) : path;

        auto page = fetchPage(currentPath);
        if (!page) {
            break;
        }

        detail::appendItems(page->items, allItems);

        ++mStats.totalPages;
        logPage(currentPath, page->items.size());

        cursor  = page->nextCursor;
        hasMore = page->hasMore && cursor.has_value();
    }

    mStats.totalItems = allItems.size();
    return allItems;
}

/// Walks a page-numbered endpoint, requesting page=1, 2, ... until the
/// page number passes the totalPages reported by the server.
class PagePaginator {
public:
    using Stats = PaginationStats;

    explicit PagePaginator(const Client& client,
                           const CancellationToken* cancel = nullptr);

    /// Fetch every page of @p path and return the items in order. @p params
    /// are sent with every request (e.g. perPage); a "page" entry is
    /// replaced by the current page number.
    /// @throws APIError on the first failed page; earlier items are dropped.
    template <typename T = nlohmann::json>
    std::vector<T> fetchAll(const std::string& path, const QueryParams& params = QueryParams());

    Stats getStats() const { return mStats; }

private:
    const Client&            mClient;
    const CancellationToken* mCancel;
    Stats                    mStats{};

    /// GET page @p page. std::nullopt when the server answers 204.
    /// @throws APIError with code PARSE_ERROR if the body is not a page.
    std::optional<PagePaginatedResponse<nlohmann::json>>
    fetchPage(const std::string& path, const QueryParams& params, unsigned int page);
};

template <typename T>
std::vector<T> PagePaginator::fetchAll(const std::string& path, const QueryParams& params) {
    mStats = Stats{};

    std::vector<T> allItems;
    unsigned int totalPages = 1;

    for (unsigned int page = 1; page <= totalPages; ++page) {
        auto response = fetchPage(path, params, page);
        if (!response) {
            break;
        }

        detail::appendItems(response->items, allItems);
        ++mStats.totalPages;
        totalPages = response->totalPages;
    }

    mStats.totalItems = allItems.size();
    return allItems;
}

} // namespace yourapi
