#include "pagination.hpp"

#include <ostream>

namespace yourapi {

CursorPaginator::CursorPaginator(const Client& client,
                                 const CancellationToken* cancel)
    : mClient(client)
    , mCancel(cancel) {}

std::optional<CursorPaginatedResponse<nlohmann::json>>
CursorPaginator::fetchPage(const std::string& currentPath) {
    auto body = mClient.get(currentPath, mCancel);
    if (!body) {
        if (mClient.debug()) {
            mClient.logStream() << "[Paginator] Empty response for " << currentPath
                      << "; stopping.\n";
        }
        return std::nullopt;
    }

    try {
        return body->get<CursorPaginatedResponse<nlohmann::json>>();
    } catch (const nlohmann::json::exception& e) {
        throw APIError(std::string("Failed to parse paginated response: ") + e.what(),
                       std::nullopt, errc::kParseError);
    }
}

void CursorPaginator::logPage(const std::string& currentPath, std::size_t count) const {
    if (!mClient.debug()) return;
    mClient.logStream() << "[Paginator] " << currentPath << ": " << count
              << " items (pages so far: " << mStats.totalPages << ")\n";
}

// ---------------------------------------------------------------------------
// Page-numbered listings
// ---------------------------------------------------------------------------

PagePaginator::PagePaginator(const Client& client,
                             const CancellationToken* cancel)
    : mClient(client)
    , mCancel(cancel) {}

std::optional<PagePaginatedResponse<nlohmann::json>>
PagePaginator::fetchPage(const std::string& path,
                         const QueryParams& params,
                         unsigned int page)
{
    QueryParams query;
    for (const auto& param : params) {
        if (param.first != "page") {
            query.push_back(param);
        }
    }
    query.emplace_back("page", std::to_string(page));

    auto body = mClient.get(path, query, mCancel);
    if (!body) {
        if (mClient.debug()) {
            mClient.logStream() << "[Paginator] Empty response for " << path
                                << " page " << page << "; stopping.\n";
        }
        return std::nullopt;
    }

    PagePaginatedResponse<nlohmann::json> response;
    try {
        response = body->get<PagePaginatedResponse<nlohmann::json>>();
    } catch (const nlohmann::json::exception& e) {
        throw APIError(std::string("Failed to parse paginated response: ") + e.what(),
                       std::nullopt, errc::kParseError);
    }

    if (mClient.debug()) {
        mClient.logStream() << "[Paginator] " << path << " page " << page << "/"
                            << response.totalPages << ": " << response.items.size()
                            << " items\n";
    }
    return response;
}

} // namespace yourapi
