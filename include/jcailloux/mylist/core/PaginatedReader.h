#ifndef JCX_MYLIST_CORE_PAGINATED_READER_H
#define JCX_MYLIST_CORE_PAGINATED_READER_H

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jcailloux/mylist/Error.h"
#include "jcailloux/mylist/backend/ListStore.h"
#include "jcailloux/mylist/cursor/CursorCodec.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/model/Page.h"

namespace jcailloux::mylist {

// =============================================================================
// PaginatedReader - keyset pagination over the durable store
//
// Fetches limit + 1 rows: the extra row only tells whether another page
// exists and is never returned. nextCursor points at the last row kept.
// =============================================================================

class PaginatedReader {
public:
    PaginatedReader(ListStore& store, int defaultLimit, int maxLimit) noexcept
        : store_(&store), default_limit_(defaultLimit), max_limit_(maxLimit) {}

    /// Missing -> default, <= 0 -> ValidationError, above max -> max.
    [[nodiscard]] int normalizeLimit(std::optional<int> limit) const {
        if (!limit) return default_limit_;
        if (*limit <= 0) throw ValidationError("limit must be a positive integer");
        return *limit > max_limit_ ? max_limit_ : *limit;
    }

    io::Task<Page> fetchPage(std::string_view userId, std::optional<CursorPosition> after, int limit) {
        if (limit <= 0) throw ValidationError("limit must be a positive integer");

        auto rows = co_await store_->queryPage(userId, after, limit + 1);
        co_return assemble(std::move(rows), limit);
    }

    /// Turn limit + 1 ordered rows into a page of at most `limit` items.
    [[nodiscard]] static Page assemble(std::vector<ListItem> rows, int limit) {
        Page page;
        if (rows.size() > static_cast<size_t>(limit)) {
            rows.resize(static_cast<size_t>(limit));
            page.hasMore = true;
            page.nextCursor = cursor::encode(positionOf(rows.back()));
        }
        page.items = std::move(rows);
        return page;
    }

    [[nodiscard]] int defaultLimit() const noexcept { return default_limit_; }
    [[nodiscard]] int maxLimit() const noexcept { return max_limit_; }

private:
    ListStore* store_;
    int default_limit_;
    int max_limit_;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_CORE_PAGINATED_READER_H
