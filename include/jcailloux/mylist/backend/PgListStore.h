#ifndef JCX_MYLIST_BACKEND_PG_LIST_STORE_H
#define JCX_MYLIST_BACKEND_PG_LIST_STORE_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jcailloux/mylist/Error.h"
#include "jcailloux/mylist/Log.h"
#include "jcailloux/mylist/backend/ListStore.h"
#include "jcailloux/mylist/io/IoContext.h"
#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/io/pg/PgError.h"
#include "jcailloux/mylist/io/pg/PgPool.h"
#include "jcailloux/mylist/io/pg/PgResult.h"

namespace jcailloux::mylist {

// =============================================================================
// PgListStore - ListStore over PostgreSQL (schema: sql/schema.sql)
//
// created_at_us is assigned by the column default (clock_timestamp() in
// microseconds), id by BIGSERIAL. Every io::PgError is logged and rethrown
// as StoreUnavailable.
// =============================================================================

template<io::IoContext Io>
class PgListStore final : public ListStore {
public:
    explicit PgListStore(io::PgClient<Io>& client) noexcept : client_(&client) {}

    io::Task<InsertResult> insertIfAbsent(
        std::string_view userId, std::string_view contentId, std::string_view contentType) override
    {
        auto result = co_await run("insert", client_->queryArgs(
            kInsertSql, userId, contentId, contentType));

        if (result.empty()) {
            // Lost a race with a concurrent insert of the same row: the
            // statement snapshot could not see it, a fresh statement can.
            result = co_await run("insert", client_->queryArgs(kSelectOneSql, userId, contentId));
            if (result.empty())
                throw StoreUnavailable("insert conflicted but the existing row is not visible");
            co_return InsertResult{toItem(result[0]), false};
        }

        co_return InsertResult{toItem(result[0]), result[0].get<bool>(5)};
    }

    io::Task<bool> deleteIfExists(std::string_view userId, std::string_view contentId) override {
        auto result = co_await run("delete", client_->queryArgs(kDeleteSql, userId, contentId));
        co_return result.affectedRows() > 0;
    }

    io::Task<std::vector<ListItem>> queryPage(
        std::string_view userId, std::optional<CursorPosition> after, int fetchLimit) override
    {
        io::PgResult result;
        if (after) {
            result = co_await run("queryPage", client_->queryArgs(
                kPageAfterSql, userId, after->createdAt, after->id, static_cast<int32_t>(fetchLimit)));
        } else {
            result = co_await run("queryPage", client_->queryArgs(
                kPageHeadSql, userId, static_cast<int32_t>(fetchLimit)));
        }

        std::vector<ListItem> items;
        items.reserve(static_cast<size_t>(result.rows()));
        for (int i = 0; i < result.rows(); ++i)
            items.push_back(toItem(result[i]));
        co_return items;
    }

    io::Task<bool> contentExists(std::string_view contentId, std::string_view contentType) override {
        const char* sql = nullptr;
        if (contentType == "movie") sql = kMovieExistsSql;
        else if (contentType == "tvshow") sql = kTvShowExistsSql;
        else co_return false;

        auto result = co_await run("contentExists", client_->queryArgs(sql, contentId));
        co_return !result.empty() && result[0].get<bool>(0);
    }

private:
    static constexpr const char* kInsertSql =
        "WITH ins AS ("
        "  INSERT INTO my_list_items (user_id, content_id, content_type)"
        "  VALUES ($1, $2, $3)"
        "  ON CONFLICT (user_id, content_id) DO NOTHING"
        "  RETURNING id, user_id, content_id, content_type, created_at_us, true AS inserted"
        ") "
        "SELECT * FROM ins "
        "UNION ALL "
        "SELECT id, user_id, content_id, content_type, created_at_us, false "
        "FROM my_list_items "
        "WHERE user_id = $1 AND content_id = $2 AND NOT EXISTS (SELECT 1 FROM ins)";

    static constexpr const char* kSelectOneSql =
        "SELECT id, user_id, content_id, content_type, created_at_us "
        "FROM my_list_items WHERE user_id = $1 AND content_id = $2";

    static constexpr const char* kDeleteSql =
        "DELETE FROM my_list_items WHERE user_id = $1 AND content_id = $2";

    static constexpr const char* kPageHeadSql =
        "SELECT id, user_id, content_id, content_type, created_at_us "
        "FROM my_list_items WHERE user_id = $1 "
        "ORDER BY created_at_us DESC, id DESC LIMIT $2::int";

    static constexpr const char* kPageAfterSql =
        "SELECT id, user_id, content_id, content_type, created_at_us "
        "FROM my_list_items "
        "WHERE user_id = $1 AND (created_at_us, id) < ($2::bigint, $3::bigint) "
        "ORDER BY created_at_us DESC, id DESC LIMIT $4::int";

    static constexpr const char* kMovieExistsSql =
        "SELECT EXISTS (SELECT 1 FROM movies WHERE id = $1)";

    static constexpr const char* kTvShowExistsSql =
        "SELECT EXISTS (SELECT 1 FROM tv_shows WHERE id = $1)";

    // Every row-returning statement above selects
    // (id, user_id, content_id, content_type, created_at_us) first.
    static ListItem toItem(const io::PgResult::Row& row) {
        ListItem item;
        item.id = row.get<int64_t>(0);
        item.userId = row.get<std::string>(1);
        item.contentId = row.get<std::string>(2);
        item.contentType = row.get<std::string>(3);
        item.createdAt = row.get<int64_t>(4);
        return item;
    }

    static io::Task<io::PgResult> run(const char* op, io::Task<io::PgResult> task) {
        try {
            co_return co_await task;
        } catch (const io::PgError& e) {
            MYLIST_LOG_ERROR << "PgListStore " << op << " failed: " << e.what();
            throw StoreUnavailable(std::string("postgres ") + op + ": " + e.what());
        }
    }

    io::PgClient<Io>* client_;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_BACKEND_PG_LIST_STORE_H
