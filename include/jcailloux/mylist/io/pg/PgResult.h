#ifndef JCX_MYLIST_IO_PG_RESULT_H
#define JCX_MYLIST_IO_PG_RESULT_H

#include <charconv>
#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <libpq-fe.h>

#include "jcailloux/mylist/io/pg/PgError.h"

namespace jcailloux::mylist::io {

// PgResult - one PGresult, freed with it. Columns arrive in text format and
// are decoded on access; a value that does not decode throws PgError instead
// of reading as zero.

class PgResult {
public:
    class Row {
    public:
        Row(const PGresult* res, int row) noexcept : res_(res), row_(row) {}

        [[nodiscard]] bool isNull(int col) const noexcept {
            return PQgetisnull(res_, row_, col) == 1;
        }

        [[nodiscard]] std::string_view text(int col) const noexcept {
            return {PQgetvalue(res_, row_, col), static_cast<size_t>(PQgetlength(res_, row_, col))};
        }

        /// std::string, bool (t/f) or any integer type.
        template<typename T>
        [[nodiscard]] T get(int col) const {
            auto raw = text(col);
            if constexpr (std::same_as<T, std::string>) {
                return std::string(raw);
            } else if constexpr (std::same_as<T, bool>) {
                if (raw == "t" || raw == "true") return true;
                if (raw == "f" || raw == "false") return false;
                throw PgError("column " + std::to_string(col) + " is not a boolean: " + std::string(raw));
            } else {
                static_assert(std::integral<T>, "unsupported column type");
                T v{};
                auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), v);
                if (raw.empty() || ec != std::errc{} || end != raw.data() + raw.size())
                    throw PgError("column " + std::to_string(col) + " is not an integer: " + std::string(raw));
                return v;
            }
        }

    private:
        const PGresult* res_;
        int row_;
    };

    PgResult() noexcept = default;
    explicit PgResult(PGresult* res) noexcept : res_(res) {}

    [[nodiscard]] int rows() const noexcept { return res_ ? PQntuples(res_.get()) : 0; }
    [[nodiscard]] bool empty() const noexcept { return rows() == 0; }
    [[nodiscard]] Row operator[](int row) const noexcept { return Row(res_.get(), row); }

    /// True for a completed command or row set.
    [[nodiscard]] bool ok() const noexcept {
        if (!res_) return false;
        auto status = PQresultStatus(res_.get());
        return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
    }

    /// Rows touched by INSERT / UPDATE / DELETE; 0 for anything else.
    [[nodiscard]] int affectedRows() const noexcept {
        if (!res_) return 0;
        std::string_view n = PQcmdTuples(res_.get());
        int v = 0;
        if (std::from_chars(n.data(), n.data() + n.size(), v).ec != std::errc{}) return 0;
        return v;
    }

    [[nodiscard]] std::string errorMessage() const {
        return res_ ? PQresultErrorMessage(res_.get()) : "no result from server";
    }

    [[nodiscard]] std::string sqlState() const {
        if (!res_) return {};
        const char* state = PQresultErrorField(res_.get(), PG_DIAG_SQLSTATE);
        return state ? state : "";
    }

private:
    struct Clear {
        void operator()(PGresult* r) const noexcept { PQclear(r); }
    };

    std::unique_ptr<PGresult, Clear> res_;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_PG_RESULT_H
