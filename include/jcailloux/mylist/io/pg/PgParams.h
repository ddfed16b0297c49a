#ifndef JCX_MYLIST_IO_PG_PARAMS_H
#define JCX_MYLIST_IO_PG_PARAMS_H

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jcailloux::mylist::io {

// PgParams - positional parameters ($1, $2, ...) for PQsendQueryParams.
//
// Every value travels in text format and lets the server infer its type from
// the statement; std::nullopt / nullptr bind SQL NULL.
//
//   auto params = PgParams::make(userId, createdAt, id, limit + 1);

class PgParams {
public:
    template<typename... Args>
    static PgParams make(Args&&... args) {
        PgParams p;
        p.slots_.reserve(sizeof...(args));
        (p.add(std::forward<Args>(args)), ...);
        return p;
    }

    void add(std::nullptr_t) { slots_.emplace_back(std::nullopt); }
    void add(std::string_view v) { slots_.emplace_back(std::string(v)); }
    void add(const char* v) { v ? add(std::string_view(v)) : add(nullptr); }
    void add(const std::string& v) { slots_.emplace_back(v); }
    void add(std::string&& v) { slots_.emplace_back(std::move(v)); }
    void add(bool v) { slots_.emplace_back(std::string(v ? "t" : "f")); }

    template<std::integral T>
        requires (!std::same_as<T, bool> && !std::same_as<T, char>)
    void add(T v) { slots_.emplace_back(std::to_string(v)); }

    template<typename T>
    void add(const std::optional<T>& v) {
        if (v) add(*v);
        else add(nullptr);
    }

    [[nodiscard]] int count() const noexcept { return static_cast<int>(slots_.size()); }

    /// Value pointers for libpq; valid while this object is alive and unmodified.
    [[nodiscard]] std::vector<const char*> values() const {
        std::vector<const char*> out;
        out.reserve(slots_.size());
        for (const auto& s : slots_)
            out.push_back(s ? s->c_str() : nullptr);
        return out;
    }

    [[nodiscard]] std::vector<int> lengths() const {
        std::vector<int> out;
        out.reserve(slots_.size());
        for (const auto& s : slots_)
            out.push_back(s ? static_cast<int>(s->size()) : 0);
        return out;
    }

private:
    std::vector<std::optional<std::string>> slots_;
};

} // namespace jcailloux::mylist::io

#endif // JCX_MYLIST_IO_PG_PARAMS_H
