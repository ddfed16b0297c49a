#ifndef JCX_MYLIST_MODEL_PAGE_H
#define JCX_MYLIST_MODEL_PAGE_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glaze/glaze.hpp>

#include "jcailloux/mylist/model/ListItem.h"

namespace jcailloux::mylist {

// =============================================================================
// Page - one response page, exactly as served and as cached
//
// JSON: {"items":[...],"nextCursor":"..."|null,"hasMore":bool}
// nextCursor is written as an explicit null on the last page.
// =============================================================================

struct Page {
    std::vector<ListItem> items;
    std::optional<std::string> nextCursor;
    bool hasMore = false;

    bool operator==(const Page&) const = default;

    static constexpr glz::opts kWriteOpts{.skip_null_members = false};

    /// Empty string on serialization failure.
    [[nodiscard]] std::string toJson() const;

    static std::optional<Page> fromJson(std::string_view json);
};

}  // namespace jcailloux::mylist

template<>
struct glz::meta<jcailloux::mylist::Page> {
    using T = jcailloux::mylist::Page;
    static constexpr auto value = glz::object(
        "items", &T::items,
        "nextCursor", &T::nextCursor,
        "hasMore", &T::hasMore
    );
};

namespace jcailloux::mylist {

inline std::string Page::toJson() const {
    std::string json;
    json.reserve(items.size() * 128 + 48);
    if (glz::write<kWriteOpts>(*this, json)) json.clear();
    return json;
}

inline std::optional<Page> Page::fromJson(std::string_view json) {
    if (json.empty()) return std::nullopt;
    Page page;
    if (glz::read_json(page, json)) return std::nullopt;
    return page;
}

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_MODEL_PAGE_H
