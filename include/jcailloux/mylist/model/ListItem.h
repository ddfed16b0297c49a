#ifndef JCX_MYLIST_MODEL_LIST_ITEM_H
#define JCX_MYLIST_MODEL_LIST_ITEM_H

#include <cstdint>
#include <string>

#include <glaze/glaze.hpp>

namespace jcailloux::mylist {

/// One entry of a user's list. Unique per (userId, contentId); never
/// modified after the store creates it.
struct ListItem {
    int64_t id = 0;             // store-assigned identity, tie-break for ordering
    std::string userId;
    std::string contentId;
    std::string contentType;
    int64_t createdAt = 0;      // microseconds since the Unix epoch

    bool operator==(const ListItem&) const = default;
};

/// Ordering position of an item: pages run (createdAt DESC, id DESC).
struct CursorPosition {
    int64_t createdAt = 0;
    int64_t id = 0;

    bool operator==(const CursorPosition&) const = default;

    /// True when `this` comes strictly before `o` in list order.
    [[nodiscard]] bool sortsBefore(const CursorPosition& o) const noexcept {
        return createdAt > o.createdAt || (createdAt == o.createdAt && id > o.id);
    }
};

[[nodiscard]] inline CursorPosition positionOf(const ListItem& item) noexcept {
    return {item.createdAt, item.id};
}

}  // namespace jcailloux::mylist

template<>
struct glz::meta<jcailloux::mylist::ListItem> {
    using T = jcailloux::mylist::ListItem;
    static constexpr auto value = glz::object(
        "id", &T::id,
        "userId", &T::userId,
        "contentId", &T::contentId,
        "contentType", &T::contentType,
        "createdAt", &T::createdAt
    );
};

#endif  // JCX_MYLIST_MODEL_LIST_ITEM_H
