#ifndef JCX_MYLIST_BACKEND_LIST_STORE_H
#define JCX_MYLIST_BACKEND_LIST_STORE_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jcailloux/mylist/io/Task.h"
#include "jcailloux/mylist/model/ListItem.h"

namespace jcailloux::mylist {

struct InsertResult {
    ListItem item;
    bool inserted = false;      // false: the (userId, contentId) row already existed
};

// =============================================================================
// ListStore - durable store of list items, the single source of truth
//
// Rows are ordered by (createdAt DESC, id DESC). The store assigns both id
// and createdAt on insert. Failures surface as StoreUnavailable.
// =============================================================================

class ListStore {
public:
    virtual ~ListStore() = default;

    /// Insert under the (userId, contentId) uniqueness constraint; an existing
    /// row is returned unchanged with inserted=false.
    virtual io::Task<InsertResult> insertIfAbsent(
        std::string_view userId, std::string_view contentId, std::string_view contentType) = 0;

    virtual io::Task<bool> deleteIfExists(std::string_view userId, std::string_view contentId) = 0;

    /// Up to fetchLimit rows strictly after `after` (or from the head).
    virtual io::Task<std::vector<ListItem>> queryPage(
        std::string_view userId, std::optional<CursorPosition> after, int fetchLimit) = 0;

    virtual io::Task<bool> contentExists(std::string_view contentId, std::string_view contentType) = 0;
};

}  // namespace jcailloux::mylist

#endif  // JCX_MYLIST_BACKEND_LIST_STORE_H
