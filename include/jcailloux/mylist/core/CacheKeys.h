#ifndef JCX_MYLIST_CORE_CACHE_KEYS_H
#define JCX_MYLIST_CORE_CACHE_KEYS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <xxhash.h>

namespace jcailloux::mylist::keys {

// =============================================================================
// Cache key layout (shared with every other instance, keep stable)
//
//   mylist:{userId}:version
//   mylist:{userId}:page:{signature}:v{version}
//   mylist:lock:{userId}:{signature}
//
// signature: "head.l{limit}" for the first page, otherwise
//            "{XXH3-64(cursor) as 16 hex digits}.l{limit}"
// =============================================================================

[[nodiscard]] inline std::string cursorSignature(std::optional<std::string_view> cursor, int limit) {
    std::string sig;
    if (!cursor) {
        sig = "head";
    } else {
        static constexpr char hex[] = "0123456789abcdef";
        uint64_t h = XXH3_64bits(cursor->data(), cursor->size());
        sig.resize(16);
        for (int i = 15; i >= 0; --i) {
            sig[static_cast<size_t>(i)] = hex[h & 0xF];
            h >>= 4;
        }
    }
    sig += ".l";
    sig += std::to_string(limit);
    return sig;
}

[[nodiscard]] inline std::string version(std::string_view userId) {
    std::string key;
    key.reserve(userId.size() + 15);
    key += "mylist:";
    key += userId;
    key += ":version";
    return key;
}

[[nodiscard]] inline std::string page(std::string_view userId, std::string_view signature, int64_t version) {
    std::string key;
    key.reserve(userId.size() + signature.size() + 36);
    key += "mylist:";
    key += userId;
    key += ":page:";
    key += signature;
    key += ":v";
    key += std::to_string(version);
    return key;
}

[[nodiscard]] inline std::string lock(std::string_view userId, std::string_view signature) {
    std::string key;
    key.reserve(userId.size() + signature.size() + 13);
    key += "mylist:lock:";
    key += userId;
    key += ':';
    key += signature;
    return key;
}

}  // namespace jcailloux::mylist::keys

#endif  // JCX_MYLIST_CORE_CACHE_KEYS_H
