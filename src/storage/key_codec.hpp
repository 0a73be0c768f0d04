#pragma once

#include <charconv>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace diskmap {

// ── KeyCodec ─────────────────────────────────────────────────────────────────
//
// Customisation point turning a key into the file name of its entry and back.
// Specialise for every key type used with DiskMap:
//
//   template <>
//   struct diskmap::KeyCodec<Point> {
//       static std::string to_string(const Point& p);
//       static Point from_string(const std::string& s);
//   };
//
// to_string() must be deterministic and injective and must not produce '/'
// or NUL.  from_string() is only ever called on names that to_string()
// produced; it may throw on anything else, and such entries are treated as
// foreign by DiskMap::get_keys().

template <typename K, typename Enable = void>
struct KeyCodec;

template <>
struct KeyCodec<std::string> {
    static std::string to_string(const std::string& key) { return key; }
    static std::string from_string(const std::string& s) { return s; }
};

template <typename K>
struct KeyCodec<K, std::enable_if_t<std::is_integral_v<K> && !std::is_same_v<K, bool>>> {
    static std::string to_string(K key) { return std::to_string(key); }

    static K from_string(const std::string& s) {
        K value{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            throw std::invalid_argument("not an integer key: '" + s + "'");
        }
        return value;
    }
};

} // namespace diskmap
