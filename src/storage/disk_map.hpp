#pragma once

#include "common/store_config.hpp"
#include "storage/error.hpp"
#include "storage/file_store.hpp"
#include "storage/key_codec.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace diskmap {

// ── DiskMap ──────────────────────────────────────────────────────────────────
//
// Persistent map from K to V where every entry is one file
// `<directory>/<KeyCodec<K>::to_string(key)>` holding the CBOR encoding of
// the value.  Values go through nlohmann::json, so any V with
// to_json/from_json (all standard containers, arithmetic types, strings,
// user types with NLOHMANN_DEFINE_TYPE_*) can be stored.
//
// Every operation returns an error_code from diskmap::Error; results come
// back through out-parameters.  Nothing here throws, except whatever the
// caller's own alter function throws.
//
// A DiskMap is a cheap value: copies share the same directory.  Concurrent
// use from many threads and processes is coordinated only through flock(2)
// advisory locks on the entry files (see FileStore).

template <typename K, typename V>
class DiskMap {
public:
    using key_type    = K;
    using mapped_type = V;
    using Codec       = KeyCodec<K>;

    DiskMap() = default;

    // ── Lifecycle ──────────────────────────────────────────────────────────

    // Creates the directory if needed and binds `out` to it.
    [[nodiscard]] static std::error_code open(
        const std::filesystem::path& directory,
        DiskMap& out,
        StoreOptions options = {})
    {
        return FileStore::open(directory, out.store_, std::move(options));
    }

    // Wipes the directory, then open().  Destroys every existing entry.
    [[nodiscard]] static std::error_code open_new(
        const std::filesystem::path& directory,
        DiskMap& out,
        StoreOptions options = {})
    {
        return FileStore::open_new(directory, out.store_, std::move(options));
    }

    // ── Single-entry operations ────────────────────────────────────────────

    // Create-only write; an existing key fails with CannotOpenFile.
    [[nodiscard]] std::error_code insert(const K& key, const V& value) const {
        FileStore::Bytes data;
        if (!encode(value, data)) return Error::CannotInsert;
        return store_.insert(Codec::to_string(key), data);
    }

    [[nodiscard]] std::error_code get(const K& key, V& out) const {
        FileStore::Bytes data;
        if (auto ec = store_.read(Codec::to_string(key), data)) return ec;
        if (!decode(data, out)) return Error::CannotReadFromFile;
        return {};
    }

    // Replaces the value of `key` with fn(old value) while holding the
    // entry's exclusive lock for the whole read-modify-write.
    template <typename F>
    [[nodiscard]] std::error_code alter(const K& key, F&& fn) const {
        return store_.alter(
            Codec::to_string(key),
            [&](const FileStore::Bytes& current, FileStore::Bytes& replacement) -> std::error_code {
                V value{};
                if (!decode(current, value)) return Error::CannotReadFromFile;
                if (!encode(std::invoke(fn, std::move(value)), replacement)) {
                    return Error::CannotAlterFile;
                }
                return {};
            });
    }

    // Blind replacement of an existing entry.  Absent key: CannotOpenFile.
    [[nodiscard]] std::error_code overwrite(const K& key, const V& value) const {
        FileStore::Bytes data;
        if (!encode(value, data)) return Error::CannotAlterFile;
        return store_.overwrite(Codec::to_string(key), data);
    }

    [[nodiscard]] std::error_code del(const K& key) const {
        return store_.remove(Codec::to_string(key));
    }

    // ── Collection operations ──────────────────────────────────────────────

    // Keys in directory enumeration order (unspecified).
    [[nodiscard]] std::error_code get_keys(std::vector<K>& out) const {
        out.clear();

        std::vector<std::string> names;
        if (auto ec = store_.list(names)) return ec;

        out.reserve(names.size());
        for (const auto& name : names) {
            try {
                out.push_back(Codec::from_string(name));
            } catch (const std::exception& e) {
                if (store_.options().strict_listing) {
                    store_.log().error("cannot decode key from '{}': {}", name, e.what());
                    return Error::CannotOpenDirectory;
                }
                store_.log().warn("skipping entry '{}': {}", name, e.what());
            }
        }
        return {};
    }

    [[nodiscard]] std::error_code contains_key(const K& key, bool& out) const {
        out = false;
        std::vector<K> keys;
        if (auto ec = get_keys(keys)) return ec;
        for (const auto& k : keys) {
            if (k == key) {
                out = true;
                break;
            }
        }
        return {};
    }

    [[nodiscard]] std::error_code len(std::size_t& out) const {
        out = 0;
        std::vector<K> keys;
        if (auto ec = get_keys(keys)) return ec;
        out = keys.size();
        return {};
    }

    // Every key with its current value.  Stops at the first failing get().
    [[nodiscard]] std::error_code as_vec(std::vector<std::pair<K, V>>& out) const {
        out.clear();
        std::vector<K> keys;
        if (auto ec = get_keys(keys)) return ec;

        out.reserve(keys.size());
        for (auto& key : keys) {
            V value{};
            if (auto ec = get(key, value)) return ec;
            out.emplace_back(std::move(key), std::move(value));
        }
        return {};
    }

    // Deletes every entry.  Stops at the first failing delete, which may
    // leave the store partially cleared.
    [[nodiscard]] std::error_code clear() const {
        std::vector<K> keys;
        if (auto ec = get_keys(keys)) return ec;
        for (const auto& key : keys) {
            if (auto ec = del(key)) return ec;
        }
        return {};
    }

    // Inserts `default_value` unless the key is already present (an
    // insert lost to a concurrent inserter counts as present), then alter().
    template <typename F>
    [[nodiscard]] std::error_code alter_with_default(
        const K& key, const V& default_value, F&& fn) const
    {
        FileStore::Bytes data;
        if (!encode(default_value, data)) return Error::CannotInsert;

        bool already_exists = false;
        if (auto ec = store_.insert(Codec::to_string(key), data, &already_exists)) {
            if (!already_exists) return ec;
        }
        return alter(key, std::forward<F>(fn));
    }

    // ── Accessors ──────────────────────────────────────────────────────────

    [[nodiscard]] const std::filesystem::path& directory() const { return store_.directory(); }
    [[nodiscard]] const FileStore& store() const { return store_; }

private:
    // Failures of user to_json/from_json count as encoding errors too.
    bool encode(const V& value, FileStore::Bytes& out) const {
        try {
            out = nlohmann::json::to_cbor(nlohmann::json(value));
            return true;
        } catch (const std::exception& e) {
            store_.log().warn("cannot encode value: {}", e.what());
            return false;
        }
    }

    bool decode(const FileStore::Bytes& data, V& out) const {
        try {
            out = nlohmann::json::from_cbor(data).template get<V>();
            return true;
        } catch (const std::exception& e) {
            store_.log().warn("cannot decode value: {}", e.what());
            return false;
        }
    }

    FileStore store_;
};

} // namespace diskmap
