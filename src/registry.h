// registry.h
#pragma once
#include <cstddef>
#include <limits>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.h"

namespace vrpeasy
{

// Error codes and limits of one registry kind.
struct RegistryTraits
{
    const char *key_field;
    ModelErrorCode duplicate_key;
    ModelErrorCode missing_key;
    ModelErrorCode empty;
    std::size_t capacity = std::numeric_limits<std::size_t>::max();
};

// Insertion-ordered map from key to entity. Value must expose key() returning
// something comparable with Key and to_json(bool debug).
template <typename Key, typename Value>
class Registry
{
public:
    explicit Registry(RegistryTraits traits) : traits_(traits) {}

    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    std::size_t capacity() const { return traits_.capacity; }
    bool contains(const Key &key) const { return index_.count(key) != 0; }

    // Rejects a value stored under another key than its own, a duplicate key
    // and an insertion beyond capacity.
    void insert(const Key &key, Value value)
    {
        check_key(key, value);
        if (contains(key))
            throw ModelError(traits_.duplicate_key, describe(key));
        if (values_.size() + 1 > traits_.capacity)
        {
            throw ValidationError(traits_.key_field, ValidationKind::kCapacity,
                                  "registry cannot hold more than " + std::to_string(traits_.capacity) +
                                      " entries");
        }
        index_.emplace(key, values_.size());
        values_.push_back(std::move(value));
    }

    void erase(const Key &key)
    {
        auto it = index_.find(key);
        if (it == index_.end())
            throw ModelError(traits_.missing_key, describe(key));
        const std::size_t pos = it->second;
        index_.erase(it);
        values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(pos));
        for (auto &kv : index_)
        {
            if (kv.second > pos)
                --kv.second;
        }
    }

    const Value &at(const Key &key) const
    {
        auto it = index_.find(key);
        if (it == index_.end())
            throw ModelError(traits_.missing_key, describe(key));
        return values_[it->second];
    }

    // Field assignment on a stored value. The edit runs on a copy, which
    // replaces the stored value only if every setter succeeded and the key is
    // unchanged.
    template <typename Edit>
    void update(const Key &key, Edit edit)
    {
        auto it = index_.find(key);
        if (it == index_.end())
            throw ModelError(traits_.missing_key, describe(key));
        Value edited = values_[it->second];
        edit(edited);
        check_key(key, edited);
        values_[it->second] = std::move(edited);
    }

    typename std::vector<Value>::const_iterator begin() const { return values_.begin(); }
    typename std::vector<Value>::const_iterator end() const { return values_.end(); }

    // Wire form of every value in insertion order. An empty registry is a
    // modeling error at this point.
    nlohmann::json materialize(bool debug = false) const
    {
        if (values_.empty())
            throw ModelError(traits_.empty);
        nlohmann::json out = nlohmann::json::array();
        for (const auto &v : values_)
            out.push_back(v.to_json(debug));
        return out;
    }

private:
    void check_key(const Key &key, const Value &value) const
    {
        if (!(value.key() == key))
        {
            throw ValidationError(traits_.key_field, ValidationKind::kKeyMismatch,
                                  "of the value (" + describe(value.key()) +
                                      ") differs from its registry key (" + describe(key) + ")");
        }
    }

    template <typename K>
    static std::string describe(const K &key)
    {
        std::ostringstream out;
        out << key;
        return out.str();
    }

    RegistryTraits traits_;
    std::vector<Value> values_;
    std::unordered_map<Key, std::size_t> index_;
};

} // namespace vrpeasy
