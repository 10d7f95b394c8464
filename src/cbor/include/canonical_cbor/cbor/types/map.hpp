#pragma once

#include <canonical_cbor/cbor/detail.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ccb {

// Key/value pairs in insertion order. Keys are not sorted or deduplicated
// here; canonical ordering and the duplicate check happen when the map is
// encoded.
template <typename TCborValue>
class basic_cbor_map {
public:
    using pair_type = std::pair<TCborValue, TCborValue>;

    basic_cbor_map() {}

    basic_cbor_map(std::initializer_list<pair_type> list)
        : _pairs(list.begin(), list.end()) {}

    explicit basic_cbor_map(std::vector<pair_type> pairs)
        : _pairs(std::move(pairs)) {}

    static constexpr uint8_t major_type() { return CBOR_MAP; }

    void push_back(TCborValue key, TCborValue value) {
        _pairs.emplace_back(std::move(key), std::move(value));
    }

    size_t size() const { return _pairs.size(); }

    const std::vector<pair_type>& pairs() const { return _pairs; }

    // Hands the pairs over to the caller, leaving this map empty
    std::vector<pair_type> release() && { return std::exchange(_pairs, {}); }

    // Lookups return the first pair whose key matches
    template <typename TKey>
    TCborValue& operator[](TKey&& key) {
        auto it = _find(key);
        if (it != _pairs.end()) {
            return it->second;
        }

        return _pairs.emplace_back(TCborValue{std::forward<TKey>(key)}, TCborValue{}).second;
    }

    template <typename TValue, typename TKey>
    TValue at(TKey&& key) const { return static_cast<TValue>(at(std::forward<TKey>(key))); }

    template <typename TKey>
    const TCborValue& at(TKey&& key) const {
        auto it = _find(key);
        if (it == _pairs.cend()) {
            throw std::out_of_range("Key not found in CBOR map");
        }

        return it->second;
    }

    template <typename TValue = TCborValue, typename TKey = TCborValue>
    std::optional<TValue> try_at(TKey&& key) const {
        auto it = _find(key);
        return it == _pairs.cend()
            ? std::optional<TValue>{}
            : std::optional<TValue>{static_cast<TValue>(it->second)};
    }

    std::vector<TCborValue> keys() const {
        std::vector<TCborValue> keys;
        for (const auto& item : _pairs) {
            keys.push_back(item.first);
        }

        return keys;
    }

    bool operator==(const basic_cbor_map<TCborValue>& rhs) const { return _pairs == rhs._pairs; }

    std::string dump_debug() const {
        std::stringstream ss;
        dump_debug(ss);
        return ss.str();
    }

    void dump_debug(std::stringstream& ss) const {
        ss << '{';

        bool first = true;
        for (auto&& pair : _pairs) {
            if (!first) {
                ss << ", ";
            }

            pair.first.dump_debug(ss);
            ss << ": ";
            pair.second.dump_debug(ss);

            first = false;
        }

        ss << '}';
    }

private:
    std::vector<pair_type> _pairs;

    template <typename TKey>
    auto _find(const TKey& key) {
        return std::find_if(_pairs.begin(), _pairs.end(), [&](const pair_type& pair) { return pair.first == key; });
    }

    template <typename TKey>
    auto _find(const TKey& key) const {
        return std::find_if(_pairs.cbegin(), _pairs.cend(), [&](const pair_type& pair) { return pair.first == key; });
    }
};

class cbor_value;
using cbor_map = basic_cbor_map<cbor_value>;

}  // namespace ccb
