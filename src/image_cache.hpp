#pragma once
#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <string>
#include <unordered_map>
#include <utility>

/// @brief FifoCache: bounded map evicting in insertion order.
/// Overwriting a key keeps its original position; reads do not refresh it.
template <class Value>
class FifoCache
{
public:
    using OnEvict = std::function<void(const std::string& key, Value& value)>;

    explicit FifoCache(std::size_t capacity, OnEvict onEvict = {})
        : _capacity{ capacity == 0 ? 1 : capacity }
        , _order{}
        , _items{}
        , _onEvict{ std::move(onEvict) }
    {
    }

    const Value* find(const std::string& key) const
    {
        auto it = _items.find(key);
        return it == _items.end() ? nullptr : &it->second.value;
    }

    bool contains(const std::string& key) const { return _items.contains(key); }

    void put(const std::string& key, Value value)
    {
        if (key.empty())
            return;
        if (auto it = _items.find(key); it != _items.end())
        {
            it->second.value = std::move(value);
            return;
        }
        if (_items.size() >= _capacity)
            evictOldest();
        _order.push_back(key);
        _items.emplace(key, Slot{ std::move(value), std::prev(_order.end()) });
    }

    bool erase(const std::string& key)
    {
        auto it = _items.find(key);
        if (it == _items.end())
            return false;
        _order.erase(it->second.pos);
        _items.erase(it);
        return true;
    }

    void clear()
    {
        if (_onEvict)
        {
            for (auto& kv : _items)
                _onEvict(kv.first, kv.second.value);
        }
        _items.clear();
        _order.clear();
    }

    std::size_t size() const { return _items.size(); }
    std::size_t capacity() const { return _capacity; }

private:
    struct Slot
    {
        Value value;
        std::list<std::string>::iterator pos;
    };

    void evictOldest()
    {
        if (_order.empty())
            return;
        auto it = _items.find(_order.front());
        if (it != _items.end())
        {
            if (_onEvict)
                _onEvict(it->first, it->second.value);
            _items.erase(it);
        }
        _order.pop_front();
    }

    std::size_t _capacity;
    std::list<std::string> _order;
    std::unordered_map<std::string, Slot> _items;
    OnEvict _onEvict;
};

// identity key -> "data:<mime>;base64,<payload>"
using ImageCache = FifoCache<std::string>;

constexpr std::size_t kImageCacheCapacity = 800;
