#pragma once

#include <quadra/result.hpp>
#include <ytrace/ytrace.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace quadra {

// Fixed-capacity, append-only CPU arena mirroring one GPU storage buffer.
// push() hands out the index the shading core will use to address the record.
template<typename T>
class ElementStorage {
public:
    ElementStorage(std::string name, uint32_t capacity)
        : _name(std::move(name)), _capacity(capacity) {
        _items.reserve(capacity);
    }

    Result<uint32_t> push(const T& value) {
        if (_items.size() >= _capacity) {
            yerror("{}: unable to push, storage limit {} exceeded", _name, _capacity);
            return Err<uint32_t>(_name + ": storage limit " + std::to_string(_capacity) +
                                 " exceeded");
        }
        _items.push_back(value);
        return Ok(static_cast<uint32_t>(_items.size() - 1));
    }

    // Append a run of records; returns the index of the first one
    Result<uint32_t> extend(const T* values, uint32_t count) {
        if (_items.size() + count > _capacity) {
            yerror("{}: unable to extend by {}, storage limit {} exceeded", _name, count,
                   _capacity);
            return Err<uint32_t>(_name + ": storage limit " + std::to_string(_capacity) +
                                 " exceeded");
        }
        uint32_t first = static_cast<uint32_t>(_items.size());
        _items.insert(_items.end(), values, values + count);
        return Ok(first);
    }

    void clear() { _items.clear(); }

    bool empty() const { return _items.empty(); }
    uint32_t size() const { return static_cast<uint32_t>(_items.size()); }
    uint32_t capacity() const { return _capacity; }
    const T* data() const { return _items.data(); }
    const T& operator[](uint32_t index) const { return _items[index]; }

    uint64_t byteSize() const { return static_cast<uint64_t>(_items.size()) * sizeof(T); }
    uint64_t byteCapacity() const { return static_cast<uint64_t>(_capacity) * sizeof(T); }

private:
    std::string _name;
    uint32_t _capacity;
    std::vector<T> _items;
};

} // namespace quadra
