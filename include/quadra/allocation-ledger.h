#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace quadra {

enum class GpuResource {
    Buffer,
    Texture,
};

const char* toString(GpuResource kind);

// Book-keeping behind GpuAllocator: live GPU resources by handle, with their
// label and byte size. Knows nothing about the graphics API.
class AllocationLedger {
public:
    struct Entry {
        std::string name;
        uint64_t size = 0;
        GpuResource kind = GpuResource::Buffer;
    };

    void add(const void* handle, std::string name, uint64_t size, GpuResource kind);

    // The removed entry, or nullopt for a handle that is not live
    std::optional<Entry> remove(const void* handle);

    uint64_t totalBytes() const { return _totalBytes; }
    uint64_t bytes(GpuResource kind) const;
    size_t liveCount() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    // Warn about every resource still alive; returns how many there were
    size_t reportLive(const std::string& owner) const;

private:
    std::unordered_map<const void*, Entry> _entries;
    uint64_t _totalBytes = 0;
};

} // namespace quadra
