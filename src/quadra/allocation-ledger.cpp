#include <quadra/allocation-ledger.h>
#include <ytrace/ytrace.hpp>

namespace quadra {

const char* toString(GpuResource kind) {
    switch (kind) {
        case GpuResource::Buffer:
            return "buffer";
        case GpuResource::Texture:
            return "texture";
    }
    return "resource";
}

void AllocationLedger::add(const void* handle, std::string name, uint64_t size,
                           GpuResource kind) {
    if (auto it = _entries.find(handle); it != _entries.end()) {
        // Same handle handed out twice: the old record is stale
        ywarn("AllocationLedger: {} '{}' re-registered as '{}'", toString(it->second.kind),
              it->second.name, name);
        _totalBytes -= it->second.size;
        _entries.erase(it);
    }
    _entries.emplace(handle, Entry{std::move(name), size, kind});
    _totalBytes += size;
}

std::optional<AllocationLedger::Entry> AllocationLedger::remove(const void* handle) {
    auto it = _entries.find(handle);
    if (it == _entries.end()) {
        return std::nullopt;
    }
    Entry entry = std::move(it->second);
    _entries.erase(it);
    _totalBytes -= entry.size;
    return entry;
}

uint64_t AllocationLedger::bytes(GpuResource kind) const {
    uint64_t total = 0;
    for (const auto& [handle, entry] : _entries) {
        if (entry.kind == kind) total += entry.size;
    }
    return total;
}

size_t AllocationLedger::reportLive(const std::string& owner) const {
    if (_entries.empty()) {
        return 0;
    }
    ywarn("{}: {} GPU resources still alive ({} bytes)", owner, _entries.size(), _totalBytes);
    for (const auto& [handle, entry] : _entries) {
        ywarn("  {:>8} {:>10} bytes  {}", toString(entry.kind), entry.size, entry.name);
    }
    return _entries.size();
}

} // namespace quadra
