#include "memo_map.hpp"

#include <algorithm>

#include "logging.hpp"

namespace portwire {

Instance MemoMap::find(const std::string& port_name) const
{
    auto it = index_.find(port_name);
    if (it == index_.end()) return nullptr;
    return entries_[it->second].instance;
}

void MemoMap::put(AdapterPtr adapter, Instance instance, uint64_t resolution_order)
{
    const auto& name = adapter->portName();
    if (has(name)) return;

    index_.emplace(name, entries_.size());
    entries_.push_back(MemoEntry{ std::move(adapter), std::move(instance), Clock::now(), resolution_order });
}

std::vector<MemoEntry> MemoMap::release()
{
    std::vector<MemoEntry> released;
    released.swap(entries_);
    index_.clear();
    return released;
}

std::vector<FinalizerFailure> finalizeEntries(std::vector<MemoEntry> entries, const char* log_tag)
{
    std::sort(entries.begin(), entries.end(), [](const MemoEntry& a, const MemoEntry& b) {
        return a.resolution_order < b.resolution_order;
    });

    std::vector<FinalizerFailure> failures;
    while (!entries.empty()) {
        auto entry = std::move(entries.back());
        entries.pop_back();
        if (!entry.adapter->hasFinalizer()) continue;

        const auto& name = entry.adapter->portName();
        try {
            entry.adapter->finalize(entry.instance);
        } catch (const std::exception& e) {
            LOG_ERROR(log_tag, "finalizer for '{}' failed: {}", name, e.what());
            failures.push_back(FinalizerFailure{ name, e.what() });
        } catch (...) {
            LOG_ERROR(log_tag, "finalizer for '{}' failed: unknown exception", name);
            failures.push_back(FinalizerFailure{ name, "unknown exception" });
        }
    }
    return failures;
}

} // namespace portwire
