#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "adapter.hpp"

namespace portwire {

    using Clock = std::chrono::system_clock;

    struct MemoEntry {
        AdapterPtr adapter;
        Instance instance;
        Clock::time_point resolved_at;
        uint64_t resolution_order;
    };

    // Instance cache of one lifetime bucket (the singletons of a container or
    // the scoped instances of one scope). Remembers creation order for teardown.
    // Not synchronized; the owning container tree's mutex guards it.
    class MemoMap
    {
    public:
        MemoMap() = default;

        bool has(const std::string& port_name) const { return index_.count(port_name) != 0; }

        // nullptr when absent
        Instance find(const std::string& port_name) const;

        void put(AdapterPtr adapter, Instance instance, uint64_t resolution_order);

        // creation order
        const std::vector<MemoEntry>& entries() const { return entries_; }
        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

        // Hands every entry over to the caller and leaves the map empty.
        std::vector<MemoEntry> release();

    private:
        std::vector<MemoEntry> entries_;
        std::unordered_map<std::string, size_t> index_;
    }; // class MemoMap


    // Runs the finalizers of `entries` last-created first. A failing finalizer
    // does not stop the rest; every failure is returned.
    std::vector<FinalizerFailure> finalizeEntries(std::vector<MemoEntry> entries, const char* log_tag);

}; // namespace portwire
