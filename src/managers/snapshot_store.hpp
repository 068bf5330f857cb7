#pragma once

#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <filesystem>
#include <core/types.hpp>
#include <cloud/instance.hpp>

namespace fs = std::filesystem;

// What survives between sessions: the last confirmed instance list and the
// user's pins. Overlays and miss counters are session-local and not saved.
struct PersistedSnapshot {
    std::chrono::system_clock::time_point saved_at{};
    std::vector<Instance> instances;
    std::set<InstanceKey> pinned;
};

class SnapshotStore {
public:
    explicit SnapshotStore(fs::path path);

    // Missing or corrupt file yields an empty snapshot.
    PersistedSnapshot load() const;
    Result<void> save(const PersistedSnapshot& snapshot) const;

    const fs::path& path() const { return state_path_; }

private:
    fs::path state_path_;
};
