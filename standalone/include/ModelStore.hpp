#pragma once
#include "ModelSnapshot.hpp"
#include <mutex>
#include <string>

namespace CropAdvisor {

constexpr const char* kForestArtifact = "forest.model";
constexpr const char* kTransformArtifact = "transform.cfg";
constexpr const char* kMetricsArtifact = "metrics.cfg";

class ModelStore {
public:
    ModelStore() = default;
    explicit ModelStore(SnapshotPtr initial) : active(std::move(initial)) {}
    ModelStore(const ModelStore&) = delete;
    ModelStore& operator=(const ModelStore&) = delete;

    // Latest published snapshot, or null before the first publish.
    [[nodiscard]] SnapshotPtr current() const;
    void publish(SnapshotPtr next);
    bool loaded() const { return current() != nullptr; }

    // Reads the three artifacts of one snapshot. Throws ModelLoadError.
    static SnapshotPtr loadArtifacts(const std::string& dir);
    // Writes dir/snapshot-<version>/ and repoints dir/current at it.
    static void saveArtifacts(const std::string& dir, const ModelSnapshot& snapshot);
    // Path of one artifact under dir/current, or directly under dir when
    // there is no current link.
    static std::string artifactPath(const std::string& dir, const char* name);

private:
    mutable std::mutex mu;
    SnapshotPtr active;
};

}  // namespace CropAdvisor
