#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace fr {
namespace animation {

// ------------ Skeleton (host-owned) ------------
// The host renderer owns the rig; the animation core only reads bone names and
// writes local rotation/position.
struct SkeletonComponent {
    std::vector<std::string> BoneNames;
    std::vector<int> BoneParents; // index of parent bone (-1 for root)

    // Live local transform, index matches BoneNames
    std::vector<glm::vec3> LocalPositions;
    std::vector<glm::quat> LocalRotations;
    std::vector<glm::vec3> LocalScales;

    // Name -> index lookup to enable fast sampling.
    std::unordered_map<std::string, int> BoneNameToIndex;

    int AddBone(const std::string& name, int parent,
                const glm::vec3& position = glm::vec3(0.0f),
                const glm::quat& rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f),
                const glm::vec3& scale = glm::vec3(1.0f));

    int GetBoneIndex(const std::string& name) const {
        auto it = BoneNameToIndex.find(name);
        return it != BoneNameToIndex.end() ? it->second : -1;
    }
    size_t BoneCount() const { return BoneNames.size(); }
};

// Rest transform of a single bone, captured once at load.
struct BoneRestTransform {
    glm::vec3 Position{0.0f};
    glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
    glm::vec3 Scale{1.0f};
};

using InitialPose = std::unordered_map<std::string, BoneRestTransform>;

// Runtime bone -> quaternion snapshot (captured stance pose or live pose).
struct StartPose {
    std::unordered_map<std::string, glm::quat> Rotations;

    const glm::quat* Find(const std::string& boneName) const {
        auto it = Rotations.find(boneName);
        return it != Rotations.end() ? &it->second : nullptr;
    }
    bool Empty() const { return Rotations.empty(); }
};

InitialPose CaptureInitialPose(const SkeletonComponent& skeleton);
StartPose CapturePoseSnapshot(const SkeletonComponent& skeleton);

} // namespace animation
} // namespace fr
