#pragma once

#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace fr {
namespace animation {

// -----------------------------
// Keyframe data structures
// -----------------------------
struct KeyframeVec3 {
    float Time = 0.0f;          // Seconds from start of clip
    glm::vec3 Value{0.0f};      // Value at Time
};

struct KeyframeQuat {
    float Time = 0.0f;          // Seconds from start of clip
    glm::quat Value{1.0f, 0.0f, 0.0f, 0.0f};
};

// -----------------------------
// Bone animation track
// -----------------------------
struct BoneTrack {
    std::string BoneName;
    std::vector<KeyframeVec3> PositionKeys;
    std::vector<KeyframeQuat> RotationKeys;

    bool IsEmpty() const {
        return PositionKeys.empty() && RotationKeys.empty();
    }
};

// -----------------------------
// Synthesized skeletal clip
// -----------------------------
// Tracks keep the skeleton's bone order so evaluation writes bones in a stable
// sequence. Key times within a track are non-decreasing.
struct AnimationClip {
    std::string Name;
    float Duration = 0.0f;                // Seconds
    std::vector<BoneTrack> Tracks;

    const BoneTrack* FindTrack(const std::string& boneName) const {
        for (const auto& t : Tracks) if (t.BoneName == boneName) return &t;
        return nullptr;
    }
    BoneTrack* FindTrack(const std::string& boneName) {
        for (auto& t : Tracks) if (t.BoneName == boneName) return &t;
        return nullptr;
    }
    bool Empty() const { return Tracks.empty(); }
};

} // namespace animation
} // namespace fr
