#pragma once

#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "animation/AnimationTypes.h"
#include "animation/Skeleton.h"

namespace fr {
namespace animation {

// Keyframe samplers. cacheIdx remembers the last segment to speed up forward
// playback; it is rewound automatically when time moves backwards. Sampling at
// or past the last key returns that key exactly.
glm::vec3 SampleVec3(const std::vector<KeyframeVec3>& keys, float time, size_t& cacheIdx);
glm::quat SampleQuat(const std::vector<KeyframeQuat>& keys, float time, size_t& cacheIdx);

// Wraps or clamps a clip-local time into [0, duration].
float WrapClipTime(float time, float duration, bool loop);

// Sampled local transform of one bone. Only the channels the track animates are set.
struct BoneSample {
    int BoneIndex = -1;
    bool HasPosition = false;
    bool HasRotation = false;
    glm::vec3 Position{0.0f};
    glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
};

// Per-clip sampling cursor, one entry per track.
struct ClipCursor {
    std::vector<size_t> PositionIdx;
    std::vector<size_t> RotationIdx;
};

// Samples every track of the clip whose bone exists in the skeleton. Tracks for
// unknown bones are skipped.
void EvaluateClip(const AnimationClip& clip,
                  float time,
                  const SkeletonComponent& skeleton,
                  std::vector<BoneSample>& outSamples,
                  ClipCursor* cursor = nullptr);

} // namespace animation
} // namespace fr
