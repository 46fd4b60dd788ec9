#include "animation/AnimationEvaluator.h"

#include <algorithm>
#include <cmath>

namespace fr {
namespace animation {

template<typename KeyContainer>
static size_t FindKeyframeIndex(const KeyContainer& keys, float time, size_t startIdx) {
    if (startIdx >= keys.size() || keys[startIdx].Time > time) startIdx = 0;
    // Fast-forward cached index until the next key's time is > time
    while (startIdx + 1 < keys.size() && keys[startIdx + 1].Time < time) {
        ++startIdx;
    }
    return startIdx;
}

glm::vec3 SampleVec3(const std::vector<KeyframeVec3>& keys, float time, size_t& cacheIdx) {
    if (keys.empty()) return glm::vec3(0.0f);
    if (keys.size() == 1 || time <= keys.front().Time) return keys.front().Value;
    if (time >= keys.back().Time) return keys.back().Value;

    cacheIdx = FindKeyframeIndex(keys, time, cacheIdx);

    const auto& k0 = keys[cacheIdx];
    if (cacheIdx + 1 == keys.size()) return k0.Value;

    const auto& k1 = keys[cacheIdx + 1];
    const float span = k1.Time - k0.Time;
    if (span <= 0.0f) return k1.Value;
    float t = (time - k0.Time) / span;
    return glm::mix(k0.Value, k1.Value, t);
}

glm::quat SampleQuat(const std::vector<KeyframeQuat>& keys, float time, size_t& cacheIdx) {
    if (keys.empty()) return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    if (keys.size() == 1 || time <= keys.front().Time) return keys.front().Value;
    if (time >= keys.back().Time) return keys.back().Value;

    cacheIdx = FindKeyframeIndex(keys, time, cacheIdx);

    const auto& k0 = keys[cacheIdx];
    if (cacheIdx + 1 == keys.size()) return k0.Value;

    const auto& k1 = keys[cacheIdx + 1];
    const float span = k1.Time - k0.Time;
    if (span <= 0.0f) return k1.Value;
    float t = (time - k0.Time) / span;
    return glm::slerp(k0.Value, k1.Value, t);
}

float WrapClipTime(float time, float duration, bool loop) {
    if (duration <= 0.0f) return 0.0f;
    if (loop) return std::fmod(std::fmod(time, duration) + duration, duration);
    return std::clamp(time, 0.0f, duration);
}

void EvaluateClip(const AnimationClip& clip,
                  float time,
                  const SkeletonComponent& skeleton,
                  std::vector<BoneSample>& outSamples,
                  ClipCursor* cursor) {
    outSamples.clear();
    outSamples.reserve(clip.Tracks.size());

    ClipCursor scratch;
    ClipCursor& ce = cursor ? *cursor : scratch;
    ce.PositionIdx.resize(clip.Tracks.size(), 0);
    ce.RotationIdx.resize(clip.Tracks.size(), 0);

    for (size_t i = 0; i < clip.Tracks.size(); ++i) {
        const BoneTrack& track = clip.Tracks[i];
        if (track.IsEmpty()) continue;

        int idx = skeleton.GetBoneIndex(track.BoneName);
        if (idx < 0) continue; // Not found in this skeleton

        BoneSample sample;
        sample.BoneIndex = idx;
        if (!track.PositionKeys.empty()) {
            sample.HasPosition = true;
            sample.Position = SampleVec3(track.PositionKeys, time, ce.PositionIdx[i]);
        }
        if (!track.RotationKeys.empty()) {
            sample.HasRotation = true;
            sample.Rotation = SampleQuat(track.RotationKeys, time, ce.RotationIdx[i]);
        }
        outSamples.push_back(sample);
    }
}

} // namespace animation
} // namespace fr
