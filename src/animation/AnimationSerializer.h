#pragma once

#include "animation/AnimationTypes.h"
#include "animation/PoseTables.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fr {
namespace animation {

using json = nlohmann::json;

json SerializeKeyframe(const KeyframeVec3& kf);
json SerializeKeyframe(const KeyframeQuat& kf);

KeyframeVec3  DeserializeKeyframeVec3(const json& j);
KeyframeQuat  DeserializeKeyframeQuat(const json& j);

json SerializeAnimationClip(const AnimationClip& clip);
AnimationClip DeserializeAnimationClip(const json& j);

bool SaveAnimationClip(const AnimationClip& clip, const std::string& path);
// Empty clip when the file is missing or malformed.
AnimationClip LoadAnimationClip(const std::string& path);

// Pose target tables: { "name": ..., "targets": { bone: { "rot": [x,y,z], "order": "XYZ", "pos": [x,y,z] } } }
json SerializePoseTable(const PoseTargetTable& table);
PoseTargetTable DeserializePoseTable(const json& j);

bool SavePoseTable(const PoseTargetTable& table, const std::string& path);
std::optional<PoseTargetTable> LoadPoseTable(const std::string& path);

} // namespace animation
} // namespace fr
