#include "animation/Skeleton.h"

namespace fr {
namespace animation {

int SkeletonComponent::AddBone(const std::string& name, int parent,
                               const glm::vec3& position,
                               const glm::quat& rotation,
                               const glm::vec3& scale)
{
    const int index = static_cast<int>(BoneNames.size());
    BoneNames.push_back(name);
    BoneParents.push_back(parent);
    LocalPositions.push_back(position);
    LocalRotations.push_back(rotation);
    LocalScales.push_back(scale);
    BoneNameToIndex[name] = index;
    return index;
}

InitialPose CaptureInitialPose(const SkeletonComponent& skeleton)
{
    InitialPose pose;
    for (size_t i = 0; i < skeleton.BoneNames.size(); ++i) {
        BoneRestTransform rest;
        rest.Position = skeleton.LocalPositions[i];
        rest.Rotation = skeleton.LocalRotations[i];
        rest.Scale = skeleton.LocalScales[i];
        pose[skeleton.BoneNames[i]] = rest;
    }
    return pose;
}

StartPose CapturePoseSnapshot(const SkeletonComponent& skeleton)
{
    StartPose snapshot;
    for (size_t i = 0; i < skeleton.BoneNames.size(); ++i) {
        snapshot.Rotations[skeleton.BoneNames[i]] = skeleton.LocalRotations[i];
    }
    return snapshot;
}

} // namespace animation
} // namespace fr
