#include "animation/BoneFrameResolver.h"

namespace fr {
namespace animation {

const BoneRestTransform* BoneFrameResolver::FindInitial(const std::string& boneName) const
{
    if (!m_InitialPose) return nullptr;
    auto it = m_InitialPose->find(boneName);
    return it != m_InitialPose->end() ? &it->second : nullptr;
}

void BoneFrameResolver::ForEachAnimatableBone(const std::function<void(const std::string&, const BoneRestTransform&)>& fn) const
{
    if (!m_Skeleton) return;
    for (const auto& name : m_Skeleton->BoneNames) {
        const BoneRestTransform* initial = FindInitial(name);
        if (!initial) continue; // helper bones the tables know nothing about
        fn(name, *initial);
    }
}

glm::quat BoneFrameResolver::LiveRotation(const std::string& boneName) const
{
    const int idx = m_Skeleton ? m_Skeleton->GetBoneIndex(boneName) : -1;
    if (idx >= 0) return m_Skeleton->LocalRotations[static_cast<size_t>(idx)];
    const BoneRestTransform* initial = FindInitial(boneName);
    return initial ? initial->Rotation : glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
}

glm::vec3 BoneFrameResolver::LivePosition(const std::string& boneName) const
{
    const int idx = m_Skeleton ? m_Skeleton->GetBoneIndex(boneName) : -1;
    if (idx >= 0) return m_Skeleton->LocalPositions[static_cast<size_t>(idx)];
    const BoneRestTransform* initial = FindInitial(boneName);
    return initial ? initial->Position : glm::vec3(0.0f);
}

StartPose BoneFrameResolver::CaptureLive() const
{
    StartPose snapshot;
    ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform&) {
        snapshot.Rotations[name] = LiveRotation(name);
    });
    return snapshot;
}

glm::quat BoneFrameResolver::StartRotation(const std::string& boneName, const StartPose* snapshot) const
{
    if (snapshot) {
        if (const glm::quat* q = snapshot->Find(boneName)) return *q;
    }
    const BoneRestTransform* initial = FindInitial(boneName);
    return initial ? initial->Rotation : glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
}

glm::quat BoneFrameResolver::BaseRotation(const std::string& boneName, const PoseTargetTable& table) const
{
    const PoseTarget* target = table.Find(boneName);
    if (target && target->RotationDegrees) return TargetRotation(*target);
    const BoneRestTransform* initial = FindInitial(boneName);
    return initial ? initial->Rotation : glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
}

EulerOrder BoneFrameResolver::OrderFor(const std::string& boneName, const PoseTargetTable& table)
{
    const PoseTarget* target = table.Find(boneName);
    return target ? target->Order : EulerOrder::XYZ;
}

glm::quat BoneFrameResolver::TargetRotation(const PoseTarget& target)
{
    if (!target.RotationDegrees) return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    return DegreesToQuat(*target.RotationDegrees, target.Order);
}

glm::quat BoneFrameResolver::EndRotation(const PoseTarget* target, const glm::quat& start)
{
    if (!target || !target->RotationDegrees) return start;
    return TargetRotation(*target);
}

glm::vec3 BoneFrameResolver::EndPosition(const std::string& boneName, const PoseTarget* target) const
{
    const BoneRestTransform* initial = FindInitial(boneName);
    const glm::vec3 base = initial ? initial->Position : glm::vec3(0.0f);
    if (!target || !target->PositionOffset) return base;
    return base + *target->PositionOffset;
}

} // namespace animation
} // namespace fr
