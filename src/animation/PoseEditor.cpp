#include "animation/PoseEditor.h"

#include "animation/RotationMath.h"
#include "utils/Logger.h"

namespace fr {
namespace animation {

PoseEditor::PoseEditor(SkeletonComponent& skeleton, const InitialPose& initialPose, const AnimationMixer* mixer)
    : m_Skeleton(&skeleton), m_InitialPose(&initialPose), m_Mixer(mixer)
{
}

std::optional<glm::vec3> PoseEditor::GetBoneDegrees(const std::string& boneName, EulerOrder order) const
{
    const int idx = m_Skeleton->GetBoneIndex(boneName);
    if (idx < 0) return std::nullopt;
    return QuatToDegrees(m_Skeleton->LocalRotations[static_cast<size_t>(idx)], order);
}

bool PoseEditor::SetBoneDegrees(const std::string& boneName, const glm::vec3& degrees, EulerOrder order)
{
    if (!CanEdit()) {
        Logger::LogWarning("[PoseEditor] Rig is animated, edit of '" + boneName + "' ignored.");
        return false;
    }
    const int idx = m_Skeleton->GetBoneIndex(boneName);
    if (idx < 0) return false;
    m_Skeleton->LocalRotations[static_cast<size_t>(idx)] = DegreesToQuat(degrees, order);
    return true;
}

bool PoseEditor::ApplyTable(const PoseTargetTable& table)
{
    if (!CanEdit()) {
        Logger::LogWarning("[PoseEditor] Rig is animated, table '" + table.Name + "' not applied.");
        return false;
    }
    for (size_t i = 0; i < m_Skeleton->BoneNames.size(); ++i) {
        auto it = m_InitialPose->find(m_Skeleton->BoneNames[i]);
        if (it == m_InitialPose->end()) continue;
        const BoneRestTransform& initial = it->second;

        const PoseTarget* target = table.Find(m_Skeleton->BoneNames[i]);
        m_Skeleton->LocalRotations[i] = (target && target->RotationDegrees)
            ? DegreesToQuat(*target->RotationDegrees, target->Order)
            : initial.Rotation;
        m_Skeleton->LocalPositions[i] = (target && target->PositionOffset)
            ? initial.Position + *target->PositionOffset
            : initial.Position;
    }
    Logger::Log("[PoseEditor] Applied table '" + table.Name + "'.");
    return true;
}

PoseTargetTable PoseEditor::ExportTable(const std::string& name, const std::vector<std::string>& bones, EulerOrder order) const
{
    PoseTargetTable table;
    table.Name = name;
    for (const auto& bone : bones) {
        auto degrees = GetBoneDegrees(bone, order);
        if (!degrees) continue;
        PoseTarget target;
        target.RotationDegrees = *degrees;
        target.Order = order;

        const int idx = m_Skeleton->GetBoneIndex(bone);
        auto it = m_InitialPose->find(bone);
        if (it != m_InitialPose->end()) {
            const glm::vec3 offset = m_Skeleton->LocalPositions[static_cast<size_t>(idx)] - it->second.Position;
            if (glm::length(offset) > 1e-5f) target.PositionOffset = offset;
        }
        table.Targets[bone] = target;
    }
    return table;
}

} // namespace animation
} // namespace fr
