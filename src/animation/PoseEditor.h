#pragma once

#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "animation/AnimationMixer.h"
#include "animation/PoseTables.h"
#include "animation/Skeleton.h"

namespace fr {
namespace animation {

// Manual pose authoring on the live rig. Writes are refused while any mixer
// action still drives the skeleton so edits are never overwritten mid-frame;
// PoseStateMachine::Release() stops the mixer for editing.
class PoseEditor {
public:
    PoseEditor(SkeletonComponent& skeleton, const InitialPose& initialPose, const AnimationMixer* mixer = nullptr);

    bool CanEdit() const { return !m_Mixer || m_Mixer->IsIdle(); }

    std::optional<glm::vec3> GetBoneDegrees(const std::string& boneName, EulerOrder order) const;
    bool SetBoneDegrees(const std::string& boneName, const glm::vec3& degrees, EulerOrder order);

    // Poses the whole rig statically: listed bones take the table target,
    // every other known bone returns to its initial transform.
    bool ApplyTable(const PoseTargetTable& table);

    // Captures the listed bones' current rotations as a new sparse table.
    PoseTargetTable ExportTable(const std::string& name, const std::vector<std::string>& bones, EulerOrder order) const;

private:
    SkeletonComponent* m_Skeleton = nullptr;
    const InitialPose* m_InitialPose = nullptr;
    const AnimationMixer* m_Mixer = nullptr;
};

} // namespace animation
} // namespace fr
