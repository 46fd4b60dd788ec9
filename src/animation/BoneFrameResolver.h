#pragma once

#include <functional>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "animation/PoseTables.h"
#include "animation/Skeleton.h"

namespace fr {
namespace animation {

// Resolves the orientation a bone is animated from (bind pose, a captured
// snapshot or the live rig) and the orientation a pose table asks it to reach.
// Bones without an InitialPose entry are invisible to every query.
class BoneFrameResolver {
public:
    BoneFrameResolver(const SkeletonComponent* skeleton, const InitialPose* initialPose)
        : m_Skeleton(skeleton), m_InitialPose(initialPose) {}

    bool IsValid() const { return m_Skeleton && m_InitialPose && !m_InitialPose->empty(); }

    const BoneRestTransform* FindInitial(const std::string& boneName) const;
    bool IsAnimatable(const std::string& boneName) const { return FindInitial(boneName) != nullptr; }

    // Visits skeleton bones in hierarchy order, skipping bones with no initial data.
    void ForEachAnimatableBone(const std::function<void(const std::string&, const BoneRestTransform&)>& fn) const;

    glm::quat LiveRotation(const std::string& boneName) const;
    glm::vec3 LivePosition(const std::string& boneName) const;
    StartPose CaptureLive() const;

    // Snapshot value when the snapshot has the bone, else the initial rotation.
    glm::quat StartRotation(const std::string& boneName, const StartPose* snapshot) const;

    // Table rotation when the table lists a rotation for the bone, else the initial rotation.
    glm::quat BaseRotation(const std::string& boneName, const PoseTargetTable& table) const;

    // Euler order a bone is edited in for a table: the table entry's order, else XYZ.
    static EulerOrder OrderFor(const std::string& boneName, const PoseTargetTable& table);

    static glm::quat TargetRotation(const PoseTarget& target);
    static glm::quat EndRotation(const PoseTarget* target, const glm::quat& start);
    glm::vec3 EndPosition(const std::string& boneName, const PoseTarget* target) const;

private:
    const SkeletonComponent* m_Skeleton = nullptr;
    const InitialPose* m_InitialPose = nullptr;
};

} // namespace animation
} // namespace fr
