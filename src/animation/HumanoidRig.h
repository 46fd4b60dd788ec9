#pragma once

#include "animation/Skeleton.h"

namespace fr {
namespace animation {

struct HumanoidRigOptions {
    // Adds twist/IK helper bones that carry no pose data, the way exported
    // character rigs usually do.
    bool IncludeHelperBones = false;
};

// Reference humanoid using the bone names the pose tables address. The rest
// pose is not identity: legs point down (thighs rolled 180 degrees about Y)
// and the arms hang from the clavicles.
SkeletonComponent BuildReferenceHumanoid(const HumanoidRigOptions& options = HumanoidRigOptions{});

// Names of the helper bones BuildReferenceHumanoid can add.
const std::vector<std::string>& ReferenceHelperBones();

} // namespace animation
} // namespace fr
