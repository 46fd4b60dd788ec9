#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "animation/RotationMath.h"

namespace fr {
namespace animation {

// Canonical bone names of the humanoid rig the tables are authored against.
namespace Bones {
    inline constexpr const char* Hip        = "Hip";
    inline constexpr const char* Pelvis     = "Pelvis";
    inline constexpr const char* Waist      = "Waist";
    inline constexpr const char* Spine01    = "Spine01";
    inline constexpr const char* Spine02    = "Spine02";
    inline constexpr const char* Neck       = "NeckTwist01";
    inline constexpr const char* Head       = "Head";
    inline constexpr const char* LClavicle  = "L_Clavicle";
    inline constexpr const char* LUpperarm  = "L_Upperarm";
    inline constexpr const char* LForearm   = "L_Forearm";
    inline constexpr const char* LHand      = "L_Hand";
    inline constexpr const char* RClavicle  = "R_Clavicle";
    inline constexpr const char* RUpperarm  = "R_Upperarm";
    inline constexpr const char* RForearm   = "R_Forearm";
    inline constexpr const char* RHand      = "R_Hand";
    inline constexpr const char* LThigh     = "L_Thigh";
    inline constexpr const char* LCalf      = "L_Calf";
    inline constexpr const char* LFoot      = "L_Foot";
    inline constexpr const char* LToe       = "L_ToeBase";
    inline constexpr const char* RThigh     = "R_Thigh";
    inline constexpr const char* RCalf      = "R_Calf";
    inline constexpr const char* RFoot      = "R_Foot";
    inline constexpr const char* RToe       = "R_ToeBase";
}

// Named bone sets shared by the pose tables and the clip synthesizer.
enum class BoneGroup {
    Breathing,      // spine, head, clavicles, upper arms
    Legs,           // both thighs, calves, feet
    LeftArm,
    RightArm,
    LeftLeg,
    RightLeg,
    PunchTorso,     // pelvis and spine twist into a punch
    Spine,
    Wave            // waving forearm/hand and the spine sway
};

const std::vector<std::string>& GetBoneGroup(BoneGroup group);
bool InBoneGroup(BoneGroup group, const std::string& boneName);

// Sparse target for one bone. Degrees are interpreted in Order.
struct PoseTarget {
    std::optional<glm::vec3> RotationDegrees;
    EulerOrder Order = EulerOrder::XYZ;
    std::optional<glm::vec3> PositionOffset; // added to the bone's initial local position
};

struct PoseTargetTable {
    std::string Name;
    std::unordered_map<std::string, PoseTarget> Targets;

    const PoseTarget* Find(const std::string& boneName) const {
        auto it = Targets.find(boneName);
        return it != Targets.end() ? &it->second : nullptr;
    }
    bool Empty() const { return Targets.empty(); }
};

enum class PoseTableId {
    Stance,
    Block,
    Duck,
    Hello,
    ArmsCrossed,
    BowArms,
    Fallen,
    RightPunchApex,
    LeftPunchApex,
    DuckKickApex
};

// Read-only registry of the hand-tuned tables.
const PoseTargetTable& GetPoseTable(PoseTableId id);
const char* ToString(PoseTableId id);
std::optional<PoseTableId> PoseTableIdFromString(const std::string& s);

} // namespace animation
} // namespace fr
