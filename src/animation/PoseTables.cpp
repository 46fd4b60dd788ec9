#include "animation/PoseTables.h"

#include <algorithm>

namespace fr {
namespace animation {

namespace {
PoseTarget rot(float x, float y, float z, EulerOrder order)
{
    PoseTarget t;
    t.RotationDegrees = glm::vec3(x, y, z);
    t.Order = order;
    return t;
}

PoseTarget offset(float x, float y, float z)
{
    PoseTarget t;
    t.PositionOffset = glm::vec3(x, y, z);
    return t;
}

constexpr EulerOrder XYZ = EulerOrder::XYZ;
constexpr EulerOrder YXZ = EulerOrder::YXZ;

// -----------------------------
// Hand-tuned tables (degrees). Captured from the pose editor; keep the
// numbers exactly as authored.
// -----------------------------
PoseTargetTable makeStance()
{
    PoseTargetTable t; t.Name = "stance";
    // Arms
    t.Targets[Bones::LUpperarm] = rot(-6, -44, -76, XYZ);
    t.Targets[Bones::LForearm]  = rot(102, -22, -34, XYZ);
    t.Targets[Bones::RUpperarm] = rot(-51, 32, 107, XYZ);
    t.Targets[Bones::RForearm]  = rot(51, 13, 72, XYZ);
    // Legs
    t.Targets[Bones::LThigh]    = rot(2, 180, -173, YXZ);
    t.Targets[Bones::LCalf]     = rot(-6, 11, -9, YXZ);
    t.Targets[Bones::RThigh]    = rot(30, 166, 167, YXZ);
    t.Targets[Bones::RCalf]     = rot(5, -21, -2, YXZ);
    return t;
}

PoseTargetTable makeBlock()
{
    PoseTargetTable t; t.Name = "block";
    t.Targets[Bones::LUpperarm] = rot(-15, -85, -68, XYZ);
    t.Targets[Bones::LForearm]  = rot(0, -5, -95, XYZ);
    t.Targets[Bones::LHand]     = rot(0, -13, 0, XYZ);
    t.Targets[Bones::RUpperarm] = rot(112, 41, -15, XYZ);
    t.Targets[Bones::RForearm]  = rot(138, 69, -95, XYZ);
    t.Targets[Bones::RHand]     = rot(0, 0, 0, XYZ);
    return t;
}

PoseTargetTable makeDuck()
{
    PoseTargetTable t; t.Name = "duck";
    // Lowers the whole rig
    t.Targets[Bones::Hip]       = offset(0.0f, -0.25f, 0.0f);
    t.Targets[Bones::Spine01]   = rot(18, 0, 0, XYZ);
    t.Targets[Bones::Spine02]   = rot(10, 0, 0, XYZ);
    t.Targets[Bones::Head]      = rot(-20, 0, 0, XYZ);
    t.Targets[Bones::LUpperarm] = rot(-20, -50, -80, XYZ);
    t.Targets[Bones::LForearm]  = rot(110, -25, -40, XYZ);
    t.Targets[Bones::RUpperarm] = rot(-60, 35, 110, XYZ);
    t.Targets[Bones::RForearm]  = rot(60, 15, 80, XYZ);
    t.Targets[Bones::LThigh]    = rot(60, 180, -173, YXZ);
    t.Targets[Bones::LCalf]     = rot(-100, 11, -9, YXZ);
    t.Targets[Bones::LFoot]     = rot(30, 0, 0, YXZ);
    t.Targets[Bones::RThigh]    = rot(75, 166, 167, YXZ);
    t.Targets[Bones::RCalf]     = rot(-95, -21, -2, YXZ);
    t.Targets[Bones::RFoot]     = rot(25, 0, 0, YXZ);
    return t;
}

PoseTargetTable makeHello()
{
    PoseTargetTable t; t.Name = "hello";
    t.Targets[Bones::RUpperarm] = rot(-10, 20, 160, XYZ);
    t.Targets[Bones::RForearm]  = rot(0, 0, 35, XYZ);
    t.Targets[Bones::RHand]     = rot(0, 0, 0, XYZ);
    t.Targets[Bones::Spine01]   = rot(0, -6, 0, XYZ);
    t.Targets[Bones::Head]      = rot(-5, 8, 0, XYZ);
    return t;
}

PoseTargetTable makeArmsCrossed()
{
    PoseTargetTable t; t.Name = "armsCrossed";
    t.Targets[Bones::LUpperarm] = rot(-30, -60, -70, XYZ);
    t.Targets[Bones::LForearm]  = rot(150, -40, -90, XYZ);
    t.Targets[Bones::LHand]     = rot(0, -10, 0, XYZ);
    t.Targets[Bones::RUpperarm] = rot(-35, 60, 72, XYZ);
    t.Targets[Bones::RForearm]  = rot(145, 45, 95, XYZ);
    t.Targets[Bones::RHand]     = rot(0, 10, 0, XYZ);
    t.Targets[Bones::Head]      = rot(-4, 0, 0, XYZ);
    return t;
}

PoseTargetTable makeBowArms()
{
    PoseTargetTable t; t.Name = "bowArms";
    t.Targets[Bones::LUpperarm] = rot(0, -10, -75, XYZ);
    t.Targets[Bones::LForearm]  = rot(20, 0, -10, XYZ);
    t.Targets[Bones::LHand]     = rot(0, 0, 0, XYZ);
    t.Targets[Bones::RUpperarm] = rot(0, 10, 75, XYZ);
    t.Targets[Bones::RForearm]  = rot(20, 0, 10, XYZ);
    t.Targets[Bones::RHand]     = rot(0, 0, 0, XYZ);
    return t;
}

PoseTargetTable makeFallen()
{
    PoseTargetTable t; t.Name = "fallen";
    t.Targets[Bones::Hip]       = rot(-80, 0, 0, XYZ);
    t.Targets[Bones::Spine01]   = rot(-10, 0, 0, XYZ);
    t.Targets[Bones::Spine02]   = rot(-5, 0, 0, XYZ);
    t.Targets[Bones::Head]      = rot(25, 0, 0, XYZ);
    t.Targets[Bones::LUpperarm] = rot(10, -20, -30, XYZ);
    t.Targets[Bones::LForearm]  = rot(0, 0, -15, XYZ);
    t.Targets[Bones::RUpperarm] = rot(10, 20, 30, XYZ);
    t.Targets[Bones::RForearm]  = rot(0, 0, 15, XYZ);
    t.Targets[Bones::LThigh]    = rot(-20, 180, -170, YXZ);
    t.Targets[Bones::LCalf]     = rot(-15, 11, -9, YXZ);
    t.Targets[Bones::RThigh]    = rot(-10, 166, 170, YXZ);
    t.Targets[Bones::RCalf]     = rot(-25, -21, -2, YXZ);
    return t;
}

// Punch apex: absolute targets for the punching and guard arms.
PoseTargetTable makeRightPunchApex()
{
    PoseTargetTable t; t.Name = "rightPunchApex";
    t.Targets[Bones::RUpperarm] = rot(33, 80, 68, XYZ);
    t.Targets[Bones::RForearm]  = rot(121, -107, 108, XYZ);
    t.Targets[Bones::RHand]     = rot(-15, 67, -17, XYZ);
    t.Targets[Bones::LUpperarm] = rot(15, -40, -72, XYZ);
    t.Targets[Bones::LForearm]  = rot(173, 66, -55, XYZ);
    t.Targets[Bones::LHand]     = rot(0, 0, 0, XYZ);
    return t;
}

// Mirror of the right punch across the sagittal plane: (x, -y, -z).
PoseTargetTable makeLeftPunchApex()
{
    PoseTargetTable t; t.Name = "leftPunchApex";
    t.Targets[Bones::LUpperarm] = rot(33, -80, -68, XYZ);
    t.Targets[Bones::LForearm]  = rot(121, 107, -108, XYZ);
    t.Targets[Bones::LHand]     = rot(-15, -67, 17, XYZ);
    t.Targets[Bones::RUpperarm] = rot(15, 40, 72, XYZ);
    t.Targets[Bones::RForearm]  = rot(173, -66, 55, XYZ);
    t.Targets[Bones::RHand]     = rot(0, 0, 0, XYZ);
    return t;
}

PoseTargetTable makeDuckKickApex()
{
    PoseTargetTable t; t.Name = "duckKickApex";
    t.Targets[Bones::RThigh]    = rot(-70, 166, 167, YXZ);
    t.Targets[Bones::RCalf]     = rot(5, -21, -2, YXZ);
    t.Targets[Bones::RFoot]     = rot(20, 0, 0, YXZ);
    return t;
}

std::vector<std::string> names(std::initializer_list<const char*> list)
{
    return std::vector<std::string>(list.begin(), list.end());
}
}

const std::vector<std::string>& GetBoneGroup(BoneGroup group)
{
    static const std::vector<std::string> breathing = names({ Bones::Spine01, Bones::Spine02, Bones::Head, Bones::LClavicle, Bones::RClavicle, Bones::LUpperarm, Bones::RUpperarm });
    static const std::vector<std::string> legs = names({ Bones::LThigh, Bones::LCalf, Bones::LFoot, Bones::RThigh, Bones::RCalf, Bones::RFoot });
    static const std::vector<std::string> leftArm = names({ Bones::LUpperarm, Bones::LForearm, Bones::LHand });
    static const std::vector<std::string> rightArm = names({ Bones::RUpperarm, Bones::RForearm, Bones::RHand });
    static const std::vector<std::string> leftLeg = names({ Bones::LThigh, Bones::LCalf, Bones::LFoot });
    static const std::vector<std::string> rightLeg = names({ Bones::RThigh, Bones::RCalf, Bones::RFoot });
    static const std::vector<std::string> punchTorso = names({ Bones::Pelvis, Bones::Spine01, Bones::Spine02 });
    static const std::vector<std::string> spine = names({ Bones::Spine01, Bones::Spine02 });
    static const std::vector<std::string> wave = names({ Bones::RForearm, Bones::RHand, Bones::Spine01, Bones::Spine02 });

    switch (group) {
        case BoneGroup::Breathing:  return breathing;
        case BoneGroup::Legs:       return legs;
        case BoneGroup::LeftArm:    return leftArm;
        case BoneGroup::RightArm:   return rightArm;
        case BoneGroup::LeftLeg:    return leftLeg;
        case BoneGroup::RightLeg:   return rightLeg;
        case BoneGroup::PunchTorso: return punchTorso;
        case BoneGroup::Spine:      return spine;
        case BoneGroup::Wave:       return wave;
    }
    return breathing;
}

bool InBoneGroup(BoneGroup group, const std::string& boneName)
{
    const auto& g = GetBoneGroup(group);
    return std::find(g.begin(), g.end(), boneName) != g.end();
}

const PoseTargetTable& GetPoseTable(PoseTableId id)
{
    static const PoseTargetTable stance = makeStance();
    static const PoseTargetTable block = makeBlock();
    static const PoseTargetTable duck = makeDuck();
    static const PoseTargetTable hello = makeHello();
    static const PoseTargetTable armsCrossed = makeArmsCrossed();
    static const PoseTargetTable bowArms = makeBowArms();
    static const PoseTargetTable fallen = makeFallen();
    static const PoseTargetTable rightPunch = makeRightPunchApex();
    static const PoseTargetTable leftPunch = makeLeftPunchApex();
    static const PoseTargetTable duckKick = makeDuckKickApex();

    switch (id) {
        case PoseTableId::Stance:         return stance;
        case PoseTableId::Block:          return block;
        case PoseTableId::Duck:           return duck;
        case PoseTableId::Hello:          return hello;
        case PoseTableId::ArmsCrossed:    return armsCrossed;
        case PoseTableId::BowArms:        return bowArms;
        case PoseTableId::Fallen:         return fallen;
        case PoseTableId::RightPunchApex: return rightPunch;
        case PoseTableId::LeftPunchApex:  return leftPunch;
        case PoseTableId::DuckKickApex:   return duckKick;
    }
    return stance;
}

const char* ToString(PoseTableId id)
{
    return GetPoseTable(id).Name.c_str();
}

std::optional<PoseTableId> PoseTableIdFromString(const std::string& s)
{
    static const PoseTableId all[] = {
        PoseTableId::Stance, PoseTableId::Block, PoseTableId::Duck, PoseTableId::Hello,
        PoseTableId::ArmsCrossed, PoseTableId::BowArms, PoseTableId::Fallen,
        PoseTableId::RightPunchApex, PoseTableId::LeftPunchApex, PoseTableId::DuckKickApex
    };
    for (PoseTableId id : all) {
        if (GetPoseTable(id).Name == s) return id;
    }
    return std::nullopt;
}

} // namespace animation
} // namespace fr
