#include "animation/HumanoidRig.h"

#include "animation/PoseTables.h"
#include "animation/RotationMath.h"

namespace fr {
namespace animation {

namespace {
glm::quat deg(float x, float y, float z, EulerOrder order = EulerOrder::XYZ)
{
    return DegreesToQuat(glm::vec3(x, y, z), order);
}
}

const std::vector<std::string>& ReferenceHelperBones()
{
    static const std::vector<std::string> helpers = {
        "L_UpperarmTwist01", "R_UpperarmTwist01", "L_ThighTwist01", "R_ThighTwist01", "IK_Root"
    };
    return helpers;
}

SkeletonComponent BuildReferenceHumanoid(const HumanoidRigOptions& options)
{
    SkeletonComponent s;
    const glm::quat identity(1.0f, 0.0f, 0.0f, 0.0f);

    // Torso
    const int hip     = s.AddBone(Bones::Hip, -1, glm::vec3(0.0f, 1.0f, 0.0f), identity);
    const int pelvis  = s.AddBone(Bones::Pelvis, hip, glm::vec3(0.0f), deg(0, 0, 0));
    const int waist   = s.AddBone(Bones::Waist, hip, glm::vec3(0.0f, 0.08f, 0.0f), deg(-4, 0, 0));
    const int spine01 = s.AddBone(Bones::Spine01, waist, glm::vec3(0.0f, 0.1f, 0.0f), deg(3, 0, 0));
    const int spine02 = s.AddBone(Bones::Spine02, spine01, glm::vec3(0.0f, 0.14f, 0.0f), deg(2, 0, 0));
    const int neck    = s.AddBone(Bones::Neck, spine02, glm::vec3(0.0f, 0.2f, 0.0f), deg(8, 0, 0));
    s.AddBone(Bones::Head, neck, glm::vec3(0.0f, 0.1f, 0.0f), deg(-6, 0, 0));

    // Arms
    const int lClav = s.AddBone(Bones::LClavicle, spine02, glm::vec3(0.04f, 0.17f, 0.0f), deg(0, 0, 90));
    const int lUp   = s.AddBone(Bones::LUpperarm, lClav, glm::vec3(0.0f, 0.15f, 0.0f), deg(0, -10, -80));
    const int lFore = s.AddBone(Bones::LForearm, lUp, glm::vec3(0.0f, 0.27f, 0.0f), deg(0, 0, -5));
    s.AddBone(Bones::LHand, lFore, glm::vec3(0.0f, 0.25f, 0.0f), identity);

    const int rClav = s.AddBone(Bones::RClavicle, spine02, glm::vec3(-0.04f, 0.17f, 0.0f), deg(0, 0, -90));
    const int rUp   = s.AddBone(Bones::RUpperarm, rClav, glm::vec3(0.0f, 0.15f, 0.0f), deg(0, 10, 80));
    const int rFore = s.AddBone(Bones::RForearm, rUp, glm::vec3(0.0f, 0.27f, 0.0f), deg(0, 0, 5));
    s.AddBone(Bones::RHand, rFore, glm::vec3(0.0f, 0.25f, 0.0f), identity);

    // Legs
    const int lThigh = s.AddBone(Bones::LThigh, pelvis, glm::vec3(0.09f, -0.05f, 0.0f), deg(0, 180, -178, EulerOrder::YXZ));
    const int lCalf  = s.AddBone(Bones::LCalf, lThigh, glm::vec3(0.0f, 0.42f, 0.0f), deg(-2, 0, 0, EulerOrder::YXZ));
    const int lFoot  = s.AddBone(Bones::LFoot, lCalf, glm::vec3(0.0f, 0.4f, 0.0f), deg(60, 0, 0, EulerOrder::YXZ));
    s.AddBone(Bones::LToe, lFoot, glm::vec3(0.0f, 0.13f, 0.0f), deg(25, 0, 0));

    const int rThigh = s.AddBone(Bones::RThigh, pelvis, glm::vec3(-0.09f, -0.05f, 0.0f), deg(0, 180, 178, EulerOrder::YXZ));
    const int rCalf  = s.AddBone(Bones::RCalf, rThigh, glm::vec3(0.0f, 0.42f, 0.0f), deg(-2, 0, 0, EulerOrder::YXZ));
    const int rFoot  = s.AddBone(Bones::RFoot, rCalf, glm::vec3(0.0f, 0.4f, 0.0f), deg(60, 0, 0, EulerOrder::YXZ));
    s.AddBone(Bones::RToe, rFoot, glm::vec3(0.0f, 0.13f, 0.0f), deg(25, 0, 0));

    if (options.IncludeHelperBones) {
        s.AddBone("L_UpperarmTwist01", lUp, glm::vec3(0.0f, 0.12f, 0.0f), identity);
        s.AddBone("R_UpperarmTwist01", rUp, glm::vec3(0.0f, 0.12f, 0.0f), identity);
        s.AddBone("L_ThighTwist01", lThigh, glm::vec3(0.0f, 0.2f, 0.0f), identity);
        s.AddBone("R_ThighTwist01", rThigh, glm::vec3(0.0f, 0.2f, 0.0f), identity);
        s.AddBone("IK_Root", -1, glm::vec3(0.0f), identity);
    }
    return s;
}

} // namespace animation
} // namespace fr
