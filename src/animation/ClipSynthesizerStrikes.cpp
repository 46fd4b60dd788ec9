#include "animation/ClipSynthesizer.h"

#include <iterator>

#include "animation/RotationMath.h"
#include "utils/Logger.h"

namespace fr {
namespace animation {

// -----------------------------
// Punch: start, wind-up, apex, return to base
// -----------------------------
std::shared_ptr<AnimationClip> ClipSynthesizer::CreatePunchClip(PunchSide side, const StartPose& start) const
{
    const bool right = side == PunchSide::Right;
    const char* clipName = right ? "RightPunch" : "LeftPunch";
    if (!checkInputs(clipName)) return nullptr;

    const PoseTargetTable& stance = GetPoseTable(PoseTableId::Stance);
    const PoseTargetTable& apexTable = GetPoseTable(right ? PoseTableId::RightPunchApex : PoseTableId::LeftPunchApex);
    const BoneGroup punchArm = right ? BoneGroup::RightArm : BoneGroup::LeftArm;
    const BoneGroup guardArm = right ? BoneGroup::LeftArm : BoneGroup::RightArm;
    const BoneGroup stepLeg = right ? BoneGroup::RightLeg : BoneGroup::LeftLeg;
    // Left variant mirrors Y/Z deltas
    const float mirror = right ? 1.0f : -1.0f;

    const float duration = m_Settings.PunchDuration;
    AnimationClip clip;
    clip.Name = clipName;
    clip.Duration = duration;
    const std::vector<float> times = { 0.0f, duration * 0.1f, duration * 0.35f, duration };

    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform&) {
        const glm::quat base = m_Resolver.StartRotation(name, &start);

        EulerOrder order = EulerOrder::XYZ;
        if (const PoseTarget* st = stance.Find(name)) order = st->Order;
        else if (InBoneGroup(BoneGroup::Legs, name)) order = EulerOrder::YXZ;
        const glm::vec3 baseEuler = QuatToEuler(base, order);

        // Wind-up
        glm::vec3 prep = baseEuler;
        if (InBoneGroup(punchArm, name)) {
            if (name.find("Upperarm") != std::string::npos) {
                prep.x += glm::radians(5.0f);
                prep.z += glm::radians(15.0f * mirror);
            } else if (name.find("Forearm") != std::string::npos) {
                prep.z += glm::radians(60.0f * mirror);
            } else if (name.find("Hand") != std::string::npos) {
                prep.z += glm::radians(10.0f * mirror);
            }
        }

        // Apex: arms are absolute, torso and stepping leg are relative to base
        glm::quat apex;
        if (InBoneGroup(punchArm, name) || InBoneGroup(guardArm, name)) {
            apex = BoneFrameResolver::EndRotation(apexTable.Find(name), base);
        } else {
            glm::vec3 e = baseEuler;
            if (InBoneGroup(BoneGroup::PunchTorso, name)) {
                e.y += glm::radians(15.0f * mirror);
                if (name.find("Spine") != std::string::npos) e.x += glm::radians(5.0f);
            } else if (InBoneGroup(stepLeg, name)) {
                if (name.find("Thigh") != std::string::npos) {
                    e.x -= glm::radians(5.0f);
                    e.y += glm::radians(3.0f * mirror);
                } else if (name.find("Calf") != std::string::npos) {
                    e.x -= glm::radians(5.0f);
                } else if (name.find("Foot") != std::string::npos) {
                    e.x += glm::radians(5.0f);
                }
            }
            apex = EulerToQuat(e, order);
        }

        AddRotationKeys(FindOrAddTrack(clip, name), times,
                        { base, EulerToQuat(prep, order), apex, base });
    });
    return finalize(std::move(clip));
}

// -----------------------------
// Duck-kick: kicking leg swings out, everything else stays in the duck
// -----------------------------
std::shared_ptr<AnimationClip> ClipSynthesizer::CreateDuckKickClip() const
{
    if (!checkInputs("DuckKick")) return nullptr;

    const PoseTargetTable& stance = GetPoseTable(PoseTableId::Stance);
    const PoseTargetTable& duck = GetPoseTable(PoseTableId::Duck);
    const PoseTargetTable& apexTable = GetPoseTable(PoseTableId::DuckKickApex);

    const float duration = m_Settings.DuckKickDuration;
    AnimationClip clip;
    clip.Name = "DuckKick";
    clip.Duration = duration;
    // start, windup, apex, retract, end
    const std::vector<float> times = { 0.0f, duration * 0.2f, duration * 0.45f, duration * 0.7f, duration };

    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform& initial) {
        const PoseTarget* duckTarget = duck.Find(name);
        const glm::quat duckRot = BoneFrameResolver::EndRotation(duckTarget, m_Resolver.BaseRotation(name, stance));
        BoneTrack& track = FindOrAddTrack(clip, name);

        if (InBoneGroup(BoneGroup::RightLeg, name)) {
            glm::vec3 windup = QuatToEuler(duckRot, EulerOrder::YXZ);
            if (name == Bones::RThigh) windup.x += glm::radians(15.0f);
            else if (name == Bones::RCalf) windup.x -= glm::radians(30.0f);
            const glm::quat coil = EulerToQuat(windup, EulerOrder::YXZ);

            const PoseTarget* apexTarget = apexTable.Find(name);
            const glm::quat apex = BoneFrameResolver::EndRotation(apexTarget, duckRot);
            AddRotationKeys(track, times, { duckRot, coil, apex, coil, duckRot });
        } else {
            AddRotationKeys(track, times, std::vector<glm::quat>(times.size(), duckRot));
        }

        // Displaced bones stay lowered for the whole kick
        const glm::vec3 duckPos = m_Resolver.EndPosition(name, duckTarget);
        if (glm::length(duckPos - initial.Position) > 1e-5f) {
            AddPositionKeys(track, times, std::vector<glm::vec3>(times.size(), duckPos));
        }
    });
    return finalize(std::move(clip));
}

// -----------------------------
// Bow: arms to the bow target, spine bends in two stages, then back
// -----------------------------
std::shared_ptr<AnimationClip> ClipSynthesizer::CreateBowClip() const
{
    if (!checkInputs("Bow")) return nullptr;

    const PoseTargetTable& bowArms = GetPoseTable(PoseTableId::BowArms);
    const std::vector<float> times(std::begin(m_Settings.BowTimes), std::end(m_Settings.BowTimes));
    for (size_t i = 1; i < times.size(); ++i) {
        if (times[i] < times[i - 1]) {
            Logger::LogWarning("[ClipSynthesizer] Bow keyframe times are not increasing.");
            return nullptr;
        }
    }

    AnimationClip clip;
    clip.Name = "Bow";
    clip.Duration = times.back();

    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform& initial) {
        const glm::quat rest = initial.Rotation;
        std::vector<glm::quat> values;

        if (bowArms.Find(name)) {
            const glm::quat arms = m_Resolver.BaseRotation(name, bowArms);
            values = { rest, arms, arms, rest };
        } else if (InBoneGroup(BoneGroup::Spine, name)) {
            const float weight = name == Bones::Spine01 ? 0.6f : 0.4f;
            const glm::quat first = rest * EulerToQuat(glm::vec3(glm::radians(m_Settings.BowFirstBend * weight), 0.0f, 0.0f), EulerOrder::XYZ);
            const glm::quat second = rest * EulerToQuat(glm::vec3(glm::radians(m_Settings.BowSecondBend * weight), 0.0f, 0.0f), EulerOrder::XYZ);
            values = { rest, first, second, rest };
        } else {
            values.assign(times.size(), rest);
        }
        AddRotationKeys(FindOrAddTrack(clip, name), times, values);
    });
    appendPositionRestore(clip, times[1]);
    return finalize(std::move(clip));
}

} // namespace animation
} // namespace fr
