#include "animation/ClipSynthesizer.h"

#include <algorithm>
#include <cmath>

#include <glm/gtc/constants.hpp>

#include "animation/RotationMath.h"
#include "utils/Logger.h"

namespace fr {
namespace animation {

namespace {
constexpr float kPositionEpsilon = 1e-5f;

bool positionsDiffer(const glm::vec3& a, const glm::vec3& b)
{
    return glm::length(a - b) > kPositionEpsilon;
}
}

// -----------------------------
// Track helpers
// -----------------------------
BoneTrack& FindOrAddTrack(AnimationClip& clip, const std::string& boneName)
{
    if (BoneTrack* existing = clip.FindTrack(boneName)) return *existing;
    clip.Tracks.push_back(BoneTrack{});
    clip.Tracks.back().BoneName = boneName;
    return clip.Tracks.back();
}

void AddRotationKeys(BoneTrack& track, const std::vector<float>& times, const std::vector<glm::quat>& values)
{
    for (size_t i = 0; i < times.size() && i < values.size(); ++i) {
        track.RotationKeys.push_back(KeyframeQuat{ times[i], values[i] });
    }
}

void AddPositionKeys(BoneTrack& track, const std::vector<float>& times, const std::vector<glm::vec3>& values)
{
    for (size_t i = 0; i < times.size() && i < values.size(); ++i) {
        track.PositionKeys.push_back(KeyframeVec3{ times[i], values[i] });
    }
}

ClipSynthesizer::ClipSynthesizer(const SkeletonComponent* skeleton, const InitialPose* initialPose,
                                 const MotionSettings& settings)
    : m_Resolver(skeleton, initialPose), m_Settings(settings)
{
}

bool ClipSynthesizer::checkInputs(const char* motion) const
{
    if (m_Resolver.IsValid()) return true;
    Logger::LogWarning(std::string("[ClipSynthesizer] Missing skeleton or initial pose for ") + motion + ".");
    return false;
}

std::shared_ptr<AnimationClip> ClipSynthesizer::finalize(AnimationClip&& clip) const
{
    if (clip.Empty()) {
        Logger::LogWarning("[ClipSynthesizer] No tracks generated for " + clip.Name + ".");
        return nullptr;
    }
    return std::make_shared<AnimationClip>(std::move(clip));
}

void ClipSynthesizer::appendPositionRestore(AnimationClip& clip, float endTime) const
{
    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform& initial) {
        const glm::vec3 live = m_Resolver.LivePosition(name);
        if (!positionsDiffer(live, initial.Position)) return;
        BoneTrack& track = FindOrAddTrack(clip, name);
        if (!track.PositionKeys.empty()) return;
        AddPositionKeys(track, { 0.0f, endTime }, { live, initial.Position });
    });
}

void ClipSynthesizer::appendRotationRestore(AnimationClip& clip, float endTime) const
{
    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform& initial) {
        const glm::quat live = m_Resolver.LiveRotation(name);
        if (QuatNearlyEqual(live, initial.Rotation)) return;
        BoneTrack& track = FindOrAddTrack(clip, name);
        if (!track.RotationKeys.empty()) return;
        AddRotationKeys(track, { 0.0f, endTime }, { live, initial.Rotation });
    });
}

// -----------------------------
// Reset to the initial pose
// -----------------------------
std::shared_ptr<AnimationClip> ClipSynthesizer::CreateResetClip() const
{
    if (!checkInputs("ResetPose")) return nullptr;

    AnimationClip clip;
    clip.Name = "ResetPose";
    clip.Duration = m_Settings.ResetDuration;
    const std::vector<float> times = { 0.0f, clip.Duration };

    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform& initial) {
        const glm::quat current = m_Resolver.LiveRotation(name);
        if (!QuatNearlyEqual(current, initial.Rotation)) {
            AddRotationKeys(FindOrAddTrack(clip, name), times, { current, initial.Rotation });
        }
        const glm::vec3 pos = m_Resolver.LivePosition(name);
        if (positionsDiffer(pos, initial.Position)) {
            AddPositionKeys(FindOrAddTrack(clip, name), times, { pos, initial.Position });
        }
    });

    // Pose already matches: keep an always-playable no-op on the root.
    if (clip.Empty()) {
        std::string root;
        if (m_Resolver.IsAnimatable(Bones::Hip)) {
            root = Bones::Hip;
        } else {
            m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform&) {
                if (root.empty()) root = name;
            });
        }
        if (!root.empty()) {
            const glm::quat q = m_Resolver.FindInitial(root)->Rotation;
            AddRotationKeys(FindOrAddTrack(clip, root), times, { q, q });
        }
    }
    return finalize(std::move(clip));
}

// -----------------------------
// Sparse table transitions (stance, hello, arms crossed)
// -----------------------------
std::shared_ptr<AnimationClip> ClipSynthesizer::CreateTableTransitionClip(const std::string& name,
                                                                          const PoseTargetTable& table,
                                                                          float duration) const
{
    if (!checkInputs(name.c_str())) return nullptr;

    AnimationClip clip;
    clip.Name = name;
    clip.Duration = duration;
    const std::vector<float> times = { 0.0f, duration };

    m_Resolver.ForEachAnimatableBone([&](const std::string& boneName, const BoneRestTransform& initial) {
        const PoseTarget* target = table.Find(boneName);
        const glm::quat start = initial.Rotation;
        const glm::quat end = BoneFrameResolver::EndRotation(target, start);
        if ((target && target->RotationDegrees) || !QuatNearlyEqual(start, end)) {
            AddRotationKeys(FindOrAddTrack(clip, boneName), times, { start, end });
        }
    });
    // Bones the table leaves out go back to the initial pose.
    appendRotationRestore(clip, duration);
    appendPositionRestore(clip, duration);
    return finalize(std::move(clip));
}

std::shared_ptr<AnimationClip> ClipSynthesizer::CreateStanceClip() const
{
    return CreateTableTransitionClip("FightStance", GetPoseTable(PoseTableId::Stance), m_Settings.StanceDuration);
}

std::shared_ptr<AnimationClip> ClipSynthesizer::CreateHelloTransitionClip() const
{
    return CreateTableTransitionClip("HelloTransition", GetPoseTable(PoseTableId::Hello), m_Settings.HelloTransitionDuration);
}

std::shared_ptr<AnimationClip> ClipSynthesizer::CreateArmsCrossedTransitionClip() const
{
    return CreateTableTransitionClip("ArmsCrossedTransition", GetPoseTable(PoseTableId::ArmsCrossed),
                                     m_Settings.ArmsCrossedTransitionDuration);
}

// -----------------------------
// Held poses from a dynamic or static start
// -----------------------------
std::shared_ptr<AnimationClip> ClipSynthesizer::CreateBlockClip(const StartPose& start) const
{
    if (!checkInputs("BlockPose")) return nullptr;

    const PoseTargetTable& block = GetPoseTable(PoseTableId::Block);
    AnimationClip clip;
    clip.Name = "BlockPose";
    clip.Duration = m_Settings.BlockDuration;
    const std::vector<float> times = { 0.0f, clip.Duration };

    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform&) {
        const glm::quat from = m_Resolver.StartRotation(name, &start);
        const glm::quat to = BoneFrameResolver::EndRotation(block.Find(name), from);
        AddRotationKeys(FindOrAddTrack(clip, name), times, { from, to });
    });
    return finalize(std::move(clip));
}

std::shared_ptr<AnimationClip> ClipSynthesizer::CreateDuckClip() const
{
    if (!checkInputs("DuckPose")) return nullptr;

    const PoseTargetTable& stance = GetPoseTable(PoseTableId::Stance);
    const PoseTargetTable& duck = GetPoseTable(PoseTableId::Duck);
    AnimationClip clip;
    clip.Name = "DuckPose";
    clip.Duration = m_Settings.DuckDuration;
    const std::vector<float> times = { 0.0f, clip.Duration };

    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform& initial) {
        const PoseTarget* target = duck.Find(name);
        const glm::quat from = m_Resolver.BaseRotation(name, stance);
        const glm::quat to = BoneFrameResolver::EndRotation(target, from);
        BoneTrack& track = FindOrAddTrack(clip, name);
        AddRotationKeys(track, times, { from, to });

        const glm::vec3 endPos = m_Resolver.EndPosition(name, target);
        if (positionsDiffer(endPos, initial.Position)) {
            AddPositionKeys(track, times, { initial.Position, endPos });
        }
    });
    return finalize(std::move(clip));
}

std::shared_ptr<AnimationClip> ClipSynthesizer::CreateFallClip(const StartPose& start) const
{
    if (!checkInputs("FallBackward")) return nullptr;

    const PoseTargetTable& fallen = GetPoseTable(PoseTableId::Fallen);
    AnimationClip clip;
    clip.Name = "FallBackward";
    clip.Duration = m_Settings.FallDuration;
    const std::vector<float> times = { 0.0f, clip.Duration };

    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform&) {
        const glm::quat from = m_Resolver.StartRotation(name, &start);
        const glm::quat to = BoneFrameResolver::EndRotation(fallen.Find(name), from);
        AddRotationKeys(FindOrAddTrack(clip, name), times, { from, to });
    });
    return finalize(std::move(clip));
}

// -----------------------------
// Breathing loops
// -----------------------------
std::shared_ptr<AnimationClip> ClipSynthesizer::CreateBreathLoopClip(const std::string& name,
                                                                     const PoseTargetTable& baseTable,
                                                                     float duration, float intensity) const
{
    if (!checkInputs(name.c_str())) return nullptr;

    AnimationClip clip;
    clip.Name = name;
    clip.Duration = duration;
    const std::vector<float> times = { 0.0f, duration * 0.5f, duration };
    const float delta = glm::radians(intensity);

    m_Resolver.ForEachAnimatableBone([&](const std::string& boneName, const BoneRestTransform&) {
        const glm::quat base = m_Resolver.BaseRotation(boneName, baseTable);
        BoneTrack& track = FindOrAddTrack(clip, boneName);

        if (!InBoneGroup(BoneGroup::Breathing, boneName)) {
            // Pinned: a single key holds the bone at its base.
            AddRotationKeys(track, { 0.0f }, { base });
            return;
        }

        const bool left = boneName.rfind("L_", 0) == 0;
        glm::vec3 deltaEuler(0.0f);
        if (boneName.find("Spine") != std::string::npos) {
            deltaEuler.x = -delta;
        } else if (boneName.find("Clavicle") != std::string::npos) {
            deltaEuler.y = left ? delta * 0.5f : -delta * 0.5f;
        } else if (boneName.find("Head") != std::string::npos) {
            deltaEuler.x = -delta * 0.5f;
        } else if (boneName.find("Upperarm") != std::string::npos) {
            deltaEuler.z = left ? -delta * 0.3f : delta * 0.3f;
        }
        const glm::quat peak = base * EulerToQuat(deltaEuler, EulerOrder::XYZ);
        AddRotationKeys(track, times, { base, peak, base });
    });
    return finalize(std::move(clip));
}

std::shared_ptr<AnimationClip> ClipSynthesizer::CreateIdleBreathClip() const
{
    return CreateBreathLoopClip("IdleBreath", GetPoseTable(PoseTableId::Stance),
                                m_Settings.IdleBreathDuration, m_Settings.IdleBreathIntensity);
}

std::shared_ptr<AnimationClip> ClipSynthesizer::CreateArmsCrossedBreathClip() const
{
    return CreateBreathLoopClip("ArmsCrossedBreath", GetPoseTable(PoseTableId::ArmsCrossed),
                                m_Settings.IdleBreathDuration, m_Settings.IdleBreathIntensity);
}

// -----------------------------
// Walk cycle: legs swing, spine counter-twists, upper body holds the stance
// -----------------------------
std::shared_ptr<AnimationClip> ClipSynthesizer::CreateWalkCycleClip() const
{
    if (!checkInputs("WalkCycle")) return nullptr;

    const PoseTargetTable& stance = GetPoseTable(PoseTableId::Stance);
    const float duration = m_Settings.WalkCycleDuration;
    AnimationClip clip;
    clip.Name = "WalkCycle";
    clip.Duration = duration;
    // start, left passing, left forward, right passing, right forward (== start)
    const std::vector<float> times = { 0.0f, duration * 0.25f, duration * 0.5f, duration * 0.75f, duration };
    const float pi = glm::pi<float>();

    m_Resolver.ForEachAnimatableBone([&](const std::string& name, const BoneRestTransform& initial) {
        const bool isLeg = InBoneGroup(BoneGroup::Legs, name);
        const PoseTarget* stanceTarget = stance.Find(name);

        // Legs animate from the initial pose; the upper body holds the stance.
        glm::quat base = initial.Rotation;
        if (!isLeg && stanceTarget && stanceTarget->RotationDegrees) {
            base = BoneFrameResolver::TargetRotation(*stanceTarget);
        }

        std::vector<glm::quat> values;
        values.reserve(times.size());

        if (isLeg) {
            const bool left = name.rfind("L_", 0) == 0;
            const float sideOffset = left ? 0.0f : pi;
            const glm::vec3 baseEuler = QuatToEuler(base, EulerOrder::YXZ);
            for (float t : times) {
                const float phase = (t / duration) * 2.0f * pi;
                glm::vec3 e = baseEuler;
                if (name.find("Thigh") != std::string::npos) {
                    e.x += glm::radians(m_Settings.WalkStrideLength * std::cos(phase + sideOffset) * -1.0f);
                    e.z += glm::radians(m_Settings.WalkStepHeight * std::max(0.0f, std::sin(phase + sideOffset + pi * 0.5f)));
                } else if (name.find("Calf") != std::string::npos) {
                    // Knee bends most with the leg back
                    e.x -= glm::radians(45.0f * (std::cos(phase + sideOffset) + 1.0f) / 2.0f);
                } else if (name.find("Foot") != std::string::npos) {
                    e.x += glm::radians(25.0f * std::cos(phase + sideOffset) * -1.0f);
                }
                values.push_back(EulerToQuat(e, EulerOrder::YXZ));
            }
        } else if (name == Bones::Spine01) {
            const glm::vec3 baseEuler = QuatToEuler(base, EulerOrder::XYZ);
            for (float t : times) {
                const float phase = (t / duration) * 2.0f * pi;
                glm::vec3 e = baseEuler;
                e.y += glm::radians(m_Settings.WalkSpineTwist * std::sin(phase));
                values.push_back(EulerToQuat(e, EulerOrder::XYZ));
            }
        } else {
            values.assign(times.size(), base);
        }
        AddRotationKeys(FindOrAddTrack(clip, name), times, values);
    });
    return finalize(std::move(clip));
}

// -----------------------------
// Hello wave loop around the hello target
// -----------------------------
std::shared_ptr<AnimationClip> ClipSynthesizer::CreateHelloWaveClip() const
{
    if (!checkInputs("HelloWave")) return nullptr;

    const PoseTargetTable& hello = GetPoseTable(PoseTableId::Hello);
    const float duration = m_Settings.HelloWaveDuration;
    AnimationClip clip;
    clip.Name = "HelloWave";
    clip.Duration = duration;
    const std::vector<float> times = { 0.0f, duration * 0.25f, duration * 0.75f, duration };

    for (const auto& name : GetBoneGroup(BoneGroup::Wave)) {
        if (!m_Resolver.IsAnimatable(name)) continue;
        float scale = 1.0f;
        if (name == Bones::RHand) scale = 0.5f;
        else if (InBoneGroup(BoneGroup::Spine, name)) scale = 0.15f;

        const glm::quat target = m_Resolver.BaseRotation(name, hello);
        const float swing = glm::radians(m_Settings.HelloWaveAmplitude * scale);
        const glm::quat peak = target * EulerToQuat(glm::vec3(0.0f, swing, 0.0f), EulerOrder::XYZ);
        const glm::quat trough = target * EulerToQuat(glm::vec3(0.0f, -swing, 0.0f), EulerOrder::XYZ);
        AddRotationKeys(FindOrAddTrack(clip, name), times, { target, peak, trough, target });
    }
    return finalize(std::move(clip));
}

} // namespace animation
} // namespace fr
