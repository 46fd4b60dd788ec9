#pragma once

#include <memory>
#include <string>
#include <vector>

#include "animation/AnimationTypes.h"
#include "animation/BoneFrameResolver.h"
#include "animation/MotionSettings.h"
#include "animation/PoseTables.h"
#include "animation/Skeleton.h"

namespace fr {
namespace animation {

enum class PunchSide { Left, Right };

// Builds keyframed clips for every procedural motion. Each Create* returns
// null (and logs a warning) when no track could be generated; the reset clip
// is the exception and always carries at least one track.
class ClipSynthesizer {
public:
    ClipSynthesizer(const SkeletonComponent* skeleton, const InitialPose* initialPose,
                    const MotionSettings& settings = MotionSettings{});

    const MotionSettings& Settings() const { return m_Settings; }
    void SetSettings(const MotionSettings& settings) { m_Settings = settings; }
    const BoneFrameResolver& Resolver() const { return m_Resolver; }

    // --- Transitions between held poses ---
    std::shared_ptr<AnimationClip> CreateResetClip() const;
    std::shared_ptr<AnimationClip> CreateStanceClip() const;
    std::shared_ptr<AnimationClip> CreateBlockClip(const StartPose& start) const;
    std::shared_ptr<AnimationClip> CreateDuckClip() const;
    std::shared_ptr<AnimationClip> CreateHelloTransitionClip() const;
    std::shared_ptr<AnimationClip> CreateArmsCrossedTransitionClip() const;
    std::shared_ptr<AnimationClip> CreateFallClip(const StartPose& start) const;

    // Sparse transition from the initial pose to a table. Only bones the table
    // changes get a track; displaced bone positions are returned to initial.
    std::shared_ptr<AnimationClip> CreateTableTransitionClip(const std::string& name,
                                                             const PoseTargetTable& table,
                                                             float duration) const;

    // --- Loops ---
    std::shared_ptr<AnimationClip> CreateIdleBreathClip() const;
    std::shared_ptr<AnimationClip> CreateArmsCrossedBreathClip() const;
    std::shared_ptr<AnimationClip> CreateBreathLoopClip(const std::string& name,
                                                        const PoseTargetTable& baseTable,
                                                        float duration, float intensity) const;
    std::shared_ptr<AnimationClip> CreateWalkCycleClip() const;
    std::shared_ptr<AnimationClip> CreateHelloWaveClip() const;

    // --- One-shot moves ---
    std::shared_ptr<AnimationClip> CreatePunchClip(PunchSide side, const StartPose& start) const;
    std::shared_ptr<AnimationClip> CreateDuckKickClip() const;
    std::shared_ptr<AnimationClip> CreateBowClip() const;

private:
    std::shared_ptr<AnimationClip> finalize(AnimationClip&& clip) const;
    bool checkInputs(const char* motion) const;
    // Adds a live -> initial position segment for every displaced bone.
    void appendPositionRestore(AnimationClip& clip, float endTime) const;
    // Same for rotations, on bones that have no rotation keys yet.
    void appendRotationRestore(AnimationClip& clip, float endTime) const;

    BoneFrameResolver m_Resolver;
    MotionSettings m_Settings;
};

// Track helpers shared by the synthesizer sources.
BoneTrack& FindOrAddTrack(AnimationClip& clip, const std::string& boneName);
void AddRotationKeys(BoneTrack& track, const std::vector<float>& times, const std::vector<glm::quat>& values);
void AddPositionKeys(BoneTrack& track, const std::vector<float>& times, const std::vector<glm::vec3>& values);

} // namespace animation
} // namespace fr
