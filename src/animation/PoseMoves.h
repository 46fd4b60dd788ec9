#pragma once

#include <optional>
#include <string>
#include <vector>

#include "animation/AnimationMixer.h"

namespace fr {
namespace animation {

enum class PoseState {
    Initial,
    Stance,
    Blocking,
    Ducking,
    Walking,
    Transitioning,
    Punching,
    Kicking,
    Waving,
    ArmsCrossed,
    Bowing,
    Falling,
    Fallen
};

enum class PoseCommand {
    Stance,
    Reset,
    Walk,
    StopWalk,
    PunchLeft,
    PunchRight,
    Block,
    Duck,
    DuckKick,
    Hello,
    ArmsCrossed,
    Bow,
    Fall
};

// One owned action slot per role.
enum class MoveRole {
    Stance,
    Reset,
    Idle,
    Walk,
    PunchLeft,
    PunchRight,
    Block,
    Duck,
    DuckKick,
    HelloTransition,
    HelloLoop,
    ArmsCrossedTransition,
    ArmsCrossedLoop,
    Bow,
    Fall,
    Count
};

// Where a dynamic move takes its start pose from.
enum class StartPoseSource {
    None,           // clip builds its own reference
    StanceOrLive,   // captured stance snapshot in stance, else live rig
    Live            // always a fresh live snapshot
};

struct MoveDescriptor {
    PoseCommand Command = PoseCommand::Stance;
    MoveRole Role = MoveRole::Stance;
    bool Busy = true;
    PoseState ActiveState = PoseState::Transitioning;
    PoseState ResultState = PoseState::Transitioning;
    std::optional<MoveRole> ChainedLoop;    // started when the clip finishes
    float FadeIn = 0.1f;
    float FadeOutOthers = 0.1f;
    std::vector<PoseState> AllowedFrom;
    bool Dynamic = false;                   // regenerated on every trigger
    StartPoseSource StartFrom = StartPoseSource::None;
    LoopMode Loop = LoopMode::Once;
    bool CapturesSnapshot = false;          // snapshot the live rig on finish

    bool IsAllowedFrom(PoseState state) const;
};

struct LoopDescriptor {
    MoveRole Role = MoveRole::Idle;
    float FadeIn = 0.3f;
    float FadeOutFinished = 0.2f;           // fade applied to the transition that chained it
};

const MoveDescriptor& GetMoveDescriptor(PoseCommand command);
const LoopDescriptor& GetLoopDescriptor(MoveRole role);

const char* ToString(PoseState state);
const char* ToString(PoseCommand command);
const char* ToString(MoveRole role);
std::optional<PoseState> PoseStateFromString(const std::string& s);
std::optional<PoseCommand> PoseCommandFromString(const std::string& s);

} // namespace animation
} // namespace fr
