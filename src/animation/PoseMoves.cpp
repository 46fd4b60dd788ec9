#include "animation/PoseMoves.h"

#include <algorithm>

namespace fr {
namespace animation {

bool MoveDescriptor::IsAllowedFrom(PoseState state) const
{
    return std::find(AllowedFrom.begin(), AllowedFrom.end(), state) != AllowedFrom.end();
}

namespace {
using S = PoseState;

// Settled states a held or looping move can be left from.
const std::vector<PoseState> kSettled = {
    S::Initial, S::Stance, S::Blocking, S::Ducking, S::Walking, S::Waving, S::ArmsCrossed
};

std::vector<PoseState> settledExcept(PoseState excluded)
{
    std::vector<PoseState> out;
    for (PoseState s : kSettled) if (s != excluded) out.push_back(s);
    return out;
}

MoveDescriptor move(PoseCommand cmd, MoveRole role, bool busy, PoseState active, PoseState result,
                    float fadeIn, float fadeOutOthers, std::vector<PoseState> allowed)
{
    MoveDescriptor d;
    d.Command = cmd;
    d.Role = role;
    d.Busy = busy;
    d.ActiveState = active;
    d.ResultState = result;
    d.FadeIn = fadeIn;
    d.FadeOutOthers = fadeOutOthers;
    d.AllowedFrom = std::move(allowed);
    return d;
}

std::vector<MoveDescriptor> buildMoves()
{
    std::vector<MoveDescriptor> moves;

    MoveDescriptor stance = move(PoseCommand::Stance, MoveRole::Stance, true, S::Transitioning, S::Stance, 0.2f, 0.2f, settledExcept(S::Stance));
    stance.ChainedLoop = MoveRole::Idle;
    stance.Dynamic = true;
    stance.CapturesSnapshot = true;
    moves.push_back(stance);

    MoveDescriptor reset = move(PoseCommand::Reset, MoveRole::Reset, true, S::Transitioning, S::Initial, 0.1f, 0.1f, kSettled);
    reset.AllowedFrom.push_back(S::Fallen);
    reset.Dynamic = true;
    moves.push_back(reset);

    MoveDescriptor walk = move(PoseCommand::Walk, MoveRole::Walk, false, S::Walking, S::Walking, 0.2f, 0.2f, { S::Stance });
    walk.Loop = LoopMode::Repeat;
    moves.push_back(walk);

    MoveDescriptor stopWalk = move(PoseCommand::StopWalk, MoveRole::Idle, false, S::Stance, S::Stance, 0.3f, 0.2f, { S::Walking });
    stopWalk.Loop = LoopMode::Repeat;
    moves.push_back(stopWalk);

    const std::vector<PoseState> punchFrom = { S::Initial, S::Stance, S::Walking, S::Waving, S::ArmsCrossed };
    for (auto [cmd, role] : { std::pair{ PoseCommand::PunchLeft, MoveRole::PunchLeft },
                              std::pair{ PoseCommand::PunchRight, MoveRole::PunchRight } }) {
        MoveDescriptor punch = move(cmd, role, true, S::Punching, S::Stance, 0.1f, 0.1f, punchFrom);
        punch.ChainedLoop = MoveRole::Idle;
        punch.Dynamic = true;
        punch.StartFrom = StartPoseSource::StanceOrLive;
        moves.push_back(punch);
    }

    MoveDescriptor block = move(PoseCommand::Block, MoveRole::Block, true, S::Transitioning, S::Blocking, 0.1f, 0.1f, settledExcept(S::Blocking));
    block.Dynamic = true;
    block.StartFrom = StartPoseSource::StanceOrLive;
    moves.push_back(block);

    moves.push_back(move(PoseCommand::Duck, MoveRole::Duck, true, S::Transitioning, S::Ducking, 0.2f, 0.1f, settledExcept(S::Ducking)));
    moves.push_back(move(PoseCommand::DuckKick, MoveRole::DuckKick, true, S::Kicking, S::Ducking, 0.1f, 0.1f, { S::Ducking }));

    MoveDescriptor hello = move(PoseCommand::Hello, MoveRole::HelloTransition, true, S::Transitioning, S::Waving, 0.2f, 0.2f, settledExcept(S::Waving));
    hello.ChainedLoop = MoveRole::HelloLoop;
    hello.Dynamic = true;
    moves.push_back(hello);

    MoveDescriptor arms = move(PoseCommand::ArmsCrossed, MoveRole::ArmsCrossedTransition, true, S::Transitioning, S::ArmsCrossed, 0.2f, 0.2f, settledExcept(S::ArmsCrossed));
    arms.ChainedLoop = MoveRole::ArmsCrossedLoop;
    arms.Dynamic = true;
    moves.push_back(arms);

    MoveDescriptor bow = move(PoseCommand::Bow, MoveRole::Bow, true, S::Bowing, S::Initial, 0.2f, 0.2f, kSettled);
    bow.Dynamic = true;
    moves.push_back(bow);

    MoveDescriptor fall = move(PoseCommand::Fall, MoveRole::Fall, true, S::Falling, S::Fallen, 0.1f, 0.1f, kSettled);
    fall.Dynamic = true;
    fall.StartFrom = StartPoseSource::Live;
    moves.push_back(fall);

    return moves;
}
}

const MoveDescriptor& GetMoveDescriptor(PoseCommand command)
{
    static const std::vector<MoveDescriptor> moves = buildMoves();
    for (const auto& m : moves) {
        if (m.Command == command) return m;
    }
    return moves.front();
}

const LoopDescriptor& GetLoopDescriptor(MoveRole role)
{
    static const LoopDescriptor idle{ MoveRole::Idle, 0.3f, 0.2f };
    static const LoopDescriptor hello{ MoveRole::HelloLoop, 0.2f, 0.2f };
    static const LoopDescriptor arms{ MoveRole::ArmsCrossedLoop, 0.3f, 0.2f };
    switch (role) {
        case MoveRole::HelloLoop:       return hello;
        case MoveRole::ArmsCrossedLoop: return arms;
        default:                        return idle;
    }
}

const char* ToString(PoseState state)
{
    switch (state) {
        case PoseState::Initial:       return "initial";
        case PoseState::Stance:        return "stance";
        case PoseState::Blocking:      return "blocking";
        case PoseState::Ducking:       return "ducking";
        case PoseState::Walking:       return "walking";
        case PoseState::Transitioning: return "transitioning";
        case PoseState::Punching:      return "punching";
        case PoseState::Kicking:       return "kicking";
        case PoseState::Waving:        return "waving";
        case PoseState::ArmsCrossed:   return "armsCrossed";
        case PoseState::Bowing:        return "bowing";
        case PoseState::Falling:       return "falling";
        case PoseState::Fallen:        return "fallen";
    }
    return "initial";
}

const char* ToString(PoseCommand command)
{
    switch (command) {
        case PoseCommand::Stance:      return "stance";
        case PoseCommand::Reset:       return "reset";
        case PoseCommand::Walk:        return "walk";
        case PoseCommand::StopWalk:    return "stopWalk";
        case PoseCommand::PunchLeft:   return "punchLeft";
        case PoseCommand::PunchRight:  return "punchRight";
        case PoseCommand::Block:       return "block";
        case PoseCommand::Duck:        return "duck";
        case PoseCommand::DuckKick:    return "duckKick";
        case PoseCommand::Hello:       return "hello";
        case PoseCommand::ArmsCrossed: return "armsCrossed";
        case PoseCommand::Bow:         return "bow";
        case PoseCommand::Fall:        return "fall";
    }
    return "stance";
}

const char* ToString(MoveRole role)
{
    switch (role) {
        case MoveRole::Stance:                return "Stance";
        case MoveRole::Reset:                 return "Reset";
        case MoveRole::Idle:                  return "Idle";
        case MoveRole::Walk:                  return "Walk";
        case MoveRole::PunchLeft:             return "PunchLeft";
        case MoveRole::PunchRight:            return "PunchRight";
        case MoveRole::Block:                 return "Block";
        case MoveRole::Duck:                  return "Duck";
        case MoveRole::DuckKick:              return "DuckKick";
        case MoveRole::HelloTransition:       return "HelloTransition";
        case MoveRole::HelloLoop:             return "HelloLoop";
        case MoveRole::ArmsCrossedTransition: return "ArmsCrossedTransition";
        case MoveRole::ArmsCrossedLoop:       return "ArmsCrossedLoop";
        case MoveRole::Bow:                   return "Bow";
        case MoveRole::Fall:                  return "Fall";
        case MoveRole::Count:                 break;
    }
    return "Unknown";
}

std::optional<PoseState> PoseStateFromString(const std::string& s)
{
    for (int i = 0; i <= static_cast<int>(PoseState::Fallen); ++i) {
        const auto state = static_cast<PoseState>(i);
        if (s == ToString(state)) return state;
    }
    return std::nullopt;
}

std::optional<PoseCommand> PoseCommandFromString(const std::string& s)
{
    for (int i = 0; i <= static_cast<int>(PoseCommand::Fall); ++i) {
        const auto cmd = static_cast<PoseCommand>(i);
        if (s == ToString(cmd)) return cmd;
    }
    return std::nullopt;
}

} // namespace animation
} // namespace fr
