#include "animation/PoseStateMachine.h"

#include <algorithm>

#include "utils/Logger.h"

namespace fr {
namespace animation {

PoseStateMachine::PoseStateMachine(AnimationMixer& mixer, const InitialPose& initialPose,
                                   const MotionSettings& settings)
    : m_Mixer(mixer)
    , m_InitialPose(initialPose)
    , m_Synth(mixer.Skeleton(), &m_InitialPose, settings)
{
    for (auto& s : m_Slots) s = std::make_unique<ActionSlot>(m_Mixer);
    m_MixerListenerId = m_Mixer.AddFinishedListener([this](const ClipFinishedEvent& e) { onClipFinished(e); });
}

PoseStateMachine::~PoseStateMachine()
{
    m_Mixer.RemoveFinishedListener(m_MixerListenerId);
}

void PoseStateMachine::SetSettings(const MotionSettings& settings)
{
    m_Synth.SetSettings(settings);
    for (auto& c : m_ClipCache) c.reset();
}

std::shared_ptr<AnimationAction> PoseStateMachine::ActionFor(MoveRole role) const
{
    if (role == MoveRole::Count) return nullptr;
    return slot(role).Get();
}

int PoseStateMachine::AddStateListener(StateCallback callback)
{
    const int id = m_NextListenerId++;
    m_Listeners.push_back(Listener{ id, std::move(callback) });
    return id;
}

void PoseStateMachine::RemoveStateListener(int id)
{
    m_Listeners.erase(std::remove_if(m_Listeners.begin(), m_Listeners.end(),
                                     [id](const Listener& l) { return l.Id == id; }),
                      m_Listeners.end());
}

// -----------------------------
// Commands
// -----------------------------
bool PoseStateMachine::Request(PoseCommand command)
{
    if (m_Busy) return false;

    const MoveDescriptor& move = GetMoveDescriptor(command);
    if (!move.IsAllowedFrom(m_State)) return false;

    auto clip = clipFor(move.Role, &move);
    if (!clip) {
        Logger::LogWarning(std::string("[PoseStateMachine] Could not synthesize a clip for '") + ToString(command) + "'.");
        return false;
    }

    fadeOutOthers(move.Role, move.FadeOutOthers);
    auto action = startRole(move.Role, std::move(clip), move.Loop, move.FadeIn);
    if (!action) return false;

    m_CurrentMove = &move;
    m_CurrentAction = action;
    setState(move.ActiveState, move.Busy);
    return true;
}

bool PoseStateMachine::Release()
{
    if (m_Busy) {
        Logger::LogWarning("[PoseStateMachine] Cannot release the rig while a move is playing.");
        return false;
    }
    m_Mixer.StopAll();
    m_CurrentMove = nullptr;
    m_CurrentAction.reset();
    Logger::Log(std::string("[PoseStateMachine] Rig released in state ") + ToString(m_State) + ".");
    return true;
}

void PoseStateMachine::onClipFinished(const ClipFinishedEvent& e)
{
    Logger::Log("[PoseStateMachine] Clip finished: " + e.ClipName);

    // Only the action started by the last accepted command settles the state
    if (!m_CurrentMove || !m_CurrentAction || e.Action != m_CurrentAction) return;

    const MoveDescriptor& move = *m_CurrentMove;
    m_CurrentMove = nullptr;
    m_CurrentAction.reset();

    if (move.CapturesSnapshot) m_StanceSnapshot = m_Synth.Resolver().CaptureLive();
    if (move.ResultState == PoseState::Initial) m_StanceSnapshot.reset();

    if (move.ChainedLoop) {
        const LoopDescriptor& loop = GetLoopDescriptor(*move.ChainedLoop);
        auto loopClip = clipFor(loop.Role, nullptr);
        if (loopClip) {
            startRole(loop.Role, std::move(loopClip), LoopMode::Repeat, loop.FadeIn);
            e.Action->FadeOut(loop.FadeOutFinished);
        } else {
            Logger::LogWarning(std::string("[PoseStateMachine] Could not start loop '") + ToString(loop.Role) + "'.");
        }
    }

    setState(move.ResultState, false);
}

// -----------------------------
// Clips and slots
// -----------------------------
std::shared_ptr<const AnimationClip> PoseStateMachine::clipFor(MoveRole role, const MoveDescriptor* move)
{
    if (move && move->Dynamic) return synthesize(role, move);

    auto& cached = m_ClipCache[static_cast<size_t>(role)];
    if (!cached) cached = synthesize(role, move);
    return cached;
}

std::shared_ptr<const AnimationClip> PoseStateMachine::synthesize(MoveRole role, const MoveDescriptor* move) const
{
    const StartPoseSource source = move ? move->StartFrom : StartPoseSource::None;
    switch (role) {
        case MoveRole::Stance:                return m_Synth.CreateStanceClip();
        case MoveRole::Reset:                 return m_Synth.CreateResetClip();
        case MoveRole::Idle:                  return m_Synth.CreateIdleBreathClip();
        case MoveRole::Walk:                  return m_Synth.CreateWalkCycleClip();
        case MoveRole::PunchLeft:             return m_Synth.CreatePunchClip(PunchSide::Left, startPoseFor(source));
        case MoveRole::PunchRight:            return m_Synth.CreatePunchClip(PunchSide::Right, startPoseFor(source));
        case MoveRole::Block:                 return m_Synth.CreateBlockClip(startPoseFor(source));
        case MoveRole::Duck:                  return m_Synth.CreateDuckClip();
        case MoveRole::DuckKick:              return m_Synth.CreateDuckKickClip();
        case MoveRole::HelloTransition:       return m_Synth.CreateHelloTransitionClip();
        case MoveRole::HelloLoop:             return m_Synth.CreateHelloWaveClip();
        case MoveRole::ArmsCrossedTransition: return m_Synth.CreateArmsCrossedTransitionClip();
        case MoveRole::ArmsCrossedLoop:       return m_Synth.CreateArmsCrossedBreathClip();
        case MoveRole::Bow:                   return m_Synth.CreateBowClip();
        case MoveRole::Fall:                  return m_Synth.CreateFallClip(startPoseFor(StartPoseSource::Live));
        case MoveRole::Count:                 break;
    }
    return nullptr;
}

StartPose PoseStateMachine::startPoseFor(StartPoseSource source) const
{
    if (source == StartPoseSource::StanceOrLive && m_State == PoseState::Stance && m_StanceSnapshot) {
        return *m_StanceSnapshot;
    }
    return m_Synth.Resolver().CaptureLive();
}

std::shared_ptr<AnimationAction> PoseStateMachine::startRole(MoveRole role, std::shared_ptr<const AnimationClip> clip,
                                                             LoopMode loop, float fadeIn)
{
    ActionSlot& s = slot(role);
    std::shared_ptr<AnimationAction> action = s.Get();
    // New clip for the role: retire the old action before binding the new one
    if (!action || action->Clip() != clip) action = s.Replace(std::move(clip));
    if (!action) return nullptr;

    action->SetLoop(loop).SetClampWhenFinished(loop == LoopMode::Once);
    action->Reset().FadeIn(fadeIn).Play();
    return action;
}

void PoseStateMachine::fadeOutOthers(MoveRole keep, float duration)
{
    for (size_t i = 0; i < m_Slots.size(); ++i) {
        if (static_cast<MoveRole>(i) == keep) continue;
        const auto& action = m_Slots[i]->Get();
        if (action && action->IsEnabled()) action->FadeOut(duration);
    }
}

void PoseStateMachine::setState(PoseState state, bool busy)
{
    if (state == m_State && busy == m_Busy) return;
    m_State = state;
    m_Busy = busy;
    Logger::Log(std::string("[PoseStateMachine] State -> ") + ToString(state) + (busy ? " (busy)" : ""));

    const std::vector<Listener> listeners = m_Listeners;
    for (const auto& l : listeners) {
        if (l.Callback) l.Callback(m_State, m_Busy);
    }
}

} // namespace animation
} // namespace fr
