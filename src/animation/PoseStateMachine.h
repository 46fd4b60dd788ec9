#pragma once

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "animation/AnimationMixer.h"
#include "animation/ClipSynthesizer.h"
#include "animation/PoseMoves.h"
#include "animation/Skeleton.h"

namespace fr {
namespace animation {

// Discrete pose controller. Commands are looked up in the move table, the
// matching clip is synthesized (or taken from the cache for static moves) and
// played in its role's slot while every other slot fades out. Clip-finished
// events from the mixer settle the state and start chained loops.
class PoseStateMachine {
public:
    using StateCallback = std::function<void(PoseState state, bool busy)>;

    // The mixer must outlive the state machine.
    PoseStateMachine(AnimationMixer& mixer, const InitialPose& initialPose,
                     const MotionSettings& settings = MotionSettings{});
    ~PoseStateMachine();

    PoseStateMachine(const PoseStateMachine&) = delete;
    PoseStateMachine& operator=(const PoseStateMachine&) = delete;

    // Returns false when the command is rejected (busy, gated by state, or the
    // clip could not be synthesized). A rejected command changes nothing.
    bool Request(PoseCommand command);

    // Hands the rig to manual editing: every mixer action is stopped and the
    // state is kept. Refused while a move is in flight.
    bool Release();

    PoseState State() const { return m_State; }
    bool IsBusy() const { return m_Busy; }

    const std::optional<StartPose>& StanceSnapshot() const { return m_StanceSnapshot; }
    const ClipSynthesizer& Synthesizer() const { return m_Synth; }
    AnimationMixer& Mixer() { return m_Mixer; }

    // Replaces the motion settings and drops every cached clip.
    void SetSettings(const MotionSettings& settings);

    // Current action of a role, null when the slot is empty.
    std::shared_ptr<AnimationAction> ActionFor(MoveRole role) const;

    int AddStateListener(StateCallback callback);
    void RemoveStateListener(int id);

private:
    void onClipFinished(const ClipFinishedEvent& e);
    std::shared_ptr<const AnimationClip> clipFor(MoveRole role, const MoveDescriptor* move);
    std::shared_ptr<const AnimationClip> synthesize(MoveRole role, const MoveDescriptor* move) const;
    StartPose startPoseFor(StartPoseSource source) const;
    std::shared_ptr<AnimationAction> startRole(MoveRole role, std::shared_ptr<const AnimationClip> clip,
                                               LoopMode loop, float fadeIn);
    void fadeOutOthers(MoveRole keep, float duration);
    void setState(PoseState state, bool busy);

    ActionSlot& slot(MoveRole role) { return *m_Slots[static_cast<size_t>(role)]; }
    const ActionSlot& slot(MoveRole role) const { return *m_Slots[static_cast<size_t>(role)]; }

    struct Listener { int Id; StateCallback Callback; };

    AnimationMixer& m_Mixer;
    InitialPose m_InitialPose;
    ClipSynthesizer m_Synth;
    std::array<std::unique_ptr<ActionSlot>, static_cast<size_t>(MoveRole::Count)> m_Slots;
    std::array<std::shared_ptr<const AnimationClip>, static_cast<size_t>(MoveRole::Count)> m_ClipCache;

    PoseState m_State = PoseState::Initial;
    bool m_Busy = false;
    const MoveDescriptor* m_CurrentMove = nullptr;
    std::shared_ptr<AnimationAction> m_CurrentAction;
    std::optional<StartPose> m_StanceSnapshot;

    std::vector<Listener> m_Listeners;
    int m_NextListenerId = 1;
    int m_MixerListenerId = 0;
};

} // namespace animation
} // namespace fr
