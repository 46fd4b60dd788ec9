#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "animation/AnimationEvaluator.h"
#include "animation/AnimationTypes.h"
#include "animation/Skeleton.h"

namespace fr {
namespace animation {

enum class LoopMode { Once, Repeat };

struct ActionFade {
    float From = 0.0f;
    float To = 1.0f;
    float Elapsed = 0.0f;
    float Duration = 0.0f; // 0 means no fade in progress
};

// Mixer-bound playback instance of a clip.
class AnimationAction {
public:
    explicit AnimationAction(std::shared_ptr<const AnimationClip> clip);

    const std::shared_ptr<const AnimationClip>& Clip() const { return m_Clip; }
    const std::string& ClipName() const { return m_Clip->Name; }

    // Chainable controls
    AnimationAction& Play();
    AnimationAction& Stop();
    AnimationAction& Reset();
    AnimationAction& FadeIn(float durationSeconds);
    AnimationAction& FadeOut(float durationSeconds);
    AnimationAction& SetLoop(LoopMode mode) { m_Loop = mode; return *this; }
    AnimationAction& SetClampWhenFinished(bool clamp) { m_ClampWhenFinished = clamp; return *this; }

    LoopMode Loop() const { return m_Loop; }
    bool ClampWhenFinished() const { return m_ClampWhenFinished; }
    float Time() const { return m_Time; }
    void SetTime(float t) { m_Time = t; }

    bool IsRunning() const { return m_Enabled && !m_Finished; }
    bool IsEnabled() const { return m_Enabled; }
    bool IsFinished() const { return m_Finished; }
    bool IsFading() const { return m_Fade.Duration > 0.0f; }
    float GetEffectiveWeight() const { return m_Enabled ? m_Weight : 0.0f; }

private:
    friend class AnimationMixer;

    // Advances fade and time. Returns true when a one-shot reaches its end this step.
    bool advance(float deltaTime);

    std::shared_ptr<const AnimationClip> m_Clip;
    ClipCursor m_Cursor;
    LoopMode m_Loop = LoopMode::Repeat;
    bool m_ClampWhenFinished = false;
    bool m_Enabled = false;
    bool m_Finished = false;
    float m_Time = 0.0f;
    float m_Weight = 1.0f;
    ActionFade m_Fade;
};

struct ClipFinishedEvent {
    std::shared_ptr<AnimationAction> Action;
    std::string ClipName;
};

// Drives every action bound to one skeleton. Update() advances all actions,
// blends their samples per bone into the live rig, then dispatches finished
// events; listeners never run while actions are being advanced.
class AnimationMixer {
public:
    using FinishedCallback = std::function<void(const ClipFinishedEvent&)>;

    explicit AnimationMixer(SkeletonComponent* skeleton);

    SkeletonComponent* Skeleton() const { return m_Skeleton; }

    std::shared_ptr<AnimationAction> CreateAction(std::shared_ptr<const AnimationClip> clip);
    // Stops the action and detaches it from the mixer.
    void RemoveAction(const std::shared_ptr<AnimationAction>& action);
    bool HasAction(const AnimationAction* action) const;
    size_t ActionCount() const { return m_Actions.size(); }

    void StopAll();
    void Update(float deltaTime);

    // True when no action contributes any weight to the rig.
    bool IsIdle() const;

    int AddFinishedListener(FinishedCallback callback);
    void RemoveFinishedListener(int id);

    float Time() const { return m_Time; }

private:
    void applyActions();

    struct Listener { int Id; FinishedCallback Callback; };

    SkeletonComponent* m_Skeleton = nullptr;
    std::vector<std::shared_ptr<AnimationAction>> m_Actions;
    std::vector<Listener> m_Listeners;
    std::vector<BoneSample> m_Scratch;
    int m_NextListenerId = 1;
    float m_Time = 0.0f;
};

// Owned slot for one move role. Holds at most one action; Replace() retires
// the previous action before the new one is bound.
class ActionSlot {
public:
    explicit ActionSlot(AnimationMixer& mixer) : m_Mixer(&mixer) {}
    ~ActionSlot();

    ActionSlot(const ActionSlot&) = delete;
    ActionSlot& operator=(const ActionSlot&) = delete;

    const std::shared_ptr<AnimationAction>& Replace(std::shared_ptr<const AnimationClip> clip);
    void Clear();

    const std::shared_ptr<AnimationAction>& Get() const { return m_Action; }
    bool Holds(const AnimationAction* action) const { return action && m_Action.get() == action; }
    explicit operator bool() const { return m_Action != nullptr; }

private:
    AnimationMixer* m_Mixer = nullptr;
    std::shared_ptr<AnimationAction> m_Action;
};

} // namespace animation
} // namespace fr
