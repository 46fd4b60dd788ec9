#include "animation/AnimationMixer.h"

#include <algorithm>
#include <cmath>

#include "utils/Logger.h"

namespace fr {
namespace animation {

// -----------------------------
// AnimationAction
// -----------------------------
AnimationAction::AnimationAction(std::shared_ptr<const AnimationClip> clip)
    : m_Clip(std::move(clip))
{
}

AnimationAction& AnimationAction::Play()
{
    m_Enabled = true;
    return *this;
}

AnimationAction& AnimationAction::Stop()
{
    m_Enabled = false;
    m_Finished = false;
    m_Time = 0.0f;
    m_Weight = 1.0f;
    m_Fade = {};
    return *this;
}

AnimationAction& AnimationAction::Reset()
{
    m_Finished = false;
    m_Time = 0.0f;
    m_Weight = 1.0f;
    m_Fade = {};
    m_Cursor = {};
    return *this;
}

AnimationAction& AnimationAction::FadeIn(float durationSeconds)
{
    if (durationSeconds <= 0.0f) {
        m_Weight = 1.0f;
        m_Fade = {};
        return *this;
    }
    m_Weight = 0.0f;
    m_Fade = ActionFade{ 0.0f, 1.0f, 0.0f, durationSeconds };
    return *this;
}

AnimationAction& AnimationAction::FadeOut(float durationSeconds)
{
    if (!m_Enabled) return *this;
    if (durationSeconds <= 0.0f) {
        m_Enabled = false;
        m_Fade = {};
        return *this;
    }
    m_Fade = ActionFade{ m_Weight, 0.0f, 0.0f, durationSeconds };
    return *this;
}

bool AnimationAction::advance(float deltaTime)
{
    if (!m_Enabled) return false;

    if (m_Fade.Duration > 0.0f) {
        m_Fade.Elapsed += deltaTime;
        const float alpha = std::min(1.0f, m_Fade.Elapsed / m_Fade.Duration);
        m_Weight = m_Fade.From + (m_Fade.To - m_Fade.From) * alpha;
        if (alpha >= 1.0f) {
            m_Weight = m_Fade.To;
            m_Fade = {};
            // Faded out completely: the action stops without a finished event
            if (m_Weight <= 0.0f) {
                m_Enabled = false;
                return false;
            }
        }
    }

    if (m_Finished) return false;

    m_Time += deltaTime;
    const float duration = m_Clip->Duration;
    if (m_Loop == LoopMode::Repeat) {
        m_Time = WrapClipTime(m_Time, duration, true);
        return false;
    }
    if (m_Time >= duration) {
        m_Time = duration;
        m_Finished = true;
        return true;
    }
    return false;
}

// -----------------------------
// AnimationMixer
// -----------------------------
AnimationMixer::AnimationMixer(SkeletonComponent* skeleton)
    : m_Skeleton(skeleton)
{
}

std::shared_ptr<AnimationAction> AnimationMixer::CreateAction(std::shared_ptr<const AnimationClip> clip)
{
    if (!clip) {
        Logger::LogWarning("[AnimationMixer] CreateAction called without a clip.");
        return nullptr;
    }
    auto action = std::make_shared<AnimationAction>(std::move(clip));
    m_Actions.push_back(action);
    return action;
}

void AnimationMixer::RemoveAction(const std::shared_ptr<AnimationAction>& action)
{
    if (!action) return;
    action->Stop();
    m_Actions.erase(std::remove(m_Actions.begin(), m_Actions.end(), action), m_Actions.end());
}

bool AnimationMixer::HasAction(const AnimationAction* action) const
{
    for (const auto& a : m_Actions) if (a.get() == action) return true;
    return false;
}

void AnimationMixer::StopAll()
{
    for (auto& a : m_Actions) a->Stop();
}

bool AnimationMixer::IsIdle() const
{
    for (const auto& a : m_Actions) {
        if (a->GetEffectiveWeight() > 0.0f) return false;
    }
    return true;
}

int AnimationMixer::AddFinishedListener(FinishedCallback callback)
{
    const int id = m_NextListenerId++;
    m_Listeners.push_back(Listener{ id, std::move(callback) });
    return id;
}

void AnimationMixer::RemoveFinishedListener(int id)
{
    m_Listeners.erase(std::remove_if(m_Listeners.begin(), m_Listeners.end(),
                                     [id](const Listener& l) { return l.Id == id; }),
                      m_Listeners.end());
}

void AnimationMixer::Update(float deltaTime)
{
    m_Time += deltaTime;

    std::vector<ClipFinishedEvent> finished;
    for (auto& a : m_Actions) {
        if (a->advance(deltaTime)) finished.push_back(ClipFinishedEvent{ a, a->ClipName() });
    }

    applyActions();

    // Non-clamping one-shots leave the rig at their last pose and release it
    for (auto& a : m_Actions) {
        if (a->m_Finished && !a->m_ClampWhenFinished) a->m_Enabled = false;
    }

    if (finished.empty()) return;
    const std::vector<Listener> listeners = m_Listeners;
    for (const auto& e : finished) {
        for (const auto& l : listeners) {
            if (l.Callback) l.Callback(e);
        }
    }
}

void AnimationMixer::applyActions()
{
    if (!m_Skeleton) return;

    struct Accum {
        float RotWeight = 0.0f;
        float PosWeight = 0.0f;
        glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 Position{0.0f};
    };
    std::vector<Accum> accum(m_Skeleton->BoneCount());

    for (auto& a : m_Actions) {
        const float w = a->GetEffectiveWeight();
        if (w <= 0.0f) continue;
        EvaluateClip(*a->m_Clip, a->m_Time, *m_Skeleton, m_Scratch, &a->m_Cursor);
        for (const auto& s : m_Scratch) {
            Accum& acc = accum[static_cast<size_t>(s.BoneIndex)];
            if (s.HasRotation) {
                if (acc.RotWeight <= 0.0f) acc.Rotation = s.Rotation;
                else acc.Rotation = glm::slerp(acc.Rotation, s.Rotation, w / (acc.RotWeight + w));
                acc.RotWeight += w;
            }
            if (s.HasPosition) {
                if (acc.PosWeight <= 0.0f) acc.Position = s.Position;
                else acc.Position = glm::mix(acc.Position, s.Position, w / (acc.PosWeight + w));
                acc.PosWeight += w;
            }
        }
    }

    // Partial total weight blends from the bone's current live value
    for (size_t i = 0; i < accum.size(); ++i) {
        const Accum& acc = accum[i];
        if (acc.RotWeight > 0.0f) {
            glm::quat q = acc.Rotation;
            if (acc.RotWeight < 1.0f) q = glm::slerp(m_Skeleton->LocalRotations[i], q, acc.RotWeight);
            m_Skeleton->LocalRotations[i] = glm::normalize(q);
        }
        if (acc.PosWeight > 0.0f) {
            glm::vec3 p = acc.Position;
            if (acc.PosWeight < 1.0f) p = glm::mix(m_Skeleton->LocalPositions[i], p, acc.PosWeight);
            m_Skeleton->LocalPositions[i] = p;
        }
    }
}

// -----------------------------
// ActionSlot
// -----------------------------
ActionSlot::~ActionSlot()
{
    Clear();
}

const std::shared_ptr<AnimationAction>& ActionSlot::Replace(std::shared_ptr<const AnimationClip> clip)
{
    Clear();
    if (clip) m_Action = m_Mixer->CreateAction(std::move(clip));
    return m_Action;
}

void ActionSlot::Clear()
{
    if (!m_Action) return;
    m_Mixer->RemoveAction(m_Action);
    m_Action.reset();
}

} // namespace animation
} // namespace fr
