#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace fr {
namespace animation {

// Tunable synthesis parameters. Durations in seconds, angles in degrees.
struct MotionSettings {
    float StanceDuration = 0.5f;
    float ResetDuration = 0.3f;

    float IdleBreathDuration = 3.5f;
    float IdleBreathIntensity = 0.8f;

    float WalkCycleDuration = 0.7f;     // one full stride (two steps)
    float WalkStepHeight = 5.0f;        // thigh lift on Z
    float WalkStrideLength = 25.0f;     // thigh swing on X
    float WalkSpineTwist = 8.0f;        // spine twist on Y

    float PunchDuration = 0.6f;
    float BlockDuration = 0.3f;
    float DuckDuration = 0.3f;
    float DuckKickDuration = 0.8f;

    float HelloTransitionDuration = 0.5f;
    float HelloWaveDuration = 1.2f;
    float HelloWaveAmplitude = 20.0f;

    float ArmsCrossedTransitionDuration = 0.5f;

    // Absolute keyframe times of the bow
    float BowTimes[4] = { 0.0f, 1.0f, 3.5f, 4.5f };
    float BowFirstBend = 20.0f;
    float BowSecondBend = 40.0f;

    float FallDuration = 0.8f;
};

inline void to_json(nlohmann::json& j, const MotionSettings& s) {
    j = nlohmann::json{
        {"stanceDuration", s.StanceDuration},
        {"resetDuration", s.ResetDuration},
        {"idleBreathDuration", s.IdleBreathDuration},
        {"idleBreathIntensity", s.IdleBreathIntensity},
        {"walkCycleDuration", s.WalkCycleDuration},
        {"walkStepHeight", s.WalkStepHeight},
        {"walkStrideLength", s.WalkStrideLength},
        {"walkSpineTwist", s.WalkSpineTwist},
        {"punchDuration", s.PunchDuration},
        {"blockDuration", s.BlockDuration},
        {"duckDuration", s.DuckDuration},
        {"duckKickDuration", s.DuckKickDuration},
        {"helloTransitionDuration", s.HelloTransitionDuration},
        {"helloWaveDuration", s.HelloWaveDuration},
        {"helloWaveAmplitude", s.HelloWaveAmplitude},
        {"armsCrossedTransitionDuration", s.ArmsCrossedTransitionDuration},
        {"bowTimes", {s.BowTimes[0], s.BowTimes[1], s.BowTimes[2], s.BowTimes[3]}},
        {"bowFirstBend", s.BowFirstBend},
        {"bowSecondBend", s.BowSecondBend},
        {"fallDuration", s.FallDuration}
    };
}

inline void from_json(const nlohmann::json& j, MotionSettings& s) {
    const MotionSettings d{};
    s.StanceDuration = j.value("stanceDuration", d.StanceDuration);
    s.ResetDuration = j.value("resetDuration", d.ResetDuration);
    s.IdleBreathDuration = j.value("idleBreathDuration", d.IdleBreathDuration);
    s.IdleBreathIntensity = j.value("idleBreathIntensity", d.IdleBreathIntensity);
    s.WalkCycleDuration = j.value("walkCycleDuration", d.WalkCycleDuration);
    s.WalkStepHeight = j.value("walkStepHeight", d.WalkStepHeight);
    s.WalkStrideLength = j.value("walkStrideLength", d.WalkStrideLength);
    s.WalkSpineTwist = j.value("walkSpineTwist", d.WalkSpineTwist);
    s.PunchDuration = j.value("punchDuration", d.PunchDuration);
    s.BlockDuration = j.value("blockDuration", d.BlockDuration);
    s.DuckDuration = j.value("duckDuration", d.DuckDuration);
    s.DuckKickDuration = j.value("duckKickDuration", d.DuckKickDuration);
    s.HelloTransitionDuration = j.value("helloTransitionDuration", d.HelloTransitionDuration);
    s.HelloWaveDuration = j.value("helloWaveDuration", d.HelloWaveDuration);
    s.HelloWaveAmplitude = j.value("helloWaveAmplitude", d.HelloWaveAmplitude);
    s.ArmsCrossedTransitionDuration = j.value("armsCrossedTransitionDuration", d.ArmsCrossedTransitionDuration);
    if (j.contains("bowTimes") && j["bowTimes"].is_array() && j["bowTimes"].size() == 4) {
        for (int i = 0; i < 4; ++i) s.BowTimes[i] = j["bowTimes"][i].get<float>();
    } else {
        for (int i = 0; i < 4; ++i) s.BowTimes[i] = d.BowTimes[i];
    }
    s.BowFirstBend = j.value("bowFirstBend", d.BowFirstBend);
    s.BowSecondBend = j.value("bowSecondBend", d.BowSecondBend);
    s.FallDuration = j.value("fallDuration", d.FallDuration);
}

// Missing file or malformed document: logs and returns defaults.
MotionSettings LoadMotionSettings(const std::string& path);
bool SaveMotionSettings(const MotionSettings& settings, const std::string& path);

} // namespace animation
} // namespace fr
