#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "animation/AnimationMixer.h"
#include "animation/AnimationSerializer.h"
#include "animation/HumanoidRig.h"
#include "animation/MotionSettings.h"
#include "animation/PoseStateMachine.h"
#include "utils/Logger.h"

using namespace fr::animation;

namespace {

constexpr float kMinStep = 1e-4f;
constexpr float kMaxStep = 1.0f;

void PrintUsage()
{
    std::cout << "usage: fightrig_demo [--settings file.json] [--dump-clips dir] [--dt seconds] command...\n"
              << "commands: stance reset walk stopWalk punchLeft punchRight block duck duckKick\n"
              << "          hello armsCrossed bow fall\n";
}

const char* LevelTag(LogLevel level)
{
    switch (level) {
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warn";
        case LogLevel::Error:   return "error";
    }
    return "info";
}

void DumpClips(const ClipSynthesizer& synth, const std::string& dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        Logger::LogError("[Demo] Cannot create '" + dir + "': " + ec.message());
        return;
    }

    const StartPose rest = synth.Resolver().CaptureLive();
    const std::vector<std::shared_ptr<AnimationClip>> clips = {
        synth.CreateStanceClip(), synth.CreateResetClip(), synth.CreateIdleBreathClip(),
        synth.CreateWalkCycleClip(), synth.CreatePunchClip(PunchSide::Left, rest),
        synth.CreatePunchClip(PunchSide::Right, rest), synth.CreateBlockClip(rest),
        synth.CreateDuckClip(), synth.CreateDuckKickClip(), synth.CreateHelloTransitionClip(),
        synth.CreateHelloWaveClip(), synth.CreateArmsCrossedTransitionClip(),
        synth.CreateArmsCrossedBreathClip(), synth.CreateBowClip(), synth.CreateFallClip(rest)
    };
    for (const auto& clip : clips) {
        if (!clip) continue;
        const std::string path = (std::filesystem::path(dir) / (clip->Name + ".json")).string();
        if (SaveAnimationClip(*clip, path)) Logger::Log("[Demo] Wrote " + path);
        else Logger::LogError("[Demo] Failed to write " + path);
    }
}

} // namespace

int main(int argc, char** argv)
{
    Logger::SetCallback([](const std::string& message, LogLevel level) {
        (level == LogLevel::Info ? std::cout : std::cerr) << "[" << LevelTag(level) << "] " << message << "\n";
    });

    std::string settingsPath;
    std::string dumpDir;
    float dt = 1.0f / 60.0f;
    std::vector<std::string> commands;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--settings" || arg == "--dump-clips" || arg == "--dt") && i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            PrintUsage();
            return EXIT_FAILURE;
        }
        if (arg == "--settings") settingsPath = argv[++i];
        else if (arg == "--dump-clips") dumpDir = argv[++i];
        else if (arg == "--dt") dt = std::strtof(argv[++i], nullptr);
        else if (arg == "-h" || arg == "--help") { PrintUsage(); return EXIT_SUCCESS; }
        else commands.push_back(arg);
    }
    // Also rejects NaN and steps too small to count in an int
    if (!(dt >= kMinStep && dt <= kMaxStep)) {
        std::cerr << "--dt must be between " << kMinStep << " and " << kMaxStep << " seconds\n";
        return EXIT_FAILURE;
    }

    const MotionSettings settings = settingsPath.empty() ? MotionSettings{} : LoadMotionSettings(settingsPath);

    SkeletonComponent skeleton = BuildReferenceHumanoid();
    const InitialPose initialPose = CaptureInitialPose(skeleton);
    AnimationMixer mixer(&skeleton);
    PoseStateMachine machine(mixer, initialPose, settings);

    if (!dumpDir.empty()) DumpClips(machine.Synthesizer(), dumpDir);

    // Upper bound per command; the longest one-shot is the bow
    const int maxSteps = static_cast<int>(30.0f / dt);
    for (const auto& name : commands) {
        auto command = PoseCommandFromString(name);
        if (!command) {
            Logger::LogWarning("[Demo] Unknown command '" + name + "'");
            continue;
        }
        if (!machine.Request(*command)) {
            Logger::LogWarning("[Demo] Command '" + name + "' rejected in state " + ToString(machine.State()));
            continue;
        }
        int steps = 0;
        while (machine.IsBusy() && steps++ < maxSteps) mixer.Update(dt);
        // Let fades settle before the next command
        for (int i = 0; i < static_cast<int>(0.5f / dt); ++i) mixer.Update(dt);
    }

    std::cout << "final state: " << ToString(machine.State()) << "\n";
    return EXIT_SUCCESS;
}
