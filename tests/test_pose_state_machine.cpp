#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "animation/PoseEditor.h"
#include "animation/PoseStateMachine.h"
#include "TestRig.h"

using namespace fr::animation;
using fr::test::LogCapture;
using fr::test::QuatClose;
using fr::test::TestRig;
using fr::test::Tick;
using fr::test::VecClose;

namespace {
glm::quat deg(float x, float y, float z, EulerOrder order = EulerOrder::XYZ)
{
    return DegreesToQuat(glm::vec3(x, y, z), order);
}

struct Harness {
    TestRig Rig;
    AnimationMixer Mixer{ &Rig.Skeleton };
    PoseStateMachine Machine{ Mixer, Rig.Initial };

    // Runs the mixer until the current move settles.
    bool Settle(float maxSeconds = 10.0f) {
        const float dt = 1.0f / 60.0f;
        for (float t = 0.0f; t < maxSeconds && Machine.IsBusy(); t += dt) Mixer.Update(dt);
        return !Machine.IsBusy();
    }

    bool Run(PoseCommand command) {
        if (!Machine.Request(command)) return false;
        return Settle();
    }
};
}

TEST_SUITE("PoseStateMachine") {
    TEST_CASE("starts in the initial state") {
        Harness h;
        CHECK(h.Machine.State() == PoseState::Initial);
        CHECK_FALSE(h.Machine.IsBusy());
        CHECK_FALSE(h.Machine.StanceSnapshot().has_value());
    }

    TEST_CASE("stance then reset walks through the expected states") {
        Harness h;
        std::vector<PoseState> states;
        h.Machine.AddStateListener([&](PoseState s, bool) { states.push_back(s); });

        REQUIRE(h.Machine.Request(PoseCommand::Stance));
        CHECK(h.Machine.IsBusy());
        CHECK(h.Machine.State() == PoseState::Transitioning);
        REQUIRE(h.Settle());
        CHECK(h.Machine.State() == PoseState::Stance);
        CHECK(QuatClose(h.Rig.Rotation("R_Thigh"), deg(30, 166, 167, EulerOrder::YXZ)));
        CHECK(QuatClose(h.Rig.Rotation("R_Forearm"), deg(51, 13, 72)));
        CHECK(h.Machine.StanceSnapshot().has_value());

        REQUIRE(h.Run(PoseCommand::Reset));
        CHECK(h.Machine.State() == PoseState::Initial);
        CHECK(QuatClose(h.Rig.Rotation("R_Thigh"), h.Rig.Initial.at("R_Thigh").Rotation));
        CHECK(QuatClose(h.Rig.Rotation("R_Forearm"), h.Rig.Initial.at("R_Forearm").Rotation));
        CHECK_FALSE(h.Machine.StanceSnapshot().has_value());

        const std::vector<PoseState> expected = {
            PoseState::Transitioning, PoseState::Stance, PoseState::Transitioning, PoseState::Initial
        };
        CHECK(states == expected);
    }

    TEST_CASE("stance and reset on a minimal rig return to the load pose") {
        SkeletonComponent skeleton;
        skeleton.AddBone("Hip", -1, glm::vec3(0.0f, 1.0f, 0.0f));
        skeleton.AddBone("Spine01", 0);
        skeleton.AddBone("L_Thigh", 0);
        skeleton.AddBone("R_Thigh", 0);
        skeleton.AddBone("Head", 1);
        const InitialPose initial = CaptureInitialPose(skeleton);

        AnimationMixer mixer(&skeleton);
        PoseStateMachine machine(mixer, initial);
        std::vector<PoseState> states;
        machine.AddStateListener([&](PoseState s, bool) { states.push_back(s); });

        const float dt = 1.0f / 60.0f;
        REQUIRE(machine.Request(PoseCommand::Stance));
        for (int i = 0; i < 600 && machine.IsBusy(); ++i) mixer.Update(dt);
        REQUIRE(machine.State() == PoseState::Stance);
        CHECK(QuatClose(skeleton.LocalRotations[3], deg(30, 166, 167, EulerOrder::YXZ)));

        REQUIRE(machine.Request(PoseCommand::Reset));
        for (int i = 0; i < 600 && machine.IsBusy(); ++i) mixer.Update(dt);
        CHECK(machine.State() == PoseState::Initial);

        const std::vector<PoseState> expected = {
            PoseState::Transitioning, PoseState::Stance, PoseState::Transitioning, PoseState::Initial
        };
        CHECK(states == expected);
        for (size_t i = 0; i < skeleton.BoneCount(); ++i) {
            CAPTURE(skeleton.BoneNames[i]);
            CHECK(QuatClose(skeleton.LocalRotations[i], initial.at(skeleton.BoneNames[i]).Rotation));
        }
    }

    TEST_CASE("stance chains the idle loop") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Stance));
        auto idle = h.Machine.ActionFor(MoveRole::Idle);
        REQUIRE(idle);
        CHECK(idle->IsRunning());
        CHECK(idle->Loop() == LoopMode::Repeat);

        auto stance = h.Machine.ActionFor(MoveRole::Stance);
        REQUIRE(stance);
        CHECK(stance->IsFading());
        Tick(h.Mixer, 0.5f);
        CHECK_FALSE(stance->IsEnabled());
    }

    TEST_CASE("commands are refused while busy") {
        Harness h;
        REQUIRE(h.Machine.Request(PoseCommand::Stance));
        CHECK_FALSE(h.Machine.Request(PoseCommand::Block));
        CHECK_FALSE(h.Machine.Request(PoseCommand::Reset));
        CHECK(h.Machine.State() == PoseState::Transitioning);
    }

    TEST_CASE("commands are gated by the current state") {
        Harness h;
        CHECK_FALSE(h.Machine.Request(PoseCommand::Walk));
        CHECK_FALSE(h.Machine.Request(PoseCommand::StopWalk));
        CHECK_FALSE(h.Machine.Request(PoseCommand::DuckKick));
        CHECK(h.Machine.State() == PoseState::Initial);

        REQUIRE(h.Run(PoseCommand::Stance));
        CHECK_FALSE(h.Machine.Request(PoseCommand::Stance));
        CHECK_FALSE(h.Machine.Request(PoseCommand::StopWalk));
    }

    TEST_CASE("walk and stop walk are immediate") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Stance));

        REQUIRE(h.Machine.Request(PoseCommand::Walk));
        CHECK(h.Machine.State() == PoseState::Walking);
        CHECK_FALSE(h.Machine.IsBusy());
        auto walk = h.Machine.ActionFor(MoveRole::Walk);
        REQUIRE(walk);
        Tick(h.Mixer, 1.0f);
        CHECK(walk->IsRunning());

        REQUIRE(h.Machine.Request(PoseCommand::StopWalk));
        CHECK(h.Machine.State() == PoseState::Stance);
        CHECK_FALSE(h.Machine.IsBusy());
        CHECK(h.Machine.ActionFor(MoveRole::Idle)->IsEnabled());
        Tick(h.Mixer, 0.5f);
        CHECK_FALSE(walk->IsEnabled());
    }

    TEST_CASE("punch in stance starts from the captured snapshot") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Stance));
        const glm::quat stanceArm = deg(-51, 32, 107);

        // The live rig is moved away from the snapshot before the punch
        h.Rig.Rotation("R_Upperarm") = deg(0, 0, 45);
        REQUIRE(h.Machine.Request(PoseCommand::PunchRight));
        CHECK(h.Machine.State() == PoseState::Punching);

        auto punch = h.Machine.ActionFor(MoveRole::PunchRight);
        REQUIRE(punch);
        const BoneTrack* arm = punch->Clip()->FindTrack("R_Upperarm");
        REQUIRE(arm != nullptr);
        CHECK(QuatClose(arm->RotationKeys.front().Value, stanceArm));

        REQUIRE(h.Settle());
        CHECK(h.Machine.State() == PoseState::Stance);
        REQUIRE(h.Machine.ActionFor(MoveRole::Idle));
        CHECK(h.Machine.ActionFor(MoveRole::Idle)->IsRunning());
    }

    TEST_CASE("punch outside stance starts from the live rig") {
        Harness h;
        const glm::quat edited = deg(0, 0, 45);
        h.Rig.Rotation("R_Upperarm") = edited;

        REQUIRE(h.Machine.Request(PoseCommand::PunchRight));
        auto punch = h.Machine.ActionFor(MoveRole::PunchRight);
        REQUIRE(punch);
        CHECK(QuatClose(punch->Clip()->FindTrack("R_Upperarm")->RotationKeys.front().Value, edited));

        REQUIRE(h.Settle());
        CHECK(h.Machine.State() == PoseState::Stance);
    }

    TEST_CASE("punches are regenerated on every trigger") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::PunchLeft));
        auto first = h.Machine.ActionFor(MoveRole::PunchLeft)->Clip();
        REQUIRE(h.Run(PoseCommand::PunchLeft));
        auto second = h.Machine.ActionFor(MoveRole::PunchLeft)->Clip();
        CHECK(first != second);
        CHECK(h.Machine.ActionFor(MoveRole::PunchLeft) != nullptr);
    }

    TEST_CASE("block holds the block pose") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Block));
        CHECK(h.Machine.State() == PoseState::Blocking);
        Tick(h.Mixer, 0.5f);
        CHECK(QuatClose(h.Rig.Rotation("L_Forearm"), deg(0, -5, -95)));
        CHECK(QuatClose(h.Rig.Rotation("R_Forearm"), deg(138, 69, -95)));
        CHECK_FALSE(h.Machine.Request(PoseCommand::Block));
    }

    TEST_CASE("duck lowers the hip and duck-kick returns to the duck") {
        Harness h;
        const glm::vec3 lowered = h.Rig.Initial.at("Hip").Position + glm::vec3(0.0f, -0.25f, 0.0f);

        REQUIRE(h.Run(PoseCommand::Duck));
        CHECK(h.Machine.State() == PoseState::Ducking);
        CHECK(VecClose(h.Rig.Position("Hip"), lowered));

        REQUIRE(h.Machine.Request(PoseCommand::DuckKick));
        CHECK(h.Machine.State() == PoseState::Kicking);
        CHECK(h.Machine.IsBusy());
        REQUIRE(h.Settle());
        CHECK(h.Machine.State() == PoseState::Ducking);
        CHECK(QuatClose(h.Rig.Rotation("Spine01"), deg(18, 0, 0)));
        CHECK(QuatClose(h.Rig.Rotation("R_Thigh"), deg(75, 166, 167, EulerOrder::YXZ)));
        CHECK(VecClose(h.Rig.Position("Hip"), lowered));
    }

    TEST_CASE("stance from ducking brings the hip back up") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Duck));
        REQUIRE(h.Run(PoseCommand::Stance));
        CHECK(h.Machine.State() == PoseState::Stance);
        CHECK(VecClose(h.Rig.Position("Hip"), h.Rig.Initial.at("Hip").Position));

        const auto& snapshot = h.Machine.StanceSnapshot();
        REQUIRE(snapshot.has_value());
        for (const char* bone : { "Spine01", "Spine02", "Head", "L_Foot" }) {
            CAPTURE(bone);
            REQUIRE(snapshot->Find(bone) != nullptr);
            CHECK(QuatClose(*snapshot->Find(bone), h.Rig.Initial.at(bone).Rotation));
        }
    }

    TEST_CASE("stance from blocking relaxes the hands") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Block));
        CHECK_FALSE(QuatClose(h.Rig.Rotation("L_Hand"), h.Rig.Initial.at("L_Hand").Rotation));

        REQUIRE(h.Run(PoseCommand::Stance));
        const auto& snapshot = h.Machine.StanceSnapshot();
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->Find("L_Hand") != nullptr);
        CHECK(QuatClose(*snapshot->Find("L_Hand"), h.Rig.Initial.at("L_Hand").Rotation));
        CHECK(QuatClose(*snapshot->Find("R_Forearm"), deg(51, 13, 72)));
    }

    TEST_CASE("reset returns every bone to the initial pose from any settled state") {
        struct Route { const char* Name; std::vector<PoseCommand> Commands; };
        const std::vector<Route> routes = {
            { "walking", { PoseCommand::Stance, PoseCommand::Walk } },
            { "waving", { PoseCommand::Hello } },
            { "armsCrossed", { PoseCommand::ArmsCrossed } },
            { "ducking", { PoseCommand::Duck } },
            { "duckKick", { PoseCommand::Duck, PoseCommand::DuckKick } },
            { "blocking", { PoseCommand::Block } },
            { "fallen", { PoseCommand::Fall } },
        };

        for (const Route& route : routes) {
            CAPTURE(route.Name);
            Harness h;
            for (PoseCommand c : route.Commands) REQUIRE(h.Run(c));
            Tick(h.Mixer, 0.45f);

            REQUIRE(h.Run(PoseCommand::Reset));
            CHECK(h.Machine.State() == PoseState::Initial);
            for (const auto& entry : h.Rig.Initial) {
                CAPTURE(entry.first);
                CHECK(QuatClose(h.Rig.Rotation(entry.first), entry.second.Rotation));
            }
            CHECK(VecClose(h.Rig.Position("Hip"), h.Rig.Initial.at("Hip").Position));
        }
    }

    TEST_CASE("a released rig can be edited by hand") {
        Harness h;
        PoseEditor editor(h.Rig.Skeleton, h.Rig.Initial, &h.Mixer);
        REQUIRE(h.Run(PoseCommand::Stance));
        REQUIRE(h.Run(PoseCommand::Reset));
        CHECK_FALSE(editor.CanEdit());

        REQUIRE(h.Machine.Release());
        CHECK(h.Machine.State() == PoseState::Initial);
        CHECK(h.Mixer.IsIdle());
        REQUIRE(editor.SetBoneDegrees("Head", glm::vec3(10.0f, 0.0f, 0.0f), EulerOrder::XYZ));
        Tick(h.Mixer, 0.2f);
        CHECK(QuatClose(h.Rig.Rotation("Head"), deg(10, 0, 0)));

        // The machine still accepts commands afterwards
        REQUIRE(h.Run(PoseCommand::Stance));
        CHECK(QuatClose(h.Rig.Rotation("R_Thigh"), deg(30, 166, 167, EulerOrder::YXZ)));
    }

    TEST_CASE("the rig is not released mid-move") {
        Harness h;
        REQUIRE(h.Machine.Request(PoseCommand::Stance));
        Tick(h.Mixer, 0.1f);
        LogCapture log;
        CHECK_FALSE(h.Machine.Release());
        CHECK(log.Contains(LogLevel::Warning, "Cannot release"));
        CHECK_FALSE(h.Mixer.IsIdle());
        REQUIRE(h.Settle());
        CHECK(h.Machine.State() == PoseState::Stance);
    }

    TEST_CASE("static clips are cached until the settings change") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Duck));
        auto first = h.Machine.ActionFor(MoveRole::Duck)->Clip();
        CHECK(first->Duration == doctest::Approx(0.3f));

        REQUIRE(h.Run(PoseCommand::Stance));
        REQUIRE(h.Run(PoseCommand::Duck));
        CHECK(h.Machine.ActionFor(MoveRole::Duck)->Clip() == first);

        MotionSettings slower;
        slower.DuckDuration = 0.6f;
        h.Machine.SetSettings(slower);
        REQUIRE(h.Run(PoseCommand::Stance));
        REQUIRE(h.Run(PoseCommand::Duck));
        CHECK(h.Machine.ActionFor(MoveRole::Duck)->Clip() != first);
        CHECK(h.Machine.ActionFor(MoveRole::Duck)->Clip()->Duration == doctest::Approx(0.6f));
    }

    TEST_CASE("hello waves until another command") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Hello));
        CHECK(h.Machine.State() == PoseState::Waving);
        auto wave = h.Machine.ActionFor(MoveRole::HelloLoop);
        REQUIRE(wave);
        CHECK(wave->IsRunning());
        CHECK_FALSE(h.Machine.Request(PoseCommand::Hello));

        REQUIRE(h.Run(PoseCommand::ArmsCrossed));
        CHECK(h.Machine.State() == PoseState::ArmsCrossed);
        CHECK(h.Machine.ActionFor(MoveRole::ArmsCrossedLoop)->IsRunning());
        CHECK_FALSE(wave->IsEnabled());
    }

    TEST_CASE("fall only recovers through reset") {
        Harness h;
        REQUIRE(h.Machine.Request(PoseCommand::Fall));
        CHECK(h.Machine.State() == PoseState::Falling);
        REQUIRE(h.Settle());
        CHECK(h.Machine.State() == PoseState::Fallen);
        CHECK(QuatClose(h.Rig.Rotation("Hip"), deg(-80, 0, 0)));

        CHECK_FALSE(h.Machine.Request(PoseCommand::Stance));
        CHECK_FALSE(h.Machine.Request(PoseCommand::Fall));
        REQUIRE(h.Run(PoseCommand::Reset));
        CHECK(h.Machine.State() == PoseState::Initial);
        CHECK(QuatClose(h.Rig.Rotation("Hip"), h.Rig.Initial.at("Hip").Rotation));
    }

    TEST_CASE("bow returns to initial and drops the stance snapshot") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Stance));
        REQUIRE(h.Machine.StanceSnapshot().has_value());

        REQUIRE(h.Machine.Request(PoseCommand::Bow));
        CHECK(h.Machine.State() == PoseState::Bowing);
        REQUIRE(h.Settle());
        CHECK(h.Machine.State() == PoseState::Initial);
        CHECK_FALSE(h.Machine.StanceSnapshot().has_value());
    }

    TEST_CASE("finished clips the machine did not start are ignored") {
        Harness h;
        REQUIRE(h.Run(PoseCommand::Block));

        auto clip = std::make_shared<AnimationClip>();
        clip->Name = "External";
        clip->Duration = 0.1f;
        BoneTrack track;
        track.BoneName = "Head";
        track.RotationKeys = { { 0.0f, h.Rig.Initial.at("Head").Rotation } };
        clip->Tracks.push_back(track);

        LogCapture log;
        h.Mixer.CreateAction(clip)->SetLoop(LoopMode::Once).Play();
        Tick(h.Mixer, 0.2f);
        CHECK(log.Contains(LogLevel::Info, "Clip finished: External"));
        CHECK(h.Machine.State() == PoseState::Blocking);
        CHECK_FALSE(h.Machine.IsBusy());
    }

    TEST_CASE("removed state listeners stop receiving updates") {
        Harness h;
        int calls = 0;
        const int id = h.Machine.AddStateListener([&](PoseState, bool) { ++calls; });
        REQUIRE(h.Run(PoseCommand::Block));
        CHECK(calls == 2);

        h.Machine.RemoveStateListener(id);
        REQUIRE(h.Run(PoseCommand::Reset));
        CHECK(calls == 2);
    }

    TEST_CASE("a rig without an initial pose refuses every command") {
        TestRig rig;
        AnimationMixer mixer(&rig.Skeleton);
        PoseStateMachine machine(mixer, InitialPose{});
        LogCapture log;
        CHECK_FALSE(machine.Request(PoseCommand::Stance));
        CHECK(machine.State() == PoseState::Initial);
        CHECK_FALSE(machine.IsBusy());
        CHECK(log.Contains(LogLevel::Warning, "Could not synthesize"));
    }

    TEST_CASE("state and command names round trip") {
        const PoseState states[] = {
            PoseState::Initial, PoseState::Stance, PoseState::Blocking, PoseState::Ducking,
            PoseState::Walking, PoseState::Transitioning, PoseState::Punching, PoseState::Kicking,
            PoseState::Waving, PoseState::ArmsCrossed, PoseState::Bowing, PoseState::Falling, PoseState::Fallen
        };
        for (PoseState s : states) {
            auto parsed = PoseStateFromString(ToString(s));
            REQUIRE(parsed.has_value());
            CHECK(*parsed == s);
        }
        CHECK(std::string(ToString(PoseState::ArmsCrossed)) == "armsCrossed");

        auto kick = PoseCommandFromString("duckKick");
        REQUIRE(kick.has_value());
        CHECK(*kick == PoseCommand::DuckKick);
        CHECK(std::string(ToString(PoseCommand::StopWalk)) == "stopWalk");
        CHECK_FALSE(PoseCommandFromString("jump").has_value());
    }
}
