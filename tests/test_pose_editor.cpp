#include <doctest/doctest.h>

#include "animation/PoseEditor.h"
#include "TestRig.h"

using namespace fr::animation;
using fr::test::LogCapture;
using fr::test::QuatClose;
using fr::test::TestRig;
using fr::test::VecClose;

TEST_SUITE("PoseEditor") {
    TEST_CASE("set and read back bone angles") {
        TestRig rig;
        PoseEditor editor(rig.Skeleton, rig.Initial);
        CHECK(editor.CanEdit());

        REQUIRE(editor.SetBoneDegrees("R_Forearm", glm::vec3(40.0f, 10.0f, 70.0f), EulerOrder::XYZ));
        const auto degrees = editor.GetBoneDegrees("R_Forearm", EulerOrder::XYZ);
        REQUIRE(degrees.has_value());
        CHECK(degrees->x == doctest::Approx(40.0f).epsilon(1e-3));
        CHECK(degrees->y == doctest::Approx(10.0f).epsilon(1e-3));
        CHECK(degrees->z == doctest::Approx(70.0f).epsilon(1e-3));

        CHECK_FALSE(editor.GetBoneDegrees("Tail", EulerOrder::XYZ).has_value());
        CHECK_FALSE(editor.SetBoneDegrees("Tail", glm::vec3(0.0f), EulerOrder::XYZ));
    }

    TEST_CASE("edits are refused while the mixer drives the rig") {
        TestRig rig;
        AnimationMixer mixer(&rig.Skeleton);
        PoseEditor editor(rig.Skeleton, rig.Initial, &mixer);

        auto clip = std::make_shared<AnimationClip>();
        clip->Name = "Hold";
        clip->Duration = 1.0f;
        BoneTrack track;
        track.BoneName = "Head";
        track.RotationKeys = { { 0.0f, rig.Initial.at("Head").Rotation } };
        clip->Tracks.push_back(track);
        auto action = mixer.CreateAction(clip);
        action->Play();

        LogCapture log;
        CHECK_FALSE(editor.CanEdit());
        CHECK_FALSE(editor.SetBoneDegrees("Head", glm::vec3(10.0f, 0.0f, 0.0f), EulerOrder::XYZ));
        CHECK_FALSE(editor.ApplyTable(GetPoseTable(PoseTableId::Stance)));
        CHECK(log.Contains(LogLevel::Warning, "Rig is animated"));

        action->Stop();
        CHECK(editor.CanEdit());
        CHECK(editor.SetBoneDegrees("Head", glm::vec3(10.0f, 0.0f, 0.0f), EulerOrder::XYZ));
    }

    TEST_CASE("applying a table poses listed bones and resets the rest") {
        TestRig rig;
        rig.Rotation("Head") = DegreesToQuat(glm::vec3(0.0f, 40.0f, 0.0f), EulerOrder::XYZ);
        PoseEditor editor(rig.Skeleton, rig.Initial);

        REQUIRE(editor.ApplyTable(GetPoseTable(PoseTableId::Stance)));
        CHECK(QuatClose(rig.Rotation("R_Thigh"), DegreesToQuat(glm::vec3(30.0f, 166.0f, 167.0f), EulerOrder::YXZ)));
        CHECK(QuatClose(rig.Rotation("Head"), rig.Initial.at("Head").Rotation));

        REQUIRE(editor.ApplyTable(GetPoseTable(PoseTableId::Duck)));
        CHECK(VecClose(rig.Position("Hip"), rig.Initial.at("Hip").Position + glm::vec3(0.0f, -0.25f, 0.0f)));
    }

    TEST_CASE("exported tables reproduce the pose") {
        TestRig rig;
        PoseEditor editor(rig.Skeleton, rig.Initial);
        REQUIRE(editor.ApplyTable(GetPoseTable(PoseTableId::Duck)));

        const std::vector<std::string> bones = { "Hip", "R_Thigh", "Spine01", "Tail" };
        const PoseTargetTable exported = editor.ExportTable("myDuck", bones, EulerOrder::YXZ);
        CHECK(exported.Name == "myDuck");
        CHECK(exported.Targets.size() == 3);
        REQUIRE(exported.Find("Hip") != nullptr);
        REQUIRE(exported.Find("Hip")->PositionOffset.has_value());
        CHECK(exported.Find("Hip")->PositionOffset->y == doctest::Approx(-0.25f));
        CHECK_FALSE(exported.Find("Spine01")->PositionOffset.has_value());

        const glm::quat thigh = rig.Rotation("R_Thigh");
        const glm::quat spine = rig.Rotation("Spine01");
        REQUIRE(editor.ApplyTable(PoseTargetTable{}));
        REQUIRE(editor.ApplyTable(exported));
        CHECK(QuatClose(rig.Rotation("R_Thigh"), thigh, 1e-4f));
        CHECK(QuatClose(rig.Rotation("Spine01"), spine, 1e-4f));
    }
}
