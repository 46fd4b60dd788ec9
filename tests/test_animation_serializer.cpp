#include <doctest/doctest.h>

#include <filesystem>

#include "animation/AnimationSerializer.h"
#include "TestRig.h"

using namespace fr::animation;
using fr::test::LogCapture;
using fr::test::QuatClose;
using fr::test::VecClose;

namespace {
std::string tempPath(const std::string& file)
{
    return (std::filesystem::temp_directory_path() / file).string();
}

AnimationClip makeClip()
{
    AnimationClip clip;
    clip.Name = "DuckPose";
    clip.Duration = 0.3f;

    BoneTrack hip;
    hip.BoneName = "Hip";
    hip.PositionKeys = { { 0.0f, glm::vec3(0.0f, 1.0f, 0.0f) }, { 0.3f, glm::vec3(0.0f, 0.75f, 0.0f) } };
    BoneTrack head;
    head.BoneName = "Head";
    head.RotationKeys = { { 0.0f, glm::quat(1.0f, 0.0f, 0.0f, 0.0f) },
                          { 0.3f, DegreesToQuat(glm::vec3(-20.0f, 0.0f, 0.0f), EulerOrder::XYZ) } };
    BoneTrack spine;
    spine.BoneName = "Spine01";
    spine.RotationKeys = { { 0.0f, DegreesToQuat(glm::vec3(18.0f, 0.0f, 0.0f), EulerOrder::XYZ) } };

    clip.Tracks = { hip, head, spine };
    return clip;
}
}

TEST_SUITE("AnimationSerializer") {
    TEST_CASE("clip json layout") {
        const json j = SerializeAnimationClip(makeClip());
        CHECK(j["name"].get<std::string>() == "DuckPose");
        REQUIRE(j["tracks"].is_array());
        CHECK(j["tracks"][0]["bone"].get<std::string>() == "Hip");
        CHECK(j["tracks"][0].contains("pos"));
        CHECK_FALSE(j["tracks"][0].contains("rot"));
        // quaternions are stored x, y, z, w
        CHECK(j["tracks"][1]["rot"][0]["v"][3].get<float>() == doctest::Approx(1.0f));
    }

    TEST_CASE("clips survive a file round trip in track order") {
        const AnimationClip clip = makeClip();
        const std::string path = tempPath("fightrig_clip_test.json");
        REQUIRE(SaveAnimationClip(clip, path));

        const AnimationClip loaded = LoadAnimationClip(path);
        CHECK(loaded.Name == clip.Name);
        CHECK(loaded.Duration == doctest::Approx(clip.Duration));
        REQUIRE(loaded.Tracks.size() == 3);
        CHECK(loaded.Tracks[0].BoneName == "Hip");
        CHECK(loaded.Tracks[1].BoneName == "Head");
        CHECK(loaded.Tracks[2].BoneName == "Spine01");
        CHECK(VecClose(loaded.Tracks[0].PositionKeys[1].Value, glm::vec3(0.0f, 0.75f, 0.0f)));
        CHECK(QuatClose(loaded.Tracks[1].RotationKeys[1].Value, clip.Tracks[1].RotationKeys[1].Value));
        CHECK(loaded.Tracks[2].RotationKeys.size() == 1);
        std::filesystem::remove(path);
    }

    TEST_CASE("a missing clip file yields an empty clip") {
        LogCapture log;
        const AnimationClip clip = LoadAnimationClip(tempPath("fightrig_no_such_clip.json"));
        CHECK(clip.Empty());
        CHECK(log.Contains(LogLevel::Warning, "Failed to open"));
    }

    TEST_CASE("pose tables keep order and offsets") {
        const PoseTargetTable& duck = GetPoseTable(PoseTableId::Duck);
        const std::string path = tempPath("fightrig_table_test.json");
        REQUIRE(SavePoseTable(duck, path));

        const auto loaded = LoadPoseTable(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->Name == "duck");
        CHECK(loaded->Targets.size() == duck.Targets.size());

        const PoseTarget* thigh = loaded->Find("R_Thigh");
        REQUIRE(thigh != nullptr);
        CHECK(thigh->Order == EulerOrder::YXZ);
        CHECK(thigh->RotationDegrees->x == doctest::Approx(75.0f));

        const PoseTarget* hip = loaded->Find("Hip");
        REQUIRE(hip != nullptr);
        CHECK_FALSE(hip->RotationDegrees.has_value());
        REQUIRE(hip->PositionOffset.has_value());
        CHECK(hip->PositionOffset->y == doctest::Approx(-0.25f));
        std::filesystem::remove(path);
    }

    TEST_CASE("unknown rotation orders fall back to XYZ") {
        const json j = json::parse(R"({ "name": "custom", "targets": { "Head": { "rot": [1, 2, 3], "order": "ABC" } } })");
        LogCapture log;
        const PoseTargetTable table = DeserializePoseTable(j);
        REQUIRE(table.Find("Head") != nullptr);
        CHECK(table.Find("Head")->Order == EulerOrder::XYZ);
        CHECK(log.Contains(LogLevel::Warning, "Unknown rotation order"));
    }

    TEST_CASE("a missing table file yields nothing") {
        LogCapture log;
        CHECK_FALSE(LoadPoseTable(tempPath("fightrig_no_such_table.json")).has_value());
    }
}
