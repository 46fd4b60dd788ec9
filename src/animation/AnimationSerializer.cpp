#include "animation/AnimationSerializer.h"
#include <fstream>
#include "utils/Logger.h"

namespace fr {
namespace animation {

// ---------------- Keyframes ------------------
json SerializeKeyframe(const KeyframeVec3& kf) {
    return json{{"t", kf.Time}, {"v", {kf.Value.x, kf.Value.y, kf.Value.z}}};
}

json SerializeKeyframe(const KeyframeQuat& kf) {
    return json{{"t", kf.Time}, {"v", {kf.Value.x, kf.Value.y, kf.Value.z, kf.Value.w}}};
}

KeyframeVec3 DeserializeKeyframeVec3(const json& j) {
    KeyframeVec3 kf;
    kf.Time = j.at("t").get<float>();
    const auto& arr = j.at("v");
    kf.Value = glm::vec3(arr.at(0).get<float>(), arr.at(1).get<float>(), arr.at(2).get<float>());
    return kf;
}

KeyframeQuat DeserializeKeyframeQuat(const json& j) {
    KeyframeQuat kf;
    kf.Time = j.at("t").get<float>();
    const auto& arr = j.at("v");
    kf.Value = glm::quat(arr.at(3).get<float>(), arr.at(0).get<float>(), arr.at(1).get<float>(), arr.at(2).get<float>());
    return kf;
}

// --------------- Clip --------------------
json SerializeAnimationClip(const AnimationClip& clip) {
    json j;
    j["name"] = clip.Name;
    j["duration"] = clip.Duration;

    json tracksJson = json::array();
    for (const auto& track : clip.Tracks) {
        json t;
        t["bone"] = track.BoneName;
        if (!track.PositionKeys.empty()) { json arr = json::array(); for (const auto& k : track.PositionKeys) arr.push_back(SerializeKeyframe(k)); t["pos"] = std::move(arr); }
        if (!track.RotationKeys.empty()) { json arr = json::array(); for (const auto& k : track.RotationKeys) arr.push_back(SerializeKeyframe(k)); t["rot"] = std::move(arr); }
        tracksJson.push_back(std::move(t));
    }
    j["tracks"] = std::move(tracksJson);
    return j;
}

AnimationClip DeserializeAnimationClip(const json& j) {
    AnimationClip clip;
    clip.Name = j.value("name", "");
    clip.Duration = j.value("duration", 0.0f);

    if (j.contains("tracks")) {
        for (const auto& t : j["tracks"]) {
            BoneTrack track;
            track.BoneName = t.value("bone", "");
            if (t.contains("pos")) {
                for (const auto& k : t["pos"]) track.PositionKeys.push_back(DeserializeKeyframeVec3(k));
            }
            if (t.contains("rot")) {
                for (const auto& k : t["rot"]) track.RotationKeys.push_back(DeserializeKeyframeQuat(k));
            }
            clip.Tracks.push_back(std::move(track));
        }
    }
    return clip;
}

bool SaveAnimationClip(const AnimationClip& clip, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << SerializeAnimationClip(clip).dump(4);
    return true;
}

AnimationClip LoadAnimationClip(const std::string& path) {
    AnimationClip empty{};
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::LogWarning("[AnimationSerializer] Failed to open animation clip: " + path);
            return empty;
        }
        json j;
        file >> j;
        return DeserializeAnimationClip(j);
    } catch (const json::exception& e) {
        Logger::LogError("[AnimationSerializer] Error loading animation clip '" + path + "': " + e.what());
        return empty;
    }
}

// --------------- Pose tables --------------------
json SerializePoseTable(const PoseTargetTable& table) {
    json targets = json::object();
    for (const auto& [bone, target] : table.Targets) {
        json t;
        if (target.RotationDegrees) {
            const glm::vec3& r = *target.RotationDegrees;
            t["rot"] = { r.x, r.y, r.z };
        }
        t["order"] = ToString(target.Order);
        if (target.PositionOffset) {
            const glm::vec3& p = *target.PositionOffset;
            t["pos"] = { p.x, p.y, p.z };
        }
        targets[bone] = std::move(t);
    }
    return json{{"name", table.Name}, {"targets", std::move(targets)}};
}

PoseTargetTable DeserializePoseTable(const json& j) {
    PoseTargetTable table;
    table.Name = j.value("name", "");
    if (!j.contains("targets")) return table;

    for (auto it = j["targets"].begin(); it != j["targets"].end(); ++it) {
        const json& t = it.value();
        PoseTarget target;
        if (t.contains("rot")) {
            const auto& r = t["rot"];
            target.RotationDegrees = glm::vec3(r.at(0).get<float>(), r.at(1).get<float>(), r.at(2).get<float>());
        }
        const std::string order = t.value("order", "XYZ");
        if (auto parsed = EulerOrderFromString(order)) {
            target.Order = *parsed;
        } else {
            Logger::LogWarning("[AnimationSerializer] Unknown rotation order '" + order + "' for " + it.key() + ", using XYZ.");
        }
        if (t.contains("pos")) {
            const auto& p = t["pos"];
            target.PositionOffset = glm::vec3(p.at(0).get<float>(), p.at(1).get<float>(), p.at(2).get<float>());
        }
        table.Targets[it.key()] = target;
    }
    return table;
}

bool SavePoseTable(const PoseTargetTable& table, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << SerializePoseTable(table).dump(4);
    return true;
}

std::optional<PoseTargetTable> LoadPoseTable(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::LogWarning("[AnimationSerializer] Failed to open pose table: " + path);
            return std::nullopt;
        }
        json j;
        file >> j;
        return DeserializePoseTable(j);
    } catch (const json::exception& e) {
        Logger::LogError("[AnimationSerializer] Error loading pose table '" + path + "': " + e.what());
        return std::nullopt;
    }
}

} // namespace animation
} // namespace fr
