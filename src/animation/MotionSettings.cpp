#include "animation/MotionSettings.h"

#include <fstream>

#include "utils/Logger.h"

namespace fr {
namespace animation {

MotionSettings LoadMotionSettings(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        Logger::LogWarning("[MotionSettings] Could not open '" + path + "', using defaults.");
        return MotionSettings{};
    }
    try {
        nlohmann::json j; in >> j;
        return j.get<MotionSettings>();
    } catch (const nlohmann::json::exception& e) {
        Logger::LogError("[MotionSettings] Failed to parse '" + path + "': " + e.what());
    }
    return MotionSettings{};
}

bool SaveMotionSettings(const MotionSettings& settings, const std::string& path)
{
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << nlohmann::json(settings).dump(4);
    return true;
}

} // namespace animation
} // namespace fr
