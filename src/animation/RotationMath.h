#pragma once

#include <optional>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace fr {
namespace animation {

// Axis application order for an Euler triple. XYZ means the rotation matrix is
// Rx * Ry * Rz (intrinsic X, then Y, then Z).
enum class EulerOrder {
    XYZ = 0,
    YZX,
    ZXY,
    XZY,
    YXZ,
    ZYX
};

const char* ToString(EulerOrder order);
std::optional<EulerOrder> EulerOrderFromString(const std::string& s);

glm::quat EulerToQuat(const glm::vec3& radians, EulerOrder order);
glm::vec3 QuatToEuler(const glm::quat& q, EulerOrder order);

// Degree helpers used by the hand-authored pose tables.
glm::quat DegreesToQuat(const glm::vec3& degrees, EulerOrder order);
glm::vec3 QuatToDegrees(const glm::quat& q, EulerOrder order);

// q and -q describe the same orientation.
bool QuatNearlyEqual(const glm::quat& a, const glm::quat& b, float epsilon = 1e-6f);

} // namespace animation
} // namespace fr
