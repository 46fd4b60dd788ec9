#include "animation/RotationMath.h"

#include <algorithm>
#include <cmath>

namespace fr {
namespace animation {

namespace {
constexpr float kGimbalThreshold = 0.9999999f;

glm::quat axisQuat(int axis, float angle)
{
    static const glm::vec3 axes[3] = { glm::vec3(1, 0, 0), glm::vec3(0, 1, 0), glm::vec3(0, 0, 1) };
    return glm::angleAxis(angle, axes[axis]);
}
}

const char* ToString(EulerOrder order)
{
    switch (order) {
        case EulerOrder::XYZ: return "XYZ";
        case EulerOrder::YZX: return "YZX";
        case EulerOrder::ZXY: return "ZXY";
        case EulerOrder::XZY: return "XZY";
        case EulerOrder::YXZ: return "YXZ";
        case EulerOrder::ZYX: return "ZYX";
    }
    return "XYZ";
}

std::optional<EulerOrder> EulerOrderFromString(const std::string& s)
{
    if (s == "XYZ") return EulerOrder::XYZ;
    if (s == "YZX") return EulerOrder::YZX;
    if (s == "ZXY") return EulerOrder::ZXY;
    if (s == "XZY") return EulerOrder::XZY;
    if (s == "YXZ") return EulerOrder::YXZ;
    if (s == "ZYX") return EulerOrder::ZYX;
    return std::nullopt;
}

glm::quat EulerToQuat(const glm::vec3& radians, EulerOrder order)
{
    const glm::quat qx = axisQuat(0, radians.x);
    const glm::quat qy = axisQuat(1, radians.y);
    const glm::quat qz = axisQuat(2, radians.z);
    switch (order) {
        case EulerOrder::XYZ: return qx * qy * qz;
        case EulerOrder::YZX: return qy * qz * qx;
        case EulerOrder::ZXY: return qz * qx * qy;
        case EulerOrder::XZY: return qx * qz * qy;
        case EulerOrder::YXZ: return qy * qx * qz;
        case EulerOrder::ZYX: return qz * qy * qx;
    }
    return qx * qy * qz;
}

glm::vec3 QuatToEuler(const glm::quat& q, EulerOrder order)
{
    // glm is column-major: row r / column c lives at m[c][r]
    const glm::mat3 m = glm::mat3_cast(glm::normalize(q));
    const float m11 = m[0][0], m12 = m[1][0], m13 = m[2][0];
    const float m21 = m[0][1], m22 = m[1][1], m23 = m[2][1];
    const float m31 = m[0][2], m32 = m[1][2], m33 = m[2][2];

    glm::vec3 e(0.0f);
    switch (order) {
        case EulerOrder::XYZ:
            e.y = std::asin(std::clamp(m13, -1.0f, 1.0f));
            if (std::abs(m13) < kGimbalThreshold) {
                e.x = std::atan2(-m23, m33);
                e.z = std::atan2(-m12, m11);
            } else {
                e.x = std::atan2(m32, m22);
                e.z = 0.0f;
            }
            break;
        case EulerOrder::YXZ:
            e.x = std::asin(-std::clamp(m23, -1.0f, 1.0f));
            if (std::abs(m23) < kGimbalThreshold) {
                e.y = std::atan2(m13, m33);
                e.z = std::atan2(m21, m22);
            } else {
                e.y = std::atan2(-m31, m11);
                e.z = 0.0f;
            }
            break;
        case EulerOrder::ZXY:
            e.x = std::asin(std::clamp(m32, -1.0f, 1.0f));
            if (std::abs(m32) < kGimbalThreshold) {
                e.y = std::atan2(-m31, m33);
                e.z = std::atan2(-m12, m22);
            } else {
                e.y = 0.0f;
                e.z = std::atan2(m21, m11);
            }
            break;
        case EulerOrder::ZYX:
            e.y = std::asin(-std::clamp(m31, -1.0f, 1.0f));
            if (std::abs(m31) < kGimbalThreshold) {
                e.x = std::atan2(m32, m33);
                e.z = std::atan2(m21, m11);
            } else {
                e.x = 0.0f;
                e.z = std::atan2(-m12, m22);
            }
            break;
        case EulerOrder::YZX:
            e.z = std::asin(std::clamp(m21, -1.0f, 1.0f));
            if (std::abs(m21) < kGimbalThreshold) {
                e.x = std::atan2(-m23, m22);
                e.y = std::atan2(-m31, m11);
            } else {
                e.x = 0.0f;
                e.y = std::atan2(m13, m33);
            }
            break;
        case EulerOrder::XZY:
            e.z = std::asin(-std::clamp(m12, -1.0f, 1.0f));
            if (std::abs(m12) < kGimbalThreshold) {
                e.x = std::atan2(m32, m22);
                e.y = std::atan2(m13, m11);
            } else {
                e.x = std::atan2(-m23, m33);
                e.y = 0.0f;
            }
            break;
    }
    return e;
}

glm::quat DegreesToQuat(const glm::vec3& degrees, EulerOrder order)
{
    return EulerToQuat(glm::radians(degrees), order);
}

glm::vec3 QuatToDegrees(const glm::quat& q, EulerOrder order)
{
    return glm::degrees(QuatToEuler(q, order));
}

bool QuatNearlyEqual(const glm::quat& a, const glm::quat& b, float epsilon)
{
    return std::abs(glm::dot(a, b)) >= 1.0f - epsilon;
}

} // namespace animation
} // namespace fr
