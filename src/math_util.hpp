#pragma once
#include <cmath>
#include <algorithm>

namespace gemrun::math {

/**
 * @brief Resolves the two vertical key signals into an intent in {-1, 0, +1}.
 * Up adds +1, down adds -1; both held cancel out.
 */
inline int vertical_intent(bool up, bool down) {
    int v = 0;
    if (up)   v += 1;
    if (down) v -= 1;
    return v;
}

/**
 * @brief Euclidean distance on the horizontal/vertical plane.
 */
inline float planar_distance(float ax, float ay, float bx, float by) {
    float dx = bx - ax;
    float dy = by - ay;
    return std::sqrt(dx*dx + dy*dy);
}

/**
 * @brief True if b lies strictly inside the circle of the given radius around a.
 */
inline bool within_radius(float ax, float ay, float bx, float by, float radius) {
    return planar_distance(ax, ay, bx, by) < radius;
}

} // namespace gemrun::math
