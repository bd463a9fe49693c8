#include "ForceQueue.h"
#include "core/physics/PhysicsEngine.h"

#include <algorithm>

namespace SimPool {

bool ForceQueue::set(int bodyId, const Vector3& force, const Vector3& point)
{
    const bool isZero = force[0] == 0.0 && force[1] == 0.0 && force[2] == 0.0;
    if (isZero) {
        pending_.erase(bodyId);
        return false;
    }

    pending_[bodyId] = PendingForce{ .force = force, .point = point };
    return true;
}

void ForceQueue::applyAndClear(PhysicsData& data)
{
    std::fill(data.xfrcApplied.begin(), data.xfrcApplied.end(), 0.0);

    for (const auto& [bodyId, pending] : pending_) {
        const size_t base = 6 * static_cast<size_t>(bodyId);
        if (base + 6 > data.xfrcApplied.size()) {
            continue;
        }

        const auto& f = pending.force;
        const double rx = pending.point[0] - data.xpos[3 * bodyId];
        const double ry = pending.point[1] - data.xpos[3 * bodyId + 1];
        const double rz = pending.point[2] - data.xpos[3 * bodyId + 2];

        data.xfrcApplied[base] = f[0];
        data.xfrcApplied[base + 1] = f[1];
        data.xfrcApplied[base + 2] = f[2];
        data.xfrcApplied[base + 3] = ry * f[2] - rz * f[1];
        data.xfrcApplied[base + 4] = rz * f[0] - rx * f[2];
        data.xfrcApplied[base + 5] = rx * f[1] - ry * f[0];
    }

    pending_.clear();
}

} // namespace SimPool
