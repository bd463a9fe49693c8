#pragma once

#include <array>
#include <cstddef>
#include <map>

namespace SimPool {

struct PhysicsData;

/**
 * Single-use external forces waiting for the next physics step of one environment.
 *
 * A zero force clears the body's entry; a non-zero force replaces it. The
 * next step consumes every entry, so nothing carries over to the step after.
 */
class ForceQueue {
public:
    using Vector3 = std::array<double, 3>;

    struct PendingForce {
        Vector3 force{ 0.0, 0.0, 0.0 };
        Vector3 point{ 0.0, 0.0, 0.0 };
    };

    // Returns true if a force is pending for the body afterward.
    bool set(int bodyId, const Vector3& force, const Vector3& point);

    size_t size() const { return pending_.size(); }
    void clear() { pending_.clear(); }

    /**
     * Write pending forces into data.xfrcApplied and forget them. Bodies without
     * an entry get zero force. The torque term is (point - body position) x force.
     */
    void applyAndClear(PhysicsData& data);

private:
    std::map<int, PendingForce> pending_;
};

} // namespace SimPool
