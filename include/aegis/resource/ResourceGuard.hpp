/**
 * ResourceGuard.hpp - Lease arbitration for one physical device
 *
 * Grants at most one Exclusive lease at a time. A single Background lessee
 * (WakeListener on the mic, CameraMonitor on the camera) is paused while an
 * Exclusive lease or the hold flag is active, and restored afterwards.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace aegis::resource {

enum class ResourceKind { Mic, Speaker, Camera };

enum class LeasePriority { Background, Exclusive };

enum class AcquireStatus {
    Granted,
    Busy,         // another Exclusive lease (or Background lessee) is outstanding
    Degraded,     // a resume failed earlier; fails fast until reset()
    Unavailable   // Background lessee could not open the device
};

const char* toString(ResourceKind kind);
const char* toString(LeasePriority priority);
const char* toString(AcquireStatus status);

/**
 * Implemented by Background lessees. Both hooks run with the guard locked
 * and must not call back into the guard.
 */
class Preemptible {
public:
    virtual ~Preemptible() = default;

    // Stop touching the device; it is about to be used by someone else.
    virtual void onPreempt() = 0;

    // Take the device back. Returning false marks the resource Degraded.
    virtual bool onRestore() = 0;
};

class ResourceGuard;

/**
 * Move-only lease handle. Destruction releases; releasing twice is a no-op.
 * The guard must outlive every lease it handed out.
 */
class Lease {
public:
    Lease() = default;
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    void release();

    bool valid() const { return guard_ != nullptr; }
    uint64_t id() const { return id_; }
    ResourceKind kind() const { return kind_; }
    LeasePriority priority() const { return priority_; }
    const std::string& holder() const { return holder_; }

private:
    friend class ResourceGuard;
    Lease(ResourceGuard* guard, uint64_t id, ResourceKind kind,
          LeasePriority priority, std::string holder);

    ResourceGuard* guard_ = nullptr;
    uint64_t id_ = 0;
    ResourceKind kind_ = ResourceKind::Mic;
    LeasePriority priority_ = LeasePriority::Exclusive;
    std::string holder_;
};

struct AcquireResult {
    AcquireStatus status = AcquireStatus::Busy;
    Lease lease;

    bool granted() const { return status == AcquireStatus::Granted; }
};

class ResourceGuard {
public:
    explicit ResourceGuard(ResourceKind kind);
    ~ResourceGuard();

    ResourceGuard(const ResourceGuard&) = delete;
    ResourceGuard& operator=(const ResourceGuard&) = delete;

    /**
     * Never blocks. Exclusive over a Background holder pauses it; Exclusive
     * over Exclusive is Busy. A Background lease requested while paused
     * conditions hold is granted in the paused state.
     */
    AcquireResult acquire(const std::string& holder, LeasePriority priority,
                          Preemptible* lessee = nullptr);

    AcquireResult acquireExclusive(const std::string& holder) {
        return acquire(holder, LeasePriority::Exclusive);
    }

    AcquireResult acquireBackground(const std::string& holder, Preemptible& lessee) {
        return acquire(holder, LeasePriority::Background, &lessee);
    }

    // Returns false for unknown (already released) ids.
    bool release(uint64_t lease_id);

    // Background leases only. resume() returns false when the resource is Degraded.
    bool pause(const Lease& lease);
    bool resume(const Lease& lease);

    // Keeps the Background lessee paused regardless of Exclusive activity.
    void setHold(bool hold);
    bool holdActive() const;

    // Clears Degraded and retries the Background restore.
    bool reset();

    ResourceKind kind() const { return kind_; }
    bool exclusiveHeld() const;
    std::string exclusiveHolder() const;
    bool backgroundPresent() const;
    bool backgroundActive() const;
    bool degraded() const;
    uint64_t exclusiveGrants() const;

private:
    struct ExclusiveSlot {
        uint64_t id = 0;
        std::string holder;
    };

    struct BackgroundSlot {
        uint64_t id = 0;
        std::string holder;
        Preemptible* lessee = nullptr;
        bool manual_pause = false;
        bool active = false;
    };

    bool backgroundWantedLocked() const;
    void reconcileLocked();

    const ResourceKind kind_;
    mutable std::mutex mutex_;
    std::optional<ExclusiveSlot> exclusive_;
    std::optional<BackgroundSlot> background_;
    bool hold_ = false;
    bool degraded_ = false;
    uint64_t next_id_ = 1;
    uint64_t exclusive_grants_ = 0;
};

/**
 * Sets the hold flag for the lifetime of the scope.
 */
class ScopedHold {
public:
    explicit ScopedHold(ResourceGuard& guard) : guard_(guard) { guard_.setHold(true); }
    ~ScopedHold() { guard_.setHold(false); }

    ScopedHold(const ScopedHold&) = delete;
    ScopedHold& operator=(const ScopedHold&) = delete;

private:
    ResourceGuard& guard_;
};

} // namespace aegis::resource
