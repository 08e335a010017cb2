/**
 * ResourceGuard.cpp - Exclusive/Background lease bookkeeping
 */

#include "aegis/resource/ResourceGuard.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace aegis::resource {

const char* toString(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Mic:     return "mic";
        case ResourceKind::Speaker: return "speaker";
        case ResourceKind::Camera:  return "camera";
    }
    return "unknown";
}

const char* toString(LeasePriority priority) {
    return priority == LeasePriority::Exclusive ? "exclusive" : "background";
}

const char* toString(AcquireStatus status) {
    switch (status) {
        case AcquireStatus::Granted:     return "Granted";
        case AcquireStatus::Busy:        return "Busy";
        case AcquireStatus::Degraded:    return "Degraded";
        case AcquireStatus::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

// ============================================================================
// Lease
// ============================================================================

Lease::Lease(ResourceGuard* guard, uint64_t id, ResourceKind kind,
             LeasePriority priority, std::string holder)
    : guard_(guard)
    , id_(id)
    , kind_(kind)
    , priority_(priority)
    , holder_(std::move(holder)) {
}

Lease::~Lease() {
    release();
}

Lease::Lease(Lease&& other) noexcept
    : guard_(std::exchange(other.guard_, nullptr))
    , id_(other.id_)
    , kind_(other.kind_)
    , priority_(other.priority_)
    , holder_(std::move(other.holder_)) {
}

Lease& Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        guard_ = std::exchange(other.guard_, nullptr);
        id_ = other.id_;
        kind_ = other.kind_;
        priority_ = other.priority_;
        holder_ = std::move(other.holder_);
    }
    return *this;
}

void Lease::release() {
    if (guard_) {
        guard_->release(id_);
        guard_ = nullptr;
    }
}

// ============================================================================
// ResourceGuard
// ============================================================================

ResourceGuard::ResourceGuard(ResourceKind kind) : kind_(kind) {}

ResourceGuard::~ResourceGuard() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exclusive_ || background_) {
        std::cerr << "[ResourceGuard] " << toString(kind_)
                  << " destroyed with outstanding leases" << std::endl;
    }
}

AcquireResult ResourceGuard::acquire(const std::string& holder, LeasePriority priority,
                                     Preemptible* lessee) {
    std::lock_guard<std::mutex> lock(mutex_);
    AcquireResult result;

    if (degraded_) {
        result.status = AcquireStatus::Degraded;
        return result;
    }

    if (priority == LeasePriority::Exclusive) {
        if (exclusive_) {
            result.status = AcquireStatus::Busy;
            return result;
        }
        uint64_t id = next_id_++;
        exclusive_ = ExclusiveSlot{id, holder};
        ++exclusive_grants_;
        reconcileLocked();

        result.status = AcquireStatus::Granted;
        result.lease = Lease(this, id, kind_, priority, holder);
        return result;
    }

    if (background_) {
        result.status = AcquireStatus::Busy;
        return result;
    }

    uint64_t id = next_id_++;
    background_ = BackgroundSlot{id, holder, lessee, false, false};

    if (backgroundWantedLocked()) {
        bool opened = true;
        if (lessee) {
            try {
                opened = lessee->onRestore();
            } catch (const std::exception& e) {
                std::cerr << "[ResourceGuard] " << toString(kind_) << " open by "
                          << holder << " threw: " << e.what() << std::endl;
                opened = false;
            }
        }
        if (!opened) {
            background_.reset();
            result.status = AcquireStatus::Unavailable;
            return result;
        }
        background_->active = true;
    }

    result.status = AcquireStatus::Granted;
    result.lease = Lease(this, id, kind_, priority, holder);
    return result;
}

bool ResourceGuard::release(uint64_t lease_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (exclusive_ && exclusive_->id == lease_id) {
        exclusive_.reset();
        reconcileLocked();
        return true;
    }

    if (background_ && background_->id == lease_id) {
        // The lessee closes its own device when it gives the lease up
        background_.reset();
        return true;
    }

    return false;
}

bool ResourceGuard::pause(const Lease& lease) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!background_ || background_->id != lease.id()) {
        return false;
    }
    background_->manual_pause = true;
    reconcileLocked();
    return true;
}

bool ResourceGuard::resume(const Lease& lease) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!background_ || background_->id != lease.id()) {
        return false;
    }
    background_->manual_pause = false;
    reconcileLocked();
    return !degraded_;
}

void ResourceGuard::setHold(bool hold) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hold_ == hold) return;
    hold_ = hold;
    reconcileLocked();
}

bool ResourceGuard::holdActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hold_;
}

bool ResourceGuard::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (degraded_) {
        std::cout << "[ResourceGuard] " << toString(kind_) << " reset requested" << std::endl;
    }
    degraded_ = false;
    reconcileLocked();
    return !degraded_;
}

bool ResourceGuard::exclusiveHeld() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exclusive_.has_value();
}

std::string ResourceGuard::exclusiveHolder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exclusive_ ? exclusive_->holder : std::string();
}

bool ResourceGuard::backgroundPresent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return background_.has_value();
}

bool ResourceGuard::backgroundActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return background_ && background_->active;
}

bool ResourceGuard::degraded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_;
}

uint64_t ResourceGuard::exclusiveGrants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exclusive_grants_;
}

bool ResourceGuard::backgroundWantedLocked() const {
    return background_ && !exclusive_ && !hold_ && !background_->manual_pause && !degraded_;
}

void ResourceGuard::reconcileLocked() {
    if (!background_) return;

    bool wanted = backgroundWantedLocked();
    if (wanted == background_->active) return;

    Preemptible* lessee = background_->lessee;

    if (!wanted) {
        if (lessee) {
            try {
                lessee->onPreempt();
            } catch (const std::exception& e) {
                std::cerr << "[ResourceGuard] " << toString(kind_) << " pause of "
                          << background_->holder << " threw: " << e.what() << std::endl;
            }
        }
        background_->active = false;
        std::cout << "[ResourceGuard] " << toString(kind_) << " background lessee '"
                  << background_->holder << "' paused" << std::endl;
        return;
    }

    bool restored = true;
    if (lessee) {
        try {
            restored = lessee->onRestore();
        } catch (const std::exception& e) {
            std::cerr << "[ResourceGuard] " << toString(kind_) << " resume of "
                      << background_->holder << " threw: " << e.what() << std::endl;
            restored = false;
        }
    }

    if (!restored) {
        degraded_ = true;
        std::cerr << "[ResourceGuard] " << toString(kind_) << " could not resume '"
                  << background_->holder << "', resource marked Degraded" << std::endl;
        return;
    }

    background_->active = true;
    std::cout << "[ResourceGuard] " << toString(kind_) << " background lessee '"
              << background_->holder << "' resumed" << std::endl;
}

} // namespace aegis::resource
