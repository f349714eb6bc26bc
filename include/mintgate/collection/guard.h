// MINTGATE - Re-entrancy Guard
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#ifndef MINTGATE_COLLECTION_GUARD_H
#define MINTGATE_COLLECTION_GUARD_H

namespace mintgate {
namespace collection {

/**
 * One in-progress flag per instance.
 *
 * Entry points hold a Scope for their whole body. A nested Scope on the same
 * guard does not acquire it, and the caller must reject the call.
 */
class ReentrancyGuard {
public:
    class Scope {
    public:
        explicit Scope(ReentrancyGuard& guard)
            : guard_(guard), acquired_(!guard.entered_) {
            if (acquired_) {
                guard_.entered_ = true;
            }
        }

        ~Scope() {
            if (acquired_) {
                guard_.entered_ = false;
            }
        }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        /// False when another call on the same instance is in progress
        bool Acquired() const { return acquired_; }

    private:
        ReentrancyGuard& guard_;
        bool acquired_;
    };

    bool IsEntered() const { return entered_; }

private:
    bool entered_{false};
};

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_GUARD_H
