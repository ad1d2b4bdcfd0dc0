#pragma once

#include <mutex>
#include <string>

namespace cd {

// Single-writer guard shared by every state-mutating entry point of one engine.
// Other threads block until the active operation finishes; a call arriving on
// the same stack (for example from a transfer hook) is rejected with ReentrantCall.
class EntryLock {
public:
    class Scope {
    public:
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        ~Scope();

        const std::string& operation() const { return owner_.activeOperation_; }
        bool heldOn(const EntryLock& lock) const { return &owner_ == &lock; }

    private:
        friend class EntryLock;
        Scope(EntryLock& owner, const char* operation);

        EntryLock& owner_;
        std::unique_lock<std::recursive_mutex> lock_;
    };

    using ReadGuard = std::unique_lock<std::recursive_mutex>;

    EntryLock() = default;
    EntryLock(const EntryLock&) = delete;
    EntryLock& operator=(const EntryLock&) = delete;

    Scope enter(const char* operation) { return Scope(*this, operation); }

    // Blocks writers on other threads. Allowed inside an active Scope on the same thread.
    ReadGuard read() { return ReadGuard(mutex_); }

    // Throws std::invalid_argument unless `scope` was entered on this lock.
    void requireScope(const Scope& scope, const char* operation) const;

private:
    std::recursive_mutex mutex_;
    bool entered_ = false;
    std::string activeOperation_;
};

} // namespace cd
