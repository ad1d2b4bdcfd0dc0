#include "entry_lock.hpp"

#include "errors.hpp"

#include <stdexcept>

namespace cd {

EntryLock::Scope::Scope(EntryLock& owner, const char* operation)
    : owner_(owner)
    , lock_(owner.mutex_) {
    if (owner_.entered_) {
        throw EngineError(ErrorCode::ReentrantCall,
                          std::string(operation) + " called while " + owner_.activeOperation_ +
                              " is in progress");
    }
    owner_.entered_ = true;
    owner_.activeOperation_ = operation;
}

EntryLock::Scope::~Scope() {
    owner_.entered_ = false;
    owner_.activeOperation_.clear();
}

void EntryLock::requireScope(const Scope& scope, const char* operation) const {
    if (!scope.heldOn(*this)) {
        throw std::invalid_argument(std::string(operation) +
                                    " called with a scope entered on another engine's lock");
    }
}

} // namespace cd
