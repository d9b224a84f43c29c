#include "keyed_mutex.hpp"

namespace lyricache {

KeyedMutex::Lock::Lock(KeyedMutex* owner, std::string key, std::shared_ptr<Slot> slot)
    : owner_(owner), key_(std::move(key)), slot_(std::move(slot)) {}

KeyedMutex::Lock::~Lock() {
    release();
}

KeyedMutex::Lock::Lock(Lock&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), slot_(std::move(other.slot_)) {
    other.owner_ = nullptr;
    other.slot_.reset();
}

KeyedMutex::Lock& KeyedMutex::Lock::operator=(Lock&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        key_ = std::move(other.key_);
        slot_ = std::move(other.slot_);
        other.owner_ = nullptr;
        other.slot_.reset();
    }
    return *this;
}

void KeyedMutex::Lock::release() {
    if (!slot_) return;
    slot_->mutex.unlock();
    slot_.reset();
    if (owner_) owner_->unref(key_);
    owner_ = nullptr;
}

KeyedMutex::Lock KeyedMutex::acquire(const std::string& key) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = slots_[key];
        if (!entry) entry = std::make_shared<Slot>();
        entry->refs++;
        slot = entry;
    }
    // Block outside the map lock so other keys stay available
    slot->mutex.lock();
    return Lock(this, key, std::move(slot));
}

void KeyedMutex::unref(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) return;
    if (--it->second->refs == 0) slots_.erase(it);
}

size_t KeyedMutex::active_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace lyricache
