#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lyricache {

// One mutex per string key, created on demand and dropped once nobody holds
// or waits for it. Serializes work on the same key without blocking
// unrelated keys.
class KeyedMutex {
    struct Slot {
        std::mutex mutex;
        uint32_t refs = 0;
    };

public:
    // Held until destroyed (or moved from)
    class Lock {
    public:
        Lock() = default;
        Lock(KeyedMutex* owner, std::string key, std::shared_ptr<Slot> slot);
        ~Lock();

        Lock(Lock&& other) noexcept;
        Lock& operator=(Lock&& other) noexcept;
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

        bool owns_lock() const { return slot_ != nullptr; }

    private:
        void release();

        KeyedMutex* owner_ = nullptr;
        std::string key_;
        std::shared_ptr<Slot> slot_;
    };

    Lock acquire(const std::string& key);

    // Number of keys currently held or waited on
    size_t active_keys() const;

private:
    void unref(const std::string& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace lyricache
