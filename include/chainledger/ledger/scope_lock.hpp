#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace chainledger::ledger {

    /// Named exclusive locks, one per chain scope ("progress:<project>", "audit:global").
    /// Locks are created on first use and live as long as the registry.
    class ScopeLocks {
      public:
        ScopeLocks() = default;

        ScopeLocks(const ScopeLocks &) = delete;
        ScopeLocks &operator=(const ScopeLocks &) = delete;

        /// Blocks until the scope lock is held
        std::unique_lock<std::mutex> acquire(const std::string &key) {
            std::mutex *scope_mutex = nullptr;
            {
                std::lock_guard<std::mutex> guard(table_mutex_);
                auto &slot = locks_[key];
                if (!slot)
                    slot = std::make_unique<std::mutex>();
                scope_mutex = slot.get();
            }
            return std::unique_lock<std::mutex>(*scope_mutex);
        }

        size_t size() const {
            std::lock_guard<std::mutex> guard(table_mutex_);
            return locks_.size();
        }

      private:
        mutable std::mutex table_mutex_;
        std::map<std::string, std::unique_ptr<std::mutex>> locks_;
    };

} // namespace chainledger::ledger
