#pragma once

/**
 * @file process_cache.h
 * @brief Lazily populated, process-lifetime cache keyed by (identity, parameters)
 */

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>

namespace parley {

/**
 * @brief Populate-once cache shared by every session in the process
 *
 * The first caller for a key runs the loader; concurrent callers for the
 * same key wait on the same shared_future instead of loading again. A
 * loader that throws leaves no entry behind, so the next caller retries.
 * Entries live until the process exits (or clear() is called by tests).
 */
template<typename Key, typename Value>
class ProcessCache {
public:
    using Loader = std::function<Value()>;

    ProcessCache() = default;

    // Non-copyable
    ProcessCache(const ProcessCache&) = delete;
    ProcessCache& operator=(const ProcessCache&) = delete;

    /**
     * @brief Return the cached value for key, running loader on first use
     * @throws Whatever loader throws, to every caller waiting on that load
     */
    Value get_or_load(const Key& key, const Loader& loader) {
        std::shared_future<Value> future;
        std::shared_ptr<std::promise<Value>> promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                future = it->second;
            } else {
                promise = std::make_shared<std::promise<Value>>();
                future = promise->get_future().share();
                entries_.emplace(key, future);
            }
        }

        if (promise) {
            try {
                promise->set_value(loader());
            } catch (...) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    entries_.erase(key);
                }
                promise->set_exception(std::current_exception());
            }
        }

        return future.get();
    }

    /// True when a completed or in-flight entry exists for key
    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(key) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::map<Key, std::shared_future<Value>> entries_;
};

} // namespace parley
