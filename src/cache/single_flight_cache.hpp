#pragma once

/// @file single_flight_cache.hpp
/// @brief Thread-safe LRU memoization with one in-flight computation per key.

#include "core/logger.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace helioport::cache
{
    struct CacheStats
    {
        u64 hits = 0;           ///< Served from a finished or in-flight entry
        u64 misses = 0;
        u64 computations = 0;   ///< Compute function invocations
        u64 failures = 0;       ///< Computations that threw
        u64 evictions = 0;

        bool operator==(const CacheStats&) const = default;
    };

    /// @brief Memoizes a deterministic, possibly slow, computation.
    ///
    /// - At most one computation per key is in flight; concurrent callers with
    ///   the same key wait on it and share its result or its exception.
    /// - Different keys never block each other: the mutex only guards the
    ///   check-or-insert, never the computation.
    /// - Least recently used finished entries beyond capacity are evicted.
    ///   Entries still computing are never evicted, so the cache may exceed
    ///   its capacity until they finish.
    /// - A failed computation is unlinked before its waiters are woken and is
    ///   never served to later callers.
    ///
    /// @tparam Key      Query type; must expose @c airport_code for logging.
    /// @tparam Value    Computed result, stored immutable.
    /// @tparam Hash     Hash over Key.
    /// @tparam KeyEqual Equality consistent with Hash.
    template <typename Key, typename Value, typename Hash, typename KeyEqual>
    class SingleFlightCache
    {
    public:
        using ComputeFn = std::function<Value(const Key&)>;
        using ValuePtr = std::shared_ptr<const Value>;

        static constexpr std::size_t kDefaultCapacity = 64;

        explicit SingleFlightCache(ComputeFn compute,
                                   std::size_t capacity = kDefaultCapacity,
                                   std::string name = "ResultCache")
            : m_compute{std::move(compute)}
            , m_capacity{std::max<std::size_t>(1, capacity)}
            , m_name{std::move(name)}
        {
        }

        SingleFlightCache(const SingleFlightCache&) = delete;
        SingleFlightCache& operator=(const SingleFlightCache&) = delete;

        /// @brief Private copy of the cached value for @p key, computing it on a miss.
        /// Rethrows whatever the compute function threw for this key.
        [[nodiscard]] Value get_or_compute(const Key& key)
        {
            return *get_or_compute_shared(key);
        }

        /// @brief Shared read-only view of the cached value for @p key.
        [[nodiscard]] ValuePtr get_or_compute_shared(const Key& key)
        {
            std::shared_future<ValuePtr> result;
            std::promise<ValuePtr> promise;
            u64 generation = 0;
            bool owner = false;

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_index.find(key);
                if (it != m_index.end())
                {
                    m_lru.splice(m_lru.begin(), m_lru, it->second);
                    result = it->second->result;
                    ++m_stats.hits;
                }
                else
                {
                    ++m_stats.misses;
                    ++m_stats.computations;
                    generation = ++m_next_generation;
                    result = promise.get_future().share();
                    m_lru.push_front(Node{key, result, generation, false});
                    m_index.emplace(key, m_lru.begin());
                    owner = true;
                    evict_excess();
                }
            }

            if (owner)
            {
                ValuePtr value;
                try
                {
                    value = std::make_shared<const Value>(m_compute(key));
                }
                catch (...)
                {
                    // Unlink before waking waiters so a retry starts a fresh computation
                    discard_failed(key, generation);
                    promise.set_exception(std::current_exception());
                    throw;
                }
                promise.set_value(value);
                mark_ready(key, generation);
                return value;
            }

            return result.get();
        }

        [[nodiscard]] CacheStats stats() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_stats;
        }

        [[nodiscard]] std::size_t size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_lru.size();
        }

        [[nodiscard]] std::size_t capacity() const { return m_capacity; }

        /// @brief Drop every entry and reset statistics. In-flight computations
        /// still complete for their waiters but are not re-inserted.
        void clear()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_index.clear();
            m_lru.clear();
            m_stats = CacheStats{};
        }

    private:
        struct Node
        {
            Key key;
            std::shared_future<ValuePtr> result;
            u64 generation = 0;     ///< Distinguishes re-inserted keys after failure or clear
            bool ready = false;     ///< Value set; only ready entries are evictable
        };

        using LruList = std::list<Node>;
        using Index = std::unordered_map<Key, typename LruList::iterator, Hash, KeyEqual>;

        // Walks from the least recently used end; requires m_mutex held.
        void evict_excess()
        {
            auto it = m_lru.end();
            while (m_lru.size() > m_capacity && it != m_lru.begin())
            {
                --it;
                if (!it->ready)
                {
                    continue;
                }
                HPT_CORE_DEBUG("{}: evicting {}", m_name, it->key.airport_code);
                m_index.erase(it->key);
                it = m_lru.erase(it);
                ++m_stats.evictions;
            }
        }

        void mark_ready(const Key& key, u64 generation)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_index.find(key);
            if (it == m_index.end() || it->second->generation != generation)
            {
                return;
            }
            it->second->ready = true;
            evict_excess();
        }

        void discard_failed(const Key& key, u64 generation)
        {
            HPT_CORE_WARN("{}: computation for {} failed, entry discarded", m_name, key.airport_code);

            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_stats.failures;

            auto it = m_index.find(key);
            // A newer entry for the same key may have replaced ours after clear()
            if (it == m_index.end() || it->second->generation != generation)
            {
                return;
            }
            m_lru.erase(it->second);
            m_index.erase(it);
        }

        ComputeFn m_compute;
        std::size_t m_capacity;
        std::string m_name;

        mutable std::mutex m_mutex;
        LruList m_lru;              // front = most recently used
        Index m_index;
        u64 m_next_generation = 0;
        CacheStats m_stats;
    };

} // namespace helioport::cache
