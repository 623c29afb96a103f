/* SPDX-License-Identifier: GPL-2.0-only */

#ifndef SENSORNET_ID_CACHE_H
#define SENSORNET_ID_CACHE_H

#include "ns3/nstime.h"

#include <cstdint>
#include <vector>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 *
 * @brief Unique message identification cache used for duplicate suppression.
 *
 * Used for interest rebroadcast suppression and exploratory data
 * deduplication in Directed Diffusion, and for query loop suppression and
 * restricted region flooding in GEAR.  The caller supplies the current
 * simulation time, since the cache is driven by the engine's own scheduler.
 */
class IdCache
{
  public:
    /**
     * constructor
     * @param lifetime the lifetime for added entries
     */
    IdCache(Time lifetime)
        : m_lifetime(lifetime)
    {
    }

    /**
     * Check that entry (context, id) exists in cache. Add entry, if it doesn't exist.
     * @param context the id scope (e.g. the originating node)
     * @param id the cache entry ID
     * @param now the current simulation time
     * @returns true if the pair exists
     */
    bool IsDuplicate(uint32_t context, uint64_t id, Time now);
    /**
     * Check for an entry without inserting it
     * @param context the id scope
     * @param id the cache entry ID
     * @param now the current simulation time
     * @returns true if the pair exists and has not expired
     */
    bool Contains(uint32_t context, uint64_t id, Time now) const;
    /**
     * Remove all expired entries
     * @param now the current simulation time
     */
    void Purge(Time now);
    /// Remove all entries
    void Clear()
    {
        m_idCache.clear();
    }
    /**
     * @param now the current simulation time
     * @returns number of entries in cache
     */
    uint32_t GetSize(Time now);

    /**
     * Set lifetime for future added entries.
     * @param lifetime the lifetime for entries
     */
    void SetLifetime(Time lifetime)
    {
        m_lifetime = lifetime;
    }

    /**
     * Return lifetime for existing entries in cache
     * @returns the lifetime
     */
    Time GetLifeTime() const
    {
        return m_lifetime;
    }

  private:
    /// Unique message ID
    struct UniqueId
    {
        /// ID is supposed to be unique in single context (e.g. originating node)
        uint32_t m_context;
        /// The id
        uint64_t m_id;
        /// When record will expire
        Time m_expire;
    };

    /**
     * @brief IsExpired structure
     */
    struct IsExpired
    {
        /// Reference time
        Time m_now;

        /**
         * @brief Check if the entry is expired
         *
         * @param u UniqueId entry
         * @return true if expired, false otherwise
         */
        bool operator()(const UniqueId& u) const
        {
            return (u.m_expire < m_now);
        }
    };

    /// Already seen IDs
    std::vector<UniqueId> m_idCache;
    /// Default lifetime for ID records
    Time m_lifetime;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_ID_CACHE_H */
