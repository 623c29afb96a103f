/* SPDX-License-Identifier: GPL-2.0-only */

#include "sensornet-id-cache.h"

#include <algorithm>

namespace ns3
{
namespace sensornet
{

bool
IdCache::IsDuplicate(uint32_t context, uint64_t id, Time now)
{
    Purge(now);
    for (auto i = m_idCache.begin(); i != m_idCache.end(); ++i)
    {
        if (i->m_context == context && i->m_id == id)
        {
            return true;
        }
    }
    UniqueId uniqueId = {context, id, m_lifetime + now};
    m_idCache.push_back(uniqueId);
    return false;
}

bool
IdCache::Contains(uint32_t context, uint64_t id, Time now) const
{
    return std::any_of(m_idCache.begin(), m_idCache.end(), [&](const UniqueId& u) {
        return u.m_context == context && u.m_id == id && u.m_expire >= now;
    });
}

void
IdCache::Purge(Time now)
{
    m_idCache.erase(remove_if(m_idCache.begin(), m_idCache.end(), IsExpired{now}),
                    m_idCache.end());
}

uint32_t
IdCache::GetSize(Time now)
{
    Purge(now);
    return m_idCache.size();
}

} // namespace sensornet
} // namespace ns3
