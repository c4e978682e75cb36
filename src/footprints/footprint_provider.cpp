/// @file footprint_provider.cpp
/// @brief In-memory footprint provider.

#include "footprints/footprint_provider.hpp"

#include <utility>

namespace helioport::footprints
{

void InMemoryFootprintProvider::add(const std::string& state, Footprint footprint)
{
    StateSets& sets = m_states[state];
    std::shared_ptr<FootprintSet>& target =
        footprint.source == FootprintSource::Primary ? sets.primary : sets.secondary;
    if (!target)
    {
        target = std::make_shared<FootprintSet>();
    }
    target->push_back(std::move(footprint));
}

void InMemoryFootprintProvider::set(const std::string& state, FootprintSource source, FootprintSet footprints)
{
    for (Footprint& footprint : footprints)
    {
        footprint.source = source;
    }

    StateSets& sets = m_states[state];
    auto shared = std::make_shared<FootprintSet>(std::move(footprints));
    if (source == FootprintSource::Primary)
    {
        sets.primary = std::move(shared);
    }
    else
    {
        sets.secondary = std::move(shared);
    }
}

std::shared_ptr<const FootprintSet> InMemoryFootprintProvider::footprints(
    const std::string& state, FootprintSource source) const
{
    const auto it = m_states.find(state);
    if (it == m_states.end())
    {
        return nullptr;
    }
    return source == FootprintSource::Primary ? it->second.primary : it->second.secondary;
}

std::size_t InMemoryFootprintProvider::size() const
{
    std::size_t total = 0;
    for (const auto& [state, sets] : m_states)
    {
        total += sets.primary ? sets.primary->size() : 0;
        total += sets.secondary ? sets.secondary->size() : 0;
    }
    return total;
}

} // namespace helioport::footprints
