#pragma once

/// @file footprint_provider.hpp
/// @brief Access to per-state footprint sets, already parsed.

#include "footprints/building.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace helioport::footprints
{
    using FootprintSet = std::vector<Footprint>;

    /// @brief Supplies footprints for a state, one set per source.
    ///
    /// A null result means the source has no data for that state; the merger
    /// then continues with whatever the other source provides.
    class FootprintProvider
    {
    public:
        virtual ~FootprintProvider() = default;

        /// @brief Footprints of @p source for @p state, or nullptr if unavailable.
        [[nodiscard]] virtual std::shared_ptr<const FootprintSet> footprints(
            const std::string& state, FootprintSource source) const = 0;
    };

    /// @brief Provider backed by in-memory sets, filled at startup or by tests.
    class InMemoryFootprintProvider final : public FootprintProvider
    {
    public:
        /// @brief Append one footprint to the set for (state, footprint.source).
        void add(const std::string& state, Footprint footprint);

        /// @brief Replace the whole set for (state, source).
        void set(const std::string& state, FootprintSource source, FootprintSet footprints);

        [[nodiscard]] std::shared_ptr<const FootprintSet> footprints(
            const std::string& state, FootprintSource source) const override;

        /// @brief Total footprints across all states and sources.
        [[nodiscard]] std::size_t size() const;

    private:
        struct StateSets
        {
            std::shared_ptr<FootprintSet> primary;
            std::shared_ptr<FootprintSet> secondary;
        };

        std::map<std::string, StateSets, std::less<>> m_states;
    };

} // namespace helioport::footprints
