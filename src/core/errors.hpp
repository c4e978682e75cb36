#pragma once

/// @file errors.hpp
/// @brief Exception types for failures surfaced to callers of the engine.
///
/// Geometry faults never reach this layer: the merger absorbs them.
/// Only region- and availability-level failures are thrown, each carrying
/// the airport code and the resolver stage that failed.

#include <stdexcept>
#include <string>
#include <utility>

namespace helioport
{
    /// @brief Resolver stage at which a query failed.
    enum class ResolveStage
    {
        Lookup,
        Filtering,
        Merging,
        Estimating,
        Aggregating,
    };

    inline const char* resolve_stage_name(ResolveStage stage)
    {
        switch (stage)
        {
            case ResolveStage::Lookup:      return "lookup";
            case ResolveStage::Filtering:   return "filtering";
            case ResolveStage::Merging:     return "merging";
            case ResolveStage::Estimating:  return "estimating";
            case ResolveStage::Aggregating: return "aggregating";
            default:                        return "unknown";
        }
    }

    /// @brief Base error for the engine.
    class HelioportError : public std::runtime_error
    {
    public:
        HelioportError(std::string airport_code, ResolveStage stage, const std::string& message)
            : std::runtime_error(message)
            , m_airport_code{std::move(airport_code)}
            , m_stage{stage}
        {
        }

        [[nodiscard]] const std::string& airport_code() const noexcept { return m_airport_code; }
        [[nodiscard]] ResolveStage stage() const noexcept { return m_stage; }

    private:
        std::string m_airport_code;
        ResolveStage m_stage;
    };

    /// @brief The query names an airport code with no registered coordinate/state.
    class UnknownAirportError : public HelioportError
    {
    public:
        explicit UnknownAirportError(const std::string& airport_code)
            : HelioportError(airport_code, ResolveStage::Lookup,
                             "No such airport: " + airport_code)
        {
        }
    };

    /// @brief Neither footprint source has data for the airport's region.
    class DataUnavailableError : public HelioportError
    {
    public:
        DataUnavailableError(const std::string& airport_code, const std::string& state, ResolveStage stage)
            : HelioportError(airport_code, stage,
                             "No building data for this region: " + state +
                             " (airport " + airport_code + ", stage " + resolve_stage_name(stage) + ")")
            , m_state{state}
        {
        }

        [[nodiscard]] const std::string& state() const noexcept { return m_state; }

    private:
        std::string m_state;
    };

} // namespace helioport
