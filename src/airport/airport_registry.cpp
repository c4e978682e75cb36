/// @file airport_registry.cpp
/// @brief Airport lookup and the built-in airport table.

#include "airport/airport_registry.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace helioport::airport
{

std::string normalize_code(std::string_view code)
{
    std::string upper{code};
    for (char& c : upper)
    {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return upper;
}

AirportRegistry::AirportRegistry(std::vector<Airport> airports)
{
    m_airports.reserve(airports.size());
    for (Airport& airport : airports)
    {
        add(std::move(airport));
    }
}

void AirportRegistry::add(Airport airport)
{
    airport.code = normalize_code(airport.code);

    auto it = std::find_if(m_airports.begin(), m_airports.end(),
                           [&](const Airport& existing) { return existing.code == airport.code; });
    if (it != m_airports.end())
    {
        *it = std::move(airport);
        return;
    }
    m_airports.push_back(std::move(airport));
}

const Airport* AirportRegistry::find(std::string_view code) const
{
    const std::string key = normalize_code(code);
    for (const Airport& airport : m_airports)
    {
        if (airport.code == key)
        {
            return &airport;
        }
    }
    return nullptr;
}

// -----------------------------------------------------------------
// Built-in table: FAA 2023 enplanement ranking, reference points in degrees
// -----------------------------------------------------------------

const AirportRegistry& AirportRegistry::builtin()
{
    static const AirportRegistry registry{std::vector<Airport>{
        {"ATL", "Hartsfield-Jackson Atlanta International", "Atlanta", "Georgia", {33.6407, -84.4277}},
        {"DFW", "Dallas/Fort Worth International", "Dallas", "Texas", {32.8998, -97.0403}},
        {"DEN", "Denver International", "Denver", "Colorado", {39.8561, -104.6737}},
        {"ORD", "O'Hare International", "Chicago", "Illinois", {41.9742, -87.9073}},
        {"LAX", "Los Angeles International", "Los Angeles", "California", {33.9416, -118.4085}},
        {"JFK", "John F. Kennedy International", "New York", "New York", {40.6413, -73.7781}},
        {"LAS", "Harry Reid International", "Las Vegas", "Nevada", {36.0840, -115.1537}},
        {"MCO", "Orlando International", "Orlando", "Florida", {28.4312, -81.3081}},
        {"MIA", "Miami International", "Miami", "Florida", {25.7959, -80.2870}},
        {"CLT", "Charlotte Douglas International", "Charlotte", "North Carolina", {35.2144, -80.9473}},
        {"SEA", "Seattle-Tacoma International", "Seattle", "Washington", {47.4502, -122.3088}},
        {"PHX", "Phoenix Sky Harbor International", "Phoenix", "Arizona", {33.4342, -112.0116}},
        {"EWR", "Newark Liberty International", "Newark", "New Jersey", {40.6895, -74.1745}},
        {"SFO", "San Francisco International", "San Francisco", "California", {37.6213, -122.3790}},
        {"IAH", "George Bush Intercontinental", "Houston", "Texas", {29.9902, -95.3368}},
        {"BOS", "Logan International", "Boston", "Massachusetts", {42.3656, -71.0096}},
        {"FLL", "Fort Lauderdale-Hollywood International", "Fort Lauderdale", "Florida", {26.0742, -80.1506}},
        {"MSP", "Minneapolis-Saint Paul International", "Minneapolis", "Minnesota", {44.8848, -93.2223}},
        {"LGA", "LaGuardia", "New York", "New York", {40.7769, -73.8740}},
        {"DTW", "Detroit Metropolitan Wayne County", "Detroit", "Michigan", {42.2162, -83.3554}},
        {"PHL", "Philadelphia International", "Philadelphia", "Pennsylvania", {39.8744, -75.2424}},
        {"SLC", "Salt Lake City International", "Salt Lake City", "Utah", {40.7899, -111.9791}},
        {"BWI", "Baltimore/Washington International", "Baltimore", "Maryland", {39.1774, -76.6684}},
        {"DCA", "Ronald Reagan Washington National", "Arlington", "Virginia", {38.8512, -77.0402}},
        {"SAN", "San Diego International", "San Diego", "California", {32.7338, -117.1933}},
        {"IAD", "Washington Dulles International", "Dulles", "Virginia", {38.9531, -77.4565}},
        {"TPA", "Tampa International", "Tampa", "Florida", {27.9755, -82.5332}},
        {"BNA", "Nashville International", "Nashville", "Tennessee", {36.1263, -86.6774}},
        {"AUS", "Austin-Bergstrom International", "Austin", "Texas", {30.1975, -97.6664}},
        {"HNL", "Daniel K. Inouye International", "Honolulu", "Hawaii", {21.3187, -157.9225}},
    }};
    return registry;
}

} // namespace helioport::airport
