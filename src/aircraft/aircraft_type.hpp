#ifndef AIRCRAFT_TYPE_HPP
#define AIRCRAFT_TYPE_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>

enum class AircraftType { FIXED_WING, MULTIROTOR, VTOL };

// Catalog order; also the order used to resolve ties that do not involve the
// configured tie-break type.
constexpr std::array<AircraftType, 3> ALL_AIRCRAFT_TYPES = {
    AircraftType::FIXED_WING, AircraftType::MULTIROTOR, AircraftType::VTOL};

std::string aircraft_type_to_string(AircraftType type);
std::optional<AircraftType> aircraft_type_from_string(std::string_view name);

#endif // AIRCRAFT_TYPE_HPP
