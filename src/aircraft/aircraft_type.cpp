#include "aircraft_type.hpp"
#include "utils/utils.hpp"

std::string aircraft_type_to_string(AircraftType type) {
  switch (type) {
  case AircraftType::FIXED_WING:
    return "fixed_wing";
  case AircraftType::MULTIROTOR:
    return "multirotor";
  case AircraftType::VTOL:
    return "vtol";
  }
  return "unknown";
}

std::optional<AircraftType> aircraft_type_from_string(std::string_view name) {
  const std::string normalized = Utils::normalize_column_name(name);
  if (normalized == "fixed_wing" || normalized == "fixed-wing")
    return AircraftType::FIXED_WING;
  if (normalized == "multirotor")
    return AircraftType::MULTIROTOR;
  if (normalized == "vtol")
    return AircraftType::VTOL;
  return std::nullopt;
}
