/**
 * @file Units.hpp
 * @brief Provider units and the fixed conversions to the export's canonical units.
 *
 * Only the conversions the export needs are supported. A quantity whose unit
 * belongs to a different dimension than the target raises UnitMismatchError.
 */

#pragma once

#include <optional>
#include <string>
#include "../ExportErrors.hpp"

namespace healthexport::domain {

/**
 * @enum ProviderUnit
 * @brief Units in which a provider may report a quantity.
 */
enum class ProviderUnit {
    Kilocalorie,
    Kilojoule,
    SmallCalorie,
    Meter,
    Kilometer,
    Mile,
    Foot,
    Count,
    CountPerMinute,
    CountPerSecond,
    MeterPerSecond,
    KilometerPerHour,
    MilePerHour,
    Watt,
    Kilowatt
};

enum class Dimension {
    Energy,
    Length,
    Count,
    Frequency,
    Speed,
    Power
};

/**
 * @struct Quantity
 * @brief A raw provider measurement: magnitude plus the unit it was reported in.
 */
struct Quantity {
    double value = 0.0;
    ProviderUnit unit = ProviderUnit::Count;
};

/// Unit labels written into StatValue. Fixed per field, never locale dependent.
namespace unit_labels {
inline constexpr const char* kKilocalories = "kcal";
inline constexpr const char* kKilometers = "km";
inline constexpr const char* kSteps = "steps";
inline constexpr const char* kBeatsPerMinute = "bpm";
inline constexpr const char* kMetersPerSecond = "m/s";
inline constexpr const char* kWatts = "W";
} // namespace unit_labels

inline std::string UnitToString(ProviderUnit unit) {
    switch (unit) {
        case ProviderUnit::Kilocalorie: return "kcal";
        case ProviderUnit::Kilojoule: return "kJ";
        case ProviderUnit::SmallCalorie: return "cal";
        case ProviderUnit::Meter: return "m";
        case ProviderUnit::Kilometer: return "km";
        case ProviderUnit::Mile: return "mi";
        case ProviderUnit::Foot: return "ft";
        case ProviderUnit::Count: return "count";
        case ProviderUnit::CountPerMinute: return "count/min";
        case ProviderUnit::CountPerSecond: return "count/s";
        case ProviderUnit::MeterPerSecond: return "m/s";
        case ProviderUnit::KilometerPerHour: return "km/h";
        case ProviderUnit::MilePerHour: return "mi/h";
        case ProviderUnit::Watt: return "W";
        case ProviderUnit::Kilowatt: return "kW";
        default: return "count";
    }
}

inline std::optional<ProviderUnit> UnitFromString(const std::string& unit) {
    if (unit == "kcal") return ProviderUnit::Kilocalorie;
    if (unit == "kJ") return ProviderUnit::Kilojoule;
    if (unit == "cal") return ProviderUnit::SmallCalorie;
    if (unit == "m") return ProviderUnit::Meter;
    if (unit == "km") return ProviderUnit::Kilometer;
    if (unit == "mi") return ProviderUnit::Mile;
    if (unit == "ft") return ProviderUnit::Foot;
    if (unit == "count") return ProviderUnit::Count;
    if (unit == "count/min") return ProviderUnit::CountPerMinute;
    if (unit == "count/s") return ProviderUnit::CountPerSecond;
    if (unit == "m/s") return ProviderUnit::MeterPerSecond;
    if (unit == "km/h") return ProviderUnit::KilometerPerHour;
    if (unit == "mi/h") return ProviderUnit::MilePerHour;
    if (unit == "W") return ProviderUnit::Watt;
    if (unit == "kW") return ProviderUnit::Kilowatt;
    return std::nullopt;
}

inline Dimension DimensionOf(ProviderUnit unit) {
    switch (unit) {
        case ProviderUnit::Kilocalorie:
        case ProviderUnit::Kilojoule:
        case ProviderUnit::SmallCalorie:
            return Dimension::Energy;
        case ProviderUnit::Meter:
        case ProviderUnit::Kilometer:
        case ProviderUnit::Mile:
        case ProviderUnit::Foot:
            return Dimension::Length;
        case ProviderUnit::Count:
            return Dimension::Count;
        case ProviderUnit::CountPerMinute:
        case ProviderUnit::CountPerSecond:
            return Dimension::Frequency;
        case ProviderUnit::MeterPerSecond:
        case ProviderUnit::KilometerPerHour:
        case ProviderUnit::MilePerHour:
            return Dimension::Speed;
        case ProviderUnit::Watt:
        case ProviderUnit::Kilowatt:
            return Dimension::Power;
    }
    return Dimension::Count;
}

/**
 * @brief Factor that converts one of @p unit into the base unit of its dimension
 * (kcal, m, count, count/min, m/s, W).
 */
inline double ToBaseFactor(ProviderUnit unit) {
    switch (unit) {
        case ProviderUnit::Kilocalorie: return 1.0;
        case ProviderUnit::Kilojoule: return 1.0 / 4.184;
        case ProviderUnit::SmallCalorie: return 0.001;
        case ProviderUnit::Meter: return 1.0;
        case ProviderUnit::Kilometer: return 1000.0;
        case ProviderUnit::Mile: return 1609.344;
        case ProviderUnit::Foot: return 0.3048;
        case ProviderUnit::Count: return 1.0;
        case ProviderUnit::CountPerMinute: return 1.0;
        case ProviderUnit::CountPerSecond: return 60.0;
        case ProviderUnit::MeterPerSecond: return 1.0;
        case ProviderUnit::KilometerPerHour: return 1.0 / 3.6;
        case ProviderUnit::MilePerHour: return 0.44704;
        case ProviderUnit::Watt: return 1.0;
        case ProviderUnit::Kilowatt: return 1000.0;
    }
    return 1.0;
}

/**
 * @brief Converts a quantity to @p target.
 * @throws UnitMismatchError if the units measure different dimensions.
 */
inline double ConvertQuantity(const Quantity& quantity, ProviderUnit target) {
    if (quantity.unit == target) {
        return quantity.value;
    }
    if (DimensionOf(quantity.unit) != DimensionOf(target)) {
        throw UnitMismatchError("Cannot convert " + UnitToString(quantity.unit) +
                                " to " + UnitToString(target));
    }
    return quantity.value * ToBaseFactor(quantity.unit) / ToBaseFactor(target);
}

} // namespace healthexport::domain
