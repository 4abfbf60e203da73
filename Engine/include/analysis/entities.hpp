/**
 * @file entities.hpp
 * @brief Pattern-based domain entities: measurements, standard citations, classifications
 */

#pragma once

#include <export.hpp>
#include <string>
#include <vector>

namespace Repealer {

enum class EntityType {
    Measurement,     ///< "18 feet", "12 kV"
    Standard,        ///< "ASTM A123", "NESC Rule 232", "GO 95"
    Classification   ///< "Type 3", "Class H1", "Grade B"
};

REPEALER_API const char* to_string(EntityType t);

struct Entity {
    EntityType type;
    std::string canonical;   ///< comparison key, e.g. "18 ft", "nesc rule 232", "class h1"
};

struct Measurement {
    double value = 0.0;
    std::string unit;        ///< ft, in, m, V, kV, A, kVA
};

REPEALER_API std::vector<Measurement> extract_measurements(const std::string& text);
REPEALER_API std::vector<Entity> extract_entities(const std::string& text);

} // namespace Repealer
