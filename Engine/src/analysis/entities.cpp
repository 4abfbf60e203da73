#include <analysis/entities.hpp>
#include <utils/text.hpp>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace Repealer {

namespace {

const std::regex& length_pattern() {
    static const std::regex re(R"((\d+(?:\.\d+)?)\s*(feet|foot|ft|inches|inch|in|meters|meter|m)\b)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& electrical_pattern() {
    static const std::regex re(R"((\d+(?:\.\d+)?)\s*(kVA|KVA|kV|KV|[Vv]olts?|[Aa]mps?|V|A)\b)");
    return re;
}

const std::regex& standard_pattern() {
    static const std::regex re(
        R"(\b(ASTM\s+[A-Z]\d+|IEEE\s+\d+(?:\.\d+)*|ANSI\s+[A-Z]?\d+(?:\.\d+)*|NESC(?:\s+Rule\s+\d+[A-Z]?)?|G\.?O\.?[\s-]*95)\b)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& classification_pattern() {
    static const std::regex re(R"(\b((?:Type|Class|Grade|TYPE|CLASS|GRADE)\s+(?:[A-Z]{1,3}\d*|\d+[A-Z]?))\b)");
    return re;
}

std::string canonical_unit(const std::string& raw) {
    std::string u = to_lower(raw);
    if (u == "feet" || u == "foot" || u == "ft") return "ft";
    if (u == "inches" || u == "inch" || u == "in") return "in";
    if (u == "meters" || u == "meter" || u == "m") return "m";
    if (u == "kva") return "kVA";
    if (u == "kv") return "kV";
    if (u == "v" || u == "volt" || u == "volts") return "V";
    return "A";
}

std::string format_measurement(const Measurement& m) {
    std::ostringstream os;
    os << m.value << ' ' << m.unit;
    return os.str();
}

template <typename F>
void for_each_match(const std::string& text, const std::regex& re, F&& f) {
    for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it) f(*it);
}

} // namespace

const char* to_string(EntityType t) {
    switch (t) {
        case EntityType::Measurement:    return "measurement";
        case EntityType::Standard:       return "standard";
        case EntityType::Classification: return "classification";
    }
    return "measurement";
}

std::vector<Measurement> extract_measurements(const std::string& text) {
    std::vector<Measurement> out;
    auto add = [&](const std::smatch& m) {
        const std::string digits = m[1].str();
        char* end = nullptr;
        errno = 0;
        const double value = std::strtod(digits.c_str(), &end);
        // digit runs too long for a double are not measurements
        if (errno == ERANGE || end != digits.c_str() + digits.size() || !std::isfinite(value)) return;
        out.push_back({value, canonical_unit(m[2].str())});
    };
    for_each_match(text, length_pattern(), add);
    for_each_match(text, electrical_pattern(), add);
    return out;
}

std::vector<Entity> extract_entities(const std::string& text) {
    std::vector<Entity> out;
    for (const auto& m : extract_measurements(text)) {
        out.push_back({EntityType::Measurement, format_measurement(m)});
    }
    for_each_match(text, standard_pattern(), [&](const std::smatch& m) {
        std::string key = to_lower(collapse_whitespace(m[1].str()));
        if (key[0] == 'g') key = "go 95";
        out.push_back({EntityType::Standard, key});
    });
    for_each_match(text, classification_pattern(), [&](const std::smatch& m) {
        out.push_back({EntityType::Classification, to_lower(collapse_whitespace(m[1].str()))});
    });
    return out;
}

} // namespace Repealer
