#pragma once
// Generator: the text-generation backend seen from the core
//
// Two calls only: structured output validated against a JSON schema, and
// free text given a prompt plus conversation history. Implementations own
// transport, timeouts and retries; the core never retries. Every failure
// surfaces as GenerationError.

#include "log.hpp"
#include "prompts.hpp"
#include "types.hpp"
#include <stdexcept>
#include <string>

namespace sleuth {

class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& what) : std::runtime_error(what) {}
};

class Generator {
public:
    virtual ~Generator() = default;

    // Returns an object conforming to `schema`
    virtual json generate_structured(const std::string& prompt, const json& schema) = 0;

    virtual std::string generate_text(const std::string& prompt, const MessageLog& history) = 0;

    virtual std::string name() const = 0;
};

// ═══════════════════════════════════════════════════════════════════
// Schemas for structured output
// ═══════════════════════════════════════════════════════════════════

inline json roster_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"characters", {
                {"type", "array"},
                {"items", {
                    {"type", "object"},
                    {"properties", {
                        {"role", {{"type", "string"}, {"enum", json::array({"Killer", "Victim", "Suspect"})}}},
                        {"name", {{"type", "string"}}},
                        {"backstory", {{"type", "string"}}}
                    }},
                    {"required", json::array({"role", "name", "backstory"})}
                }}
            }}
        }},
        {"required", json::array({"characters"})}
    };
}

inline json scenario_schema() {
    json props = json::object();
    for (const char* field : {"victim_name", "time_of_death", "location_found",
                              "murder_weapon", "cause_of_death", "crime_scene_details",
                              "witnesses", "initial_clues", "relationship_brief"}) {
        props[field] = {{"type", "string"}};
    }
    return {
        {"type", "object"},
        {"properties", props},
        {"required", json::array({"victim_name", "time_of_death", "location_found",
                                  "murder_weapon", "cause_of_death", "crime_scene_details",
                                  "witnesses", "initial_clues", "relationship_brief"})}
    };
}

// ═══════════════════════════════════════════════════════════════════
// Typed results
// ═══════════════════════════════════════════════════════════════════

inline size_t count_role(const Roster& roster, Role role) {
    size_t n = 0;
    for (const auto& c : roster) {
        if (c.role() == role) n++;
    }
    return n;
}

// Exactly one killer and one victim, non-empty distinct names.
// Empty string when valid, otherwise the reason.
inline std::string validate_roster(const Roster& roster) {
    if (roster.empty()) return "roster is empty";
    size_t killers = count_role(roster, Role::Killer);
    size_t victims = count_role(roster, Role::Victim);
    if (killers != 1) return "expected exactly one Killer, got " + std::to_string(killers);
    if (victims != 1) return "expected exactly one Victim, got " + std::to_string(victims);
    for (size_t i = 0; i < roster.size(); ++i) {
        if (trim(roster[i].name()).empty()) {
            return "character " + std::to_string(i) + " has no name";
        }
        for (size_t j = 0; j < i; ++j) {
            if (roster[j].name() == roster[i].name()) {
                return "duplicate character name: " + roster[i].name();
            }
        }
    }
    return "";
}

inline Roster parse_roster(const json& data) {
    if (!data.is_object() || !data.contains("characters") || !data["characters"].is_array()) {
        throw GenerationError("malformed roster: missing 'characters' array");
    }
    Roster roster;
    try {
        for (const auto& item : data["characters"]) {
            roster.push_back(item.get<Character>());
        }
    } catch (const json::exception& e) {
        throw GenerationError(std::string("malformed roster: ") + e.what());
    }
    std::string problem = validate_roster(roster);
    if (!problem.empty()) {
        throw GenerationError("invalid roster: " + problem);
    }
    return roster;
}

inline Scenario parse_scenario(const json& data) {
    if (!data.is_object()) {
        throw GenerationError("malformed scenario: not an object");
    }
    Scenario scenario;
    try {
        scenario = data.get<Scenario>();
    } catch (const json::exception& e) {
        throw GenerationError(std::string("malformed scenario: ") + e.what());
    }
    if (trim(scenario.victim_name).empty()) {
        throw GenerationError("malformed scenario: empty victim_name");
    }
    return scenario;
}

// ═══════════════════════════════════════════════════════════════════
// Typed generation
// ═══════════════════════════════════════════════════════════════════

// One structured call. A roster without exactly one Killer and one Victim
// is rejected, never repaired.
inline Roster generate_roster(Generator& generator, const std::string& environment,
                              size_t roster_size) {
    Roster roster = parse_roster(generator.generate_structured(
        prompts::roster(environment, roster_size), roster_schema()));
    if (roster.size() != roster_size) {
        log_debug("generator", "asked for %zu characters, got %zu",
                  roster_size, roster.size());
    }
    return roster;
}

inline Scenario generate_scenario(Generator& generator, const std::string& environment,
                                  const Roster& roster) {
    return parse_scenario(generator.generate_structured(
        prompts::scenario(environment, roster), scenario_schema()));
}

} // namespace sleuth
