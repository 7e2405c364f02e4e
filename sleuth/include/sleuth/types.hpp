#pragma once
// Core types: the cast, the crime, and what was said
//
// Characters and the scenario are produced once per session by the
// generation backend and never edited afterwards. Messages are the
// shared currency of conversation logs and the session log.

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

namespace sleuth {

using json = nlohmann::json;

// Timestamp as Unix millis
using Timestamp = int64_t;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Session identifier: 16 hex digits from a 64-bit random draw
inline std::string generate_session_id() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dis(gen)));
    return buf;
}

// djb2 hash - deterministic across platforms (unlike std::hash)
inline uint32_t djb2_hash(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);
    }
    return hash;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(start, end - start);
}

// ═══════════════════════════════════════════════════════════════════
// Characters
// ═══════════════════════════════════════════════════════════════════

enum class Role : uint8_t {
    Killer,
    Victim,
    Suspect
};

inline const char* role_name(Role role) {
    switch (role) {
        case Role::Killer: return "Killer";
        case Role::Victim: return "Victim";
        default: return "Suspect";
    }
}

// Generators are loose with casing and invent supporting roles
// ("Butler", "Witness"); anything that is not killer or victim is a suspect.
inline Role parse_role(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower == "killer" || lower == "murderer") return Role::Killer;
    if (lower == "victim") return Role::Victim;
    return Role::Suspect;
}

class Character {
public:
    Character() = default;
    Character(Role role, std::string name, std::string backstory)
        : role_(role), name_(std::move(name)), backstory_(std::move(backstory)) {}

    Role role() const { return role_; }
    const std::string& name() const { return name_; }
    const std::string& backstory() const { return backstory_; }

    bool is_killer() const { return role_ == Role::Killer; }
    bool is_victim() const { return role_ == Role::Victim; }

    // Formatted persona, rebuilt on every call
    std::string persona() const {
        return "Name: " + name_ + "\nRole: " + role_name(role_) +
               "\nBackstory: " + backstory_ + "\n";
    }

    bool operator==(const Character& other) const {
        return role_ == other.role_ && name_ == other.name_ &&
               backstory_ == other.backstory_;
    }
    bool operator!=(const Character& other) const { return !(*this == other); }

private:
    Role role_ = Role::Suspect;
    std::string name_;
    std::string backstory_;
};

using Roster = std::vector<Character>;

// ═══════════════════════════════════════════════════════════════════
// Scenario
// ═══════════════════════════════════════════════════════════════════

struct Scenario {
    std::string victim_name;
    std::string time_of_death;
    std::string location_found;
    std::string murder_weapon;
    std::string cause_of_death;
    std::string crime_scene_details;
    std::string witnesses;
    std::string initial_clues;
    std::string relationship_brief;   // all characters, killer not revealed

    bool empty() const { return victim_name.empty(); }

    bool operator==(const Scenario& o) const {
        return victim_name == o.victim_name && time_of_death == o.time_of_death &&
               location_found == o.location_found && murder_weapon == o.murder_weapon &&
               cause_of_death == o.cause_of_death &&
               crime_scene_details == o.crime_scene_details &&
               witnesses == o.witnesses && initial_clues == o.initial_clues &&
               relationship_brief == o.relationship_brief;
    }
};

// ═══════════════════════════════════════════════════════════════════
// Messages
// ═══════════════════════════════════════════════════════════════════

enum class Speaker : uint8_t {
    Narrator,
    Detective,
    Character
};

inline const char* speaker_name(Speaker s) {
    switch (s) {
        case Speaker::Narrator: return "narrator";
        case Speaker::Detective: return "detective";
        default: return "character";
    }
}

inline Speaker parse_speaker(const std::string& s) {
    if (s == "narrator") return Speaker::Narrator;
    if (s == "detective") return Speaker::Detective;
    return Speaker::Character;
}

struct Message {
    Speaker speaker = Speaker::Narrator;
    std::string text;

    bool operator==(const Message& o) const {
        return speaker == o.speaker && text == o.text;
    }
};

using MessageLog = std::vector<Message>;

// "speaker: text" per line, the form history takes inside prompts
inline std::string format_history(const MessageLog& log) {
    std::string out;
    for (const auto& m : log) {
        out += speaker_name(m.speaker);
        out += ": ";
        out += m.text;
        out += "\n";
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════════════

inline void to_json(json& j, const Character& c) {
    j = json{{"role", role_name(c.role())},
             {"name", c.name()},
             {"backstory", c.backstory()}};
}

inline void from_json(const json& j, Character& c) {
    c = Character(parse_role(j.at("role").get<std::string>()),
                  j.at("name").get<std::string>(),
                  j.at("backstory").get<std::string>());
}

inline void to_json(json& j, const Scenario& s) {
    j = json{{"victim_name", s.victim_name},
             {"time_of_death", s.time_of_death},
             {"location_found", s.location_found},
             {"murder_weapon", s.murder_weapon},
             {"cause_of_death", s.cause_of_death},
             {"crime_scene_details", s.crime_scene_details},
             {"witnesses", s.witnesses},
             {"initial_clues", s.initial_clues},
             {"relationship_brief", s.relationship_brief}};
}

inline void from_json(const json& j, Scenario& s) {
    s.victim_name = j.at("victim_name").get<std::string>();
    s.time_of_death = j.at("time_of_death").get<std::string>();
    s.location_found = j.at("location_found").get<std::string>();
    s.murder_weapon = j.at("murder_weapon").get<std::string>();
    s.cause_of_death = j.at("cause_of_death").get<std::string>();
    s.crime_scene_details = j.at("crime_scene_details").get<std::string>();
    s.witnesses = j.value("witnesses", "");
    s.initial_clues = j.value("initial_clues", "");
    s.relationship_brief = j.value("relationship_brief", "");
}

inline void to_json(json& j, const Message& m) {
    j = json{{"speaker", speaker_name(m.speaker)}, {"text", m.text}};
}

inline void from_json(const json& j, Message& m) {
    m.speaker = parse_speaker(j.at("speaker").get<std::string>());
    m.text = j.at("text").get<std::string>();
}

} // namespace sleuth
