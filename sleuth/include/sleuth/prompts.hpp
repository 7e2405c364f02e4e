#pragma once
// Prompts: instructions handed to the generation backend
//
// Builders take typed state and return the finished instruction text. The
// wording is deliberately plain; backends are free to wrap it.

#include "types.hpp"
#include <string>

namespace sleuth {
namespace prompts {

inline std::string roster(const std::string& environment, size_t roster_size) {
    return "You are designing the cast of a murder mystery set in: " + environment + ".\n"
           "Create exactly " + std::to_string(roster_size) + " characters.\n"
           "- Exactly one character has role Killer.\n"
           "- Exactly one character has role Victim.\n"
           "- Every other character has role Suspect and can be questioned.\n"
           "Give each character a distinct name and a backstory covering their "
           "background, concerns, motives and relationships. Fit every role to the setting.";
}

inline std::string scenario(const std::string& environment, const Roster& cast) {
    std::string personas;
    for (const auto& c : cast) personas += c.persona() + "\n";
    return "Write the central crime for a murder mystery set in: " + environment + ".\n"
           "Characters:\n" + personas +
           "Describe where and how the victim was found, the time of death, the cause of "
           "death and the weapon, the state of the scene, witnesses and last sightings, "
           "and initial clues mixing true leads with red herrings.\n"
           "In relationship_brief summarise every character and how they relate.\n"
           "Never reveal or hint at who the killer is.";
}

inline std::string narration(const Scenario& s) {
    return "You are Dr. John Watson greeting Sherlock Holmes at a crime scene. In 100 words "
           "or fewer, address him directly and set the scene.\n"
           "Victim: " + s.victim_name + "\n"
           "Time: " + s.time_of_death + "\n"
           "Location: " + s.location_found + "\n"
           "Weapon: " + s.murder_weapon + "\n"
           "Cause of death: " + s.cause_of_death + "\n"
           "Scene: " + s.crime_scene_details;
}

inline std::string introduction(const Character& c, const Scenario& s) {
    return "You are playing this character:\n" + c.persona() +
           "Sherlock Holmes is interviewing you about the death of " + s.victim_name +
           " around " + s.time_of_death + " at " + s.location_found + ".\n"
           "Greet him and introduce yourself conversationally. Do not reveal your role "
           "or incriminate yourself.";
}

inline std::string question(const Character& c, const Scenario& s, const MessageLog& history) {
    return "You are Sherlock Holmes interviewing " + c.name() + " about the murder of " +
           s.victim_name + ".\n"
           "It happened around " + s.time_of_death + " at " + s.location_found +
           ". Weapon: " + s.murder_weapon + ". Cause of death: " + s.cause_of_death + ".\n"
           "Scene: " + s.crime_scene_details + "\n"
           "Initial clues: " + s.initial_clues + "\n"
           "Conversation so far:\n" + format_history(history) +
           "Ask one incisive question that moves the investigation forward.";
}

// The persona carries only the retrieved slice of background, not the full backstory
inline std::string answer(const Character& c, const std::string& background,
                          const Scenario& s, const std::string& asked) {
    return "You are playing this character:\n"
           "Name: " + c.name() + "\nRole: " + role_name(c.role()) +
           "\nRelevant background: " + background + "\n"
           "Sherlock Holmes is questioning you about this crime:\n"
           "Victim: " + s.victim_name + "\n"
           "Time: " + s.time_of_death + "\n"
           "Location: " + s.location_found + "\n"
           "Weapon: " + s.murder_weapon + "\n"
           "Cause of death: " + s.cause_of_death + "\n"
           "Scene: " + s.crime_scene_details + "\n"
           "Characters and relationships: " + s.relationship_brief + "\n"
           "Stay in character, reveal only what this character knows, stay consistent "
           "with the facts, and lie if the character has reason to.\n"
           "Question: " + asked;
}

} // namespace prompts
} // namespace sleuth
