#pragma once
// Presenter: everything the player sees and everything the player decides
//
// Render hooks never fail. Input hooks block until the player answers.
// The core never touches stdin/stdout directly; ConsolePresenter is the
// terminal implementation, tests drive the machines with a scripted one.

#include "types.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sleuth {

enum class Verdict : uint8_t {
    Won,
    Lost
};

// Counters shown between visits
struct Progress {
    size_t visited = 0;
    size_t interviewable = 0;
    uint32_t total_actions = 0;
    std::optional<uint32_t> action_limit;
    uint32_t guesses_left = 0;
};

class Presenter {
public:
    virtual ~Presenter() = default;

    virtual void show_banner(const std::string& environment) = 0;
    virtual void show_narration(const std::string& text) = 0;
    virtual void show_introduction(const Character& character, const std::string& text) = 0;
    virtual void show_question(const std::string& text) = 0;
    virtual void show_answer(const Character& character, const std::string& text) = 0;
    virtual void show_progress(const Progress& progress) = 0;
    virtual void show_notice(const std::string& text) = 0;
    virtual void show_verdict(Verdict verdict, const Character& killer) = 0;

    // Index into roster, or nullopt for "no character" (go accuse)
    virtual std::optional<size_t> select_character(const Roster& roster,
                                                   const std::set<size_t>& visited) = 0;

    // True when the detective assistant should phrase the next question
    virtual bool wants_assisted_question(const Character& character) = 0;

    virtual std::string ask_question(const Character& character) = 0;

    // Name of the accused; suspects are sorted by name
    virtual std::string accuse(const std::vector<Character>& suspects) = 0;
};

} // namespace sleuth
