#pragma once
// ConsolePresenter: line-oriented terminal front end
//
// Reads answers line by line from an input stream and writes prose to an
// output stream (stdin/stdout in the CLI, string streams in tests). End of
// input raises InputClosed so the caller can checkpoint and leave.

#include "presenter.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace sleuth {

class InputClosed : public std::runtime_error {
public:
    InputClosed() : std::runtime_error("input closed") {}
};

class ConsolePresenter : public Presenter {
public:
    explicit ConsolePresenter(std::istream& in = std::cin, std::ostream& out = std::cout,
                              std::string exit_token = "EXIT")
        : in_(in), out_(out), exit_token_(std::move(exit_token)) {}

    void show_banner(const std::string& environment) override;
    void show_narration(const std::string& text) override;
    void show_introduction(const Character& character, const std::string& text) override;
    void show_question(const std::string& text) override;
    void show_answer(const Character& character, const std::string& text) override;
    void show_progress(const Progress& progress) override;
    void show_notice(const std::string& text) override;
    void show_verdict(Verdict verdict, const Character& killer) override;

    std::optional<size_t> select_character(const Roster& roster,
                                           const std::set<size_t>& visited) override;
    bool wants_assisted_question(const Character& character) override;
    std::string ask_question(const Character& character) override;
    std::string accuse(const std::vector<Character>& suspects) override;

    // Prompt and read one trimmed line; InputClosed at end of input
    std::string prompt(const std::string& label);

private:
    std::istream& in_;
    std::ostream& out_;
    std::string exit_token_;
};

} // namespace sleuth
