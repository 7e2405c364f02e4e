#include <sleuth/console_presenter.hpp>
#include <cstdlib>

namespace sleuth {

namespace {

// Strict unsigned parse: digits only
bool parse_index(const std::string& s, size_t& out) {
    if (s.empty() || s.size() > 6) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    out = static_cast<size_t>(std::strtoul(s.c_str(), nullptr, 10));
    return true;
}

const char* rule() {
    return "────────────────────────────────────────────\n";
}

} // anonymous namespace

void ConsolePresenter::show_banner(const std::string& environment) {
    out_ << "┌──────────────────────────────────────────┐\n"
         << "│                 sleuth                   │\n"
         << "│        a murder most procedural          │\n"
         << "└──────────────────────────────────────────┘\n\n"
         << "Setting: " << environment << "\n"
         << "Assembling the cast...\n\n";
}

void ConsolePresenter::show_narration(const std::string& text) {
    out_ << rule() << "Watson: " << text << "\n" << rule();
}

void ConsolePresenter::show_introduction(const Character& character, const std::string& text) {
    out_ << "\n" << character.name() << ": " << text << "\n";
}

void ConsolePresenter::show_question(const std::string& text) {
    out_ << "Holmes: " << text << "\n";
}

void ConsolePresenter::show_answer(const Character& character, const std::string& text) {
    out_ << character.name() << ": " << text << "\n";
}

void ConsolePresenter::show_progress(const Progress& p) {
    out_ << "\nInterviewed " << p.visited << "/" << p.interviewable
         << " | Actions " << p.total_actions;
    if (p.action_limit) out_ << "/" << *p.action_limit;
    out_ << " | Guesses left " << p.guesses_left << "\n";
}

void ConsolePresenter::show_notice(const std::string& text) {
    out_ << "! " << text << "\n";
}

void ConsolePresenter::show_verdict(Verdict verdict, const Character& killer) {
    out_ << "\n" << rule();
    if (verdict == Verdict::Won) {
        out_ << "Case closed. " << killer.name() << " is the killer.\n";
    } else {
        out_ << "Out of guesses. The killer was " << killer.name() << ".\n";
    }
    out_ << rule();
}

std::optional<size_t> ConsolePresenter::select_character(const Roster& roster,
                                                         const std::set<size_t>& visited) {
    out_ << "\nWho do you want to question?\n";
    for (size_t i = 0; i < roster.size(); ++i) {
        const auto& c = roster[i];
        out_ << "  " << (i + 1) << ". " << c.name();
        if (c.is_victim()) out_ << " (victim)";
        else if (visited.count(i)) out_ << " (questioned)";
        out_ << "\n";
    }
    out_ << "  0. Nobody, I am ready to accuse\n";

    while (true) {
        std::string line = prompt("> ");
        size_t choice = 0;
        if (!parse_index(line, choice)) {
            out_ << "Enter a number from 0 to " << roster.size() << ".\n";
            continue;
        }
        if (choice == 0) return std::nullopt;
        return choice - 1;
    }
}

bool ConsolePresenter::wants_assisted_question(const Character& character) {
    while (true) {
        std::string line = to_lower(prompt("Ask " + character.name() +
                                           " yourself, or let Holmes ask? [me/holmes] "));
        if (line.empty() || line == "me" || line == "m") return false;
        if (line == "holmes" || line == "h") return true;
    }
}

std::string ConsolePresenter::ask_question(const Character& character) {
    return prompt("Your question for " + character.name() + " (" + exit_token_ + " to leave): ");
}

std::string ConsolePresenter::accuse(const std::vector<Character>& suspects) {
    out_ << "\nThe suspects:\n";
    for (size_t i = 0; i < suspects.size(); ++i) {
        out_ << "  " << (i + 1) << ". " << suspects[i].name() << "\n";
    }
    std::string line = prompt("Who is the killer? (name or number) ");
    size_t choice = 0;
    if (parse_index(line, choice) && choice >= 1 && choice <= suspects.size()) {
        return suspects[choice - 1].name();
    }
    return line;
}

std::string ConsolePresenter::prompt(const std::string& label) {
    out_ << label << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        throw InputClosed();
    }
    return trim(line);
}

} // namespace sleuth
