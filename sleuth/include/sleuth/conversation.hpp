#pragma once
// ConversationMachine: one interview with one character
//
//   Introducing → Asking → Answering → Asking ... → Ended
//
// Introductions are cached per (character, victim) and reused verbatim.
// Every question counts as one turn whoever phrased it; the visit ends on
// the exit token or at the turn cap. Answers see only the slice of the
// backstory that ContextIndex deems relevant to the question.
//
// GenerationError propagates out of step()/run()/ask(). The state keeps the
// turns already counted so the caller can still account for them.

#include "cache_store.hpp"
#include "context_index.hpp"
#include "generator.hpp"
#include "log.hpp"
#include "presenter.hpp"
#include "prompts.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace sleuth {

enum class ConversationPhase : uint8_t {
    Introducing,
    Asking,
    Answering,
    Ended
};

inline const char* conversation_phase_name(ConversationPhase p) {
    switch (p) {
        case ConversationPhase::Introducing: return "introducing";
        case ConversationPhase::Asking: return "asking";
        case ConversationPhase::Answering: return "answering";
        default: return "ended";
    }
}

inline ConversationPhase parse_conversation_phase(const std::string& s) {
    if (s == "introducing") return ConversationPhase::Introducing;
    if (s == "asking") return ConversationPhase::Asking;
    if (s == "answering") return ConversationPhase::Answering;
    return ConversationPhase::Ended;
}

struct ConversationConfig {
    uint32_t max_turns = 25;
    std::string exit_token = "EXIT";
    size_t answer_context_units = 300;
};

struct ConversationState {
    MessageLog message_log;
    Character character;
    Scenario scenario;
    uint32_t turn_count = 0;
    ConversationPhase phase = ConversationPhase::Introducing;
    std::string pending_question;    // asked, not yet answered
    bool exit_requested = false;
};

inline void to_json(json& j, const ConversationState& s) {
    j = json{{"message_log", s.message_log},
             {"character", s.character},
             {"scenario", s.scenario},
             {"turn_count", s.turn_count},
             {"phase", conversation_phase_name(s.phase)},
             {"pending_question", s.pending_question},
             {"exit_requested", s.exit_requested}};
}

inline void from_json(const json& j, ConversationState& s) {
    s.message_log = j.at("message_log").get<MessageLog>();
    s.character = j.at("character").get<Character>();
    s.scenario = j.at("scenario").get<Scenario>();
    s.turn_count = j.value("turn_count", 0u);
    s.phase = parse_conversation_phase(j.value("phase", "introducing"));
    s.pending_question = j.value("pending_question", "");
    s.exit_requested = j.value("exit_requested", false);
}

inline std::string intro_cache_key(const Character& c, const Scenario& s) {
    return "intro:" + c.name() + "|" + s.victim_name;
}

// Case-insensitive containment of token in text
inline bool contains_exit_token(const std::string& text, const std::string& token) {
    if (token.empty()) return false;
    return to_lower(text).find(to_lower(token)) != std::string::npos;
}

class ConversationMachine {
public:
    ConversationMachine(TextCache& cache, ContextIndex& index,
                        Generator& generator, Presenter& presenter,
                        ConversationConfig config = {})
        : cache_(cache), index_(index), generator_(generator),
          presenter_(presenter), config_(std::move(config)) {}

    // Start a fresh visit. source_id names the character's ContextIndex entry.
    void begin(const Character& character, const Scenario& scenario,
               const std::string& source_id) {
        state_ = ConversationState{};
        state_.character = character;
        state_.scenario = scenario;
        source_id_ = source_id;
    }

    // Execute one phase. False once the visit has ended.
    bool step() {
        switch (state_.phase) {
            case ConversationPhase::Introducing:
                introduce();
                return true;
            case ConversationPhase::Asking:
                if (should_end()) {
                    state_.phase = ConversationPhase::Ended;
                    return false;
                }
                record_question(next_question());
                return true;
            case ConversationPhase::Answering:
                answer();
                return true;
            case ConversationPhase::Ended:
                return false;
        }
        return false;
    }

    const ConversationState& run() {
        while (step()) {}
        log_debug("conversation", "visit with %s ended after %u turns",
                  state_.character.name().c_str(), state_.turn_count);
        return state_;
    }

    const ConversationState& run(const Character& character, const Scenario& scenario,
                                 const std::string& source_id) {
        begin(character, scenario, source_id);
        return run();
    }

    // One turn with a supplied question: Asking, then Answering unless the
    // question ends the visit. Returns the answer, or nullopt when the visit
    // is over or the question is blank (blank changes nothing).
    std::optional<std::string> ask(const std::string& question) {
        while (state_.phase == ConversationPhase::Introducing) step();
        if (state_.phase == ConversationPhase::Answering) answer();
        if (state_.phase != ConversationPhase::Asking) return std::nullopt;
        if (should_end()) {
            state_.phase = ConversationPhase::Ended;
            return std::nullopt;
        }
        if (trim(question).empty()) return std::nullopt;

        record_question(question);
        if (state_.phase != ConversationPhase::Answering) return std::nullopt;
        answer();
        return state_.message_log.back().text;
    }

    bool ended() const { return state_.phase == ConversationPhase::Ended; }
    const ConversationState& state() const { return state_; }
    const ConversationConfig& config() const { return config_; }

private:
    void introduce() {
        const auto& c = state_.character;
        std::string text = cache_.get_or_compute(intro_cache_key(c, state_.scenario), [&] {
            log_debug("conversation", "generating introduction for %s", c.name().c_str());
            return generator_.generate_text(prompts::introduction(c, state_.scenario), {});
        });
        state_.message_log.push_back({Speaker::Character, text});
        state_.turn_count = 0;
        presenter_.show_introduction(c, text);
        state_.phase = ConversationPhase::Asking;
    }

    bool should_end() const {
        return state_.turn_count >= config_.max_turns || state_.exit_requested;
    }

    std::string next_question() {
        const auto& c = state_.character;
        if (presenter_.wants_assisted_question(c)) {
            std::string q = generator_.generate_text(
                prompts::question(c, state_.scenario, state_.message_log), {});
            presenter_.show_question(q);
            return q;
        }
        std::string q = presenter_.ask_question(c);
        while (trim(q).empty()) {
            presenter_.show_notice("Please ask a question, or type " + config_.exit_token +
                                   " to leave.");
            q = presenter_.ask_question(c);
        }
        return q;
    }

    void record_question(const std::string& question) {
        state_.turn_count++;
        state_.message_log.push_back({Speaker::Detective, question});
        if (contains_exit_token(question, config_.exit_token)) {
            state_.exit_requested = true;
            state_.pending_question.clear();
            state_.phase = ConversationPhase::Ended;
        } else {
            state_.pending_question = question;
            state_.phase = ConversationPhase::Answering;
        }
    }

    void answer() {
        const auto& c = state_.character;
        std::string background = index_.query(source_id_, state_.pending_question,
                                              config_.answer_context_units);
        if (background.empty()) background = c.backstory();

        std::string text = generator_.generate_text(
            prompts::answer(c, background, state_.scenario, state_.pending_question),
            state_.message_log);
        state_.message_log.push_back({Speaker::Character, text});
        state_.pending_question.clear();
        presenter_.show_answer(c, text);
        state_.phase = ConversationPhase::Asking;
    }

    TextCache& cache_;
    ContextIndex& index_;
    Generator& generator_;
    Presenter& presenter_;
    ConversationConfig config_;
    ConversationState state_;
    std::string source_id_;
};

} // namespace sleuth
