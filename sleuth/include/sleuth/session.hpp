#pragma once
// SessionMachine: one investigation from cast generation to verdict
//
//   Creating → Narrating → Selecting ⇄ Conversing
//                             ↓
//                          Accusing → Selecting | Won | Lost
//
// The machine owns the SessionState; nothing else mutates it. Each visit
// runs a ConversationMachine and folds its log and turn count back in,
// also when the visit dies on a GenerationError.
//
// Budgets: total_actions only grows, guesses_left only shrinks. Won and
// Lost are terminal and exclusive.

#include "cache_store.hpp"
#include "context_index.hpp"
#include "conversation.hpp"
#include "generator.hpp"
#include "log.hpp"
#include "presenter.hpp"
#include "types.hpp"
#include <algorithm>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace sleuth {

enum class SessionPhase : uint8_t {
    Creating,
    Narrating,
    Selecting,
    Conversing,
    Accusing,
    Won,
    Lost
};

inline const char* phase_name(SessionPhase p) {
    switch (p) {
        case SessionPhase::Creating: return "creating";
        case SessionPhase::Narrating: return "narrating";
        case SessionPhase::Selecting: return "selecting";
        case SessionPhase::Conversing: return "conversing";
        case SessionPhase::Accusing: return "accusing";
        case SessionPhase::Won: return "won";
        case SessionPhase::Lost: return "lost";
    }
    return "creating";
}

inline std::optional<SessionPhase> parse_phase(const std::string& s) {
    if (s == "creating") return SessionPhase::Creating;
    if (s == "narrating") return SessionPhase::Narrating;
    if (s == "selecting") return SessionPhase::Selecting;
    if (s == "conversing") return SessionPhase::Conversing;
    if (s == "accusing") return SessionPhase::Accusing;
    if (s == "won") return SessionPhase::Won;
    if (s == "lost") return SessionPhase::Lost;
    return std::nullopt;
}

inline bool is_terminal(SessionPhase p) {
    return p == SessionPhase::Won || p == SessionPhase::Lost;
}

// Fixed before Creating
struct SessionConfig {
    std::string environment;
    size_t roster_size = 5;
    uint32_t guess_budget = 3;
    std::optional<uint32_t> action_limit;   // nullopt = unlimited
    ConversationConfig conversation;
};

inline std::string narration_cache_key(const Scenario& s) {
    return "narration:" + s.victim_name + "|" + s.location_found + "|" + s.time_of_death;
}

// ContextIndex entry for one character of one session
inline std::string character_source_id(const std::string& session_id, size_t index) {
    return session_id + "/" + std::to_string(index);
}

// What the index holds for a character: identity lines plus backstory
inline std::string indexed_background(const Character& c) {
    return "Name: " + c.name() + "\nRole: " + role_name(c.role()) + "\n" + c.backstory();
}

// ═══════════════════════════════════════════════════════════════════
// SessionState
// ═══════════════════════════════════════════════════════════════════

class SessionState {
public:
    SessionState() = default;
    SessionState(std::string id, std::string environment, uint32_t guesses,
                 std::optional<uint32_t> action_limit)
        : id_(std::move(id)), environment_(std::move(environment)),
          action_limit_(action_limit), guesses_left_(guesses),
          created_at_(now()), updated_at_(created_at_) {}

    const std::string& id() const { return id_; }
    const std::string& environment() const { return environment_; }
    const Roster& roster() const { return roster_; }
    const Scenario& scenario() const { return scenario_; }
    const std::set<size_t>& visited() const { return visited_; }
    uint32_t total_actions() const { return total_actions_; }
    std::optional<uint32_t> action_limit() const { return action_limit_; }
    uint32_t guesses_left() const { return guesses_left_; }
    SessionPhase phase() const { return phase_; }
    std::optional<size_t> selected() const { return selected_; }
    const MessageLog& log() const { return log_; }
    Timestamp created_at() const { return created_at_; }
    Timestamp updated_at() const { return updated_at_; }

    bool terminal() const { return is_terminal(phase_); }

    bool actions_exhausted() const {
        return action_limit_ && total_actions_ >= *action_limit_;
    }

    std::optional<size_t> killer_index() const { return find_role(Role::Killer); }
    std::optional<size_t> victim_index() const { return find_role(Role::Victim); }

    // Everyone but the victim, sorted by name
    std::vector<Character> suspects() const {
        std::vector<Character> out;
        for (const auto& c : roster_) {
            if (!c.is_victim()) out.push_back(c);
        }
        std::sort(out.begin(), out.end(),
            [](const Character& a, const Character& b) { return a.name() < b.name(); });
        return out;
    }

    // Empty when index is a legal pick, otherwise the reason
    std::string selection_problem(size_t index) const {
        if (index >= roster_.size()) {
            return "There is no character number " + std::to_string(index + 1) + ".";
        }
        if (roster_[index].is_victim()) {
            return roster_[index].name() + " is the victim and cannot be questioned.";
        }
        return "";
    }

    // Suspect whose name matches (case and surrounding space ignored)
    std::optional<Character> find_suspect(const std::string& name) const {
        std::string wanted = to_lower(trim(name));
        if (wanted.empty()) return std::nullopt;
        for (const auto& c : roster_) {
            if (!c.is_victim() && to_lower(c.name()) == wanted) return c;
        }
        return std::nullopt;
    }

    Progress progress() const {
        Progress p;
        p.visited = visited_.size();
        p.interviewable = roster_.size() - (victim_index() ? 1 : 0);
        p.total_actions = total_actions_;
        p.action_limit = action_limit_;
        p.guesses_left = guesses_left_;
        return p;
    }

    // ── Mutation, reserved for SessionMachine ───────────────────────

    void set_cast(Roster roster, Scenario scenario) {
        roster_ = std::move(roster);
        scenario_ = std::move(scenario);
        touch();
    }

    // Idempotent. Refuses out-of-range and victim indices.
    bool mark_visited(size_t index) {
        if (!selection_problem(index).empty()) return false;
        visited_.insert(index);
        touch();
        return true;
    }

    void add_actions(uint32_t turns) {
        total_actions_ += turns;
        touch();
    }

    // Remaining guesses after spending one
    uint32_t spend_guess() {
        if (guesses_left_ > 0) guesses_left_--;
        touch();
        return guesses_left_;
    }

    void set_phase(SessionPhase phase) {
        phase_ = phase;
        touch();
    }

    void select(std::optional<size_t> index) { selected_ = index; }

    void append(const Message& message) { log_.push_back(message); }

    void append(const MessageLog& messages) {
        log_.insert(log_.end(), messages.begin(), messages.end());
    }

    void touch() { updated_at_ = std::max(updated_at_, now()); }

    friend void to_json(json& j, const SessionState& s);
    friend void from_json(const json& j, SessionState& s);

private:
    std::optional<size_t> find_role(Role role) const {
        for (size_t i = 0; i < roster_.size(); ++i) {
            if (roster_[i].role() == role) return i;
        }
        return std::nullopt;
    }

    std::string id_;
    std::string environment_;
    Roster roster_;
    Scenario scenario_;
    std::set<size_t> visited_;
    uint32_t total_actions_ = 0;
    std::optional<uint32_t> action_limit_;
    uint32_t guesses_left_ = 0;
    SessionPhase phase_ = SessionPhase::Creating;
    std::optional<size_t> selected_;
    MessageLog log_;
    Timestamp created_at_ = 0;
    Timestamp updated_at_ = 0;
};

inline void to_json(json& j, const SessionState& s) {
    j = json{{"id", s.id_},
             {"environment", s.environment_},
             {"roster", s.roster_},
             {"scenario", s.scenario_},
             {"visited", json::array()},
             {"total_actions", s.total_actions_},
             {"action_limit", nullptr},
             {"guesses_left", s.guesses_left_},
             {"phase", phase_name(s.phase_)},
             {"selected", nullptr},
             {"log", s.log_},
             {"created_at", s.created_at_},
             {"updated_at", s.updated_at_}};
    for (size_t v : s.visited_) j["visited"].push_back(v);
    if (s.action_limit_) j["action_limit"] = *s.action_limit_;
    if (s.selected_) j["selected"] = *s.selected_;
}

inline void from_json(const json& j, SessionState& s) {
    s.id_ = j.at("id").get<std::string>();
    s.environment_ = j.at("environment").get<std::string>();
    s.roster_ = j.at("roster").get<Roster>();
    s.scenario_ = j.contains("scenario") && j["scenario"].is_object()
        ? j["scenario"].get<Scenario>() : Scenario{};

    auto phase = parse_phase(j.at("phase").get<std::string>());
    if (!phase) {
        throw std::runtime_error("unknown session phase: " + j.at("phase").get<std::string>());
    }
    s.phase_ = *phase;
    if (s.phase_ != SessionPhase::Creating) {
        std::string problem = validate_roster(s.roster_);
        if (!problem.empty()) {
            throw std::runtime_error("stored roster invalid: " + problem);
        }
    }

    s.visited_.clear();
    for (const auto& v : j.at("visited")) {
        size_t index = v.get<size_t>();
        if (index < s.roster_.size() && !s.roster_[index].is_victim()) {
            s.visited_.insert(index);
        }
    }

    s.total_actions_ = j.value("total_actions", 0u);
    s.guesses_left_ = j.value("guesses_left", 0u);
    s.action_limit_ = j.contains("action_limit") && j["action_limit"].is_number()
        ? std::optional<uint32_t>(j["action_limit"].get<uint32_t>()) : std::nullopt;
    s.selected_ = j.contains("selected") && j["selected"].is_number()
        ? std::optional<size_t>(j["selected"].get<size_t>()) : std::nullopt;
    s.log_ = j.value("log", MessageLog{});
    s.created_at_ = j.value("created_at", Timestamp{0});
    s.updated_at_ = j.value("updated_at", s.created_at_);
}

// ═══════════════════════════════════════════════════════════════════
// SessionMachine
// ═══════════════════════════════════════════════════════════════════

class SessionMachine {
public:
    // Called after every step, and before a GenerationError leaves run()
    using Checkpoint = std::function<void(const SessionState&)>;

    SessionMachine(TextCache& cache, ContextIndex& index,
                   Generator& generator, Presenter& presenter,
                   SessionConfig config)
        : cache_(cache), index_(index), generator_(generator),
          presenter_(presenter), config_(std::move(config)),
          state_(generate_session_id(), config_.environment,
                 config_.guess_budget, config_.action_limit) {}

    // Continue a stored session from its recorded phase
    void resume(SessionState state) {
        state_ = std::move(state);
        config_.environment = state_.environment();
        config_.action_limit = state_.action_limit();
        index_roster();
        log_debug("session", "resumed %s in phase %s",
                  state_.id().c_str(), phase_name(state_.phase()));
    }

    // Execute one phase. False (and no effect) once the session is over.
    bool step() {
        switch (state_.phase()) {
            case SessionPhase::Creating:   create(); break;
            case SessionPhase::Narrating:  narrate(); break;
            case SessionPhase::Selecting:  select(); break;
            case SessionPhase::Conversing: converse(); break;
            case SessionPhase::Accusing:   accuse(); break;
            case SessionPhase::Won:
            case SessionPhase::Lost:
                return false;
        }
        return true;
    }

    const SessionState& run(const Checkpoint& checkpoint = nullptr) {
        while (!state_.terminal()) {
            try {
                step();
            } catch (const GenerationError&) {
                if (checkpoint) checkpoint(state_);
                throw;
            }
            if (checkpoint) checkpoint(state_);
        }
        return state_;
    }

    const SessionState& state() const { return state_; }
    const SessionConfig& config() const { return config_; }

    // Drop this session's entries from the shared index
    void release() {
        index_.remove_prefix(state_.id() + "/");
    }

private:
    void create() {
        presenter_.show_banner(config_.environment);
        Roster roster = generate_roster(generator_, config_.environment, config_.roster_size);
        Scenario scenario = generate_scenario(generator_, config_.environment, roster);
        state_.set_cast(std::move(roster), std::move(scenario));
        index_roster();
        log_debug("session", "%s: cast of %zu, victim %s", state_.id().c_str(),
                  state_.roster().size(), state_.scenario().victim_name.c_str());
        state_.set_phase(SessionPhase::Narrating);
    }

    void narrate() {
        const Scenario& s = state_.scenario();
        std::string text = cache_.get_or_compute(narration_cache_key(s), [&] {
            return generator_.generate_text(prompts::narration(s), {});
        });
        state_.append(Message{Speaker::Narrator, text});
        presenter_.show_narration(text);
        state_.set_phase(SessionPhase::Selecting);
    }

    void select() {
        if (state_.actions_exhausted()) {
            presenter_.show_notice("You have used all " +
                                   std::to_string(*state_.action_limit()) +
                                   " actions. Time to name the killer.");
            state_.set_phase(SessionPhase::Accusing);
            return;
        }

        presenter_.show_progress(state_.progress());
        auto pick = presenter_.select_character(state_.roster(), state_.visited());
        if (!pick) {
            state_.set_phase(SessionPhase::Accusing);
            return;
        }

        std::string problem = state_.selection_problem(*pick);
        if (!problem.empty()) {
            presenter_.show_notice(problem);
            return;
        }

        state_.select(*pick);
        state_.set_phase(SessionPhase::Conversing);
    }

    void converse() {
        if (!state_.selected() || !state_.selection_problem(*state_.selected()).empty()) {
            state_.select(std::nullopt);
            state_.set_phase(SessionPhase::Selecting);
            return;
        }

        size_t index = *state_.selected();
        ConversationMachine visit(cache_, index_, generator_, presenter_,
                                  visit_config());
        visit.begin(state_.roster()[index], state_.scenario(),
                    character_source_id(state_.id(), index));
        // Counted turns are folded however the visit ends
        try {
            visit.run();
        } catch (const GenerationError& e) {
            std::cerr << "[session] visit with " << state_.roster()[index].name()
                      << " failed: " << e.what() << "\n";
            fold(index, visit.state());
            throw;
        } catch (const std::exception&) {
            fold(index, visit.state());
            throw;
        }
        fold(index, visit.state());
    }

    // A visit never runs past the remaining action budget
    ConversationConfig visit_config() const {
        ConversationConfig config = config_.conversation;
        if (state_.action_limit()) {
            uint32_t limit = *state_.action_limit();
            uint32_t remaining = state_.total_actions() < limit
                ? limit - state_.total_actions() : 0;
            config.max_turns = std::min(config.max_turns, remaining);
        }
        return config;
    }

    void fold(size_t index, const ConversationState& visit) {
        state_.mark_visited(index);
        state_.add_actions(visit.turn_count);
        state_.append(visit.message_log);
        state_.select(std::nullopt);
        state_.set_phase(SessionPhase::Selecting);
    }

    void accuse() {
        auto suspects = state_.suspects();
        std::string name = presenter_.accuse(suspects);
        auto accused = state_.find_suspect(name);
        if (!accused) {
            presenter_.show_notice("\"" + name + "\" is not one of the suspects.");
            return;
        }

        auto killer = state_.killer_index();
        const Character& culprit = state_.roster()[*killer];
        if (accused->is_killer()) {
            state_.set_phase(SessionPhase::Won);
            presenter_.show_verdict(Verdict::Won, culprit);
            return;
        }

        uint32_t left = state_.spend_guess();
        if (left == 0) {
            state_.set_phase(SessionPhase::Lost);
            presenter_.show_verdict(Verdict::Lost, culprit);
            return;
        }
        presenter_.show_notice(accused->name() + " is not the killer. " +
                               std::to_string(left) +
                               (left == 1 ? " guess" : " guesses") + " left.");
        state_.set_phase(SessionPhase::Selecting);
    }

    void index_roster() {
        index_.remove_prefix(state_.id() + "/");
        const auto& roster = state_.roster();
        for (size_t i = 0; i < roster.size(); ++i) {
            index_.add_source(character_source_id(state_.id(), i), indexed_background(roster[i]));
        }
    }

    TextCache& cache_;
    ContextIndex& index_;
    Generator& generator_;
    Presenter& presenter_;
    SessionConfig config_;
    SessionState state_;
};

} // namespace sleuth
