#undef NDEBUG
#include <sleuth/sleuth.hpp>
#include <sleuth/console_presenter.hpp>
#include <sleuth/rpc_generator.hpp>
#include <iostream>
#include <sstream>
#include <cassert>
#include <cstdio>
#include <cstring>
#include <deque>
#include <thread>
#include <atomic>
#include <chrono>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace sleuth;

// ═══════════════════════════════════════════════════════════════════
// Scripted collaborators
// ═══════════════════════════════════════════════════════════════════

class ScriptedGenerator : public Generator {
public:
    std::deque<json> structured;
    std::vector<std::string> text_prompts;
    std::vector<std::string> structured_prompts;
    size_t fail_on_text_call = 0;      // 1-based, 0 = never

    json generate_structured(const std::string& prompt, const json& schema) override {
        assert(schema.is_object());
        structured_prompts.push_back(prompt);
        if (structured.empty()) throw GenerationError("no structured output scripted");
        json out = structured.front();
        structured.pop_front();
        return out;
    }

    std::string generate_text(const std::string& prompt, const MessageLog&) override {
        text_prompts.push_back(prompt);
        if (fail_on_text_call == text_prompts.size()) {
            throw GenerationError("backend went away");
        }
        return "generated " + std::to_string(text_prompts.size());
    }

    std::string name() const override { return "scripted"; }
};

class ScriptedPresenter : public Presenter {
public:
    std::deque<std::optional<size_t>> selections;
    std::deque<bool> assisted;
    std::deque<std::string> questions;
    std::deque<std::string> accusations;
    bool close_input_when_out = false;   // EOF instead of EXIT once questions run out

    std::vector<std::string> notices;
    std::vector<Verdict> verdicts;
    std::vector<std::string> introductions;
    std::vector<std::string> answers;
    size_t select_calls = 0;
    size_t accuse_calls = 0;
    size_t banners = 0;
    std::vector<std::string> last_suspects;

    void show_banner(const std::string&) override { banners++; }
    void show_narration(const std::string&) override {}
    void show_introduction(const Character&, const std::string& text) override {
        introductions.push_back(text);
    }
    void show_question(const std::string&) override {}
    void show_answer(const Character&, const std::string& text) override {
        answers.push_back(text);
    }
    void show_progress(const Progress&) override {}
    void show_notice(const std::string& text) override { notices.push_back(text); }
    void show_verdict(Verdict verdict, const Character&) override { verdicts.push_back(verdict); }

    std::optional<size_t> select_character(const Roster&, const std::set<size_t>&) override {
        select_calls++;
        if (selections.empty()) throw std::runtime_error("script exhausted: selection");
        auto pick = selections.front();
        selections.pop_front();
        return pick;
    }

    bool wants_assisted_question(const Character&) override {
        if (assisted.empty()) return false;
        bool a = assisted.front();
        assisted.pop_front();
        return a;
    }

    std::string ask_question(const Character&) override {
        if (questions.empty()) {
            if (close_input_when_out) throw InputClosed();
            return "EXIT";
        }
        std::string q = questions.front();
        questions.pop_front();
        return q;
    }

    std::string accuse(const std::vector<Character>& suspects) override {
        accuse_calls++;
        last_suspects.clear();
        for (const auto& s : suspects) last_suspects.push_back(s.name());
        if (accusations.empty()) throw std::runtime_error("script exhausted: accusation");
        std::string name = accusations.front();
        accusations.pop_front();
        return name;
    }
};

// A small harbor town: Ben (suspect), Ada (killer), Silas (victim), Cora (suspect)
json harbor_roster_json() {
    return {{"characters", json::array({
        {{"role", "Suspect"}, {"name", "Ben Hook"},
         {"backstory", "Ben runs the ferry. He owed the victim money and argued with him at the pier."}},
        {{"role", "killer"}, {"name", "Ada Marsh"},
         {"backstory", "Ada repaired fishing boats at the harbor every morning. She kept ledgers of debts owed by the tavern keeper. Her brother vanished during the winter storm last year."}},
        {{"role", "Victim"}, {"name", "Silas Crane"},
         {"backstory", "Silas was the harbor master, feared and disliked."}},
        {{"role", "Suspect"}, {"name", "Cora Pike"},
         {"backstory", "Cora keeps the lighthouse and saw lights on the water that night."}}
    })}};
}

json harbor_scenario_json() {
    return {{"victim_name", "Silas Crane"},
            {"time_of_death", "around midnight"},
            {"location_found", "the end of the north pier"},
            {"murder_weapon", "a boat hook"},
            {"cause_of_death", "blunt force"},
            {"crime_scene_details", "wet footprints, a torn ledger page"},
            {"witnesses", "Cora saw a lantern"},
            {"initial_clues", "tar on the victim's sleeve"},
            {"relationship_brief", "Everyone owed Silas something."}};
}

SessionConfig harbor_config(uint32_t guesses = 3) {
    SessionConfig config;
    config.environment = "a small harbor town";
    config.roster_size = 4;
    config.guess_budget = guesses;
    return config;
}

struct Rig {
    TextCache cache;
    ContextIndex index;
    ScriptedGenerator generator;
    ScriptedPresenter presenter;

    Rig() : index(ContextConfig{}) {
        generator.structured.push_back(harbor_roster_json());
        generator.structured.push_back(harbor_scenario_json());
    }
};

// ═══════════════════════════════════════════════════════════════════
// CacheStore
// ═══════════════════════════════════════════════════════════════════

void test_cache_determinism() {
    std::cout << "Testing CacheStore determinism..." << std::endl;

    TextCache cache;
    int computed = 0;
    auto fn = [&] { computed++; return std::string("hello"); };

    std::string a = cache.get_or_compute("k", fn);
    std::string b = cache.get_or_compute("k", fn);
    assert(a == "hello" && b == "hello");
    assert(computed == 1);

    auto stats = cache.stats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(stats.total_requests() == 2);
    assert(stats.hit_rate() > 49.9 && stats.hit_rate() < 50.1);

    std::cout << "  PASS" << std::endl;
}

void test_cache_ttl_expiry() {
    std::cout << "Testing CacheStore TTL expiry..." << std::endl;

    TextCache cache;
    cache.set("gone", "soon", Ttl(0));
    cache.set("kept", "later");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    assert(!cache.contains("gone"));
    assert(!cache.get("gone").has_value());
    assert(cache.stats().misses == 1);
    assert(cache.get("kept") == std::optional<std::string>("later"));

    cache.set("a", "1", Ttl(0));
    cache.set("b", "2", Ttl(0));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    assert(cache.cleanup_expired() == 2);
    assert(cache.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_cache_capacity() {
    std::cout << "Testing CacheStore capacity..." << std::endl;

    CacheConfig config;
    config.max_size = 3;
    TextCache cache(config);

    for (int i = 0; i <= 3; ++i) {
        cache.set("key" + std::to_string(i), "v");
    }
    assert(cache.size() == 3);
    assert(!cache.get("key0").has_value());
    assert(cache.get("key3").has_value());

    // Access moves to the newest end: key1 survives, key2 goes
    TextCache lru(config);
    lru.set("a", "1");
    lru.set("b", "2");
    lru.set("c", "3");
    assert(lru.get("a").has_value());
    lru.set("d", "4");
    assert(lru.contains("a"));
    assert(!lru.contains("b"));

    // Replacing never evicts
    lru.set("a", "updated");
    assert(lru.size() == 3);
    assert(lru.get("a") == std::optional<std::string>("updated"));

    std::cout << "  PASS" << std::endl;
}

void test_cache_invalidation() {
    std::cout << "Testing CacheStore invalidation..." << std::endl;

    TextCache cache;
    cache.set("intro:Ada|Silas", "hi");
    cache.set("intro:Ben|Silas", "hey");
    cache.set("narration:Silas|pier|midnight", "dark");

    assert(cache.invalidate("intro:Ben|Silas"));
    assert(!cache.invalidate("intro:Ben|Silas"));
    assert(cache.invalidate_matching("Silas") == 2);
    assert(cache.size() == 0);

    cache.set("x", "y");
    cache.get("x");
    cache.clear();
    assert(cache.size() == 0);
    assert(cache.stats().hits == 0 && cache.stats().misses == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// ContextIndex
// ═══════════════════════════════════════════════════════════════════

std::string long_backstory() {
    std::string text;
    for (int i = 0; i < 40; ++i) {
        text += "Sentence number " + std::to_string(i) +
                " describes another quiet evening at the harbor. ";
    }
    return text;
}

void test_chunk_coverage() {
    std::cout << "Testing chunk coverage..." << std::endl;

    std::string text = long_backstory();
    auto chunks = chunk_text(text, "s/0", 500, 50);
    assert(chunks.size() > 3);

    std::vector<bool> covered(text.size(), false);
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = chunks[i];
        assert(c.sequence_index == i);
        assert(c.source_id == "s/0");
        assert(c.content == text.substr(c.start_offset, c.end_offset - c.start_offset));
        assert(c.content.size() <= 500);
        for (size_t p = c.start_offset; p < c.end_offset; ++p) covered[p] = true;
        if (i > 0) {
            assert(c.start_offset > chunks[i - 1].start_offset);
            assert(c.start_offset < chunks[i - 1].end_offset);   // overlap
        }
    }
    for (bool b : covered) assert(b);

    // Sentence break keeps the period
    assert(chunks[0].content.back() == '.');

    // Deterministic ids
    auto again = chunk_text(text, "s/0", 500, 50);
    assert(again[1].id == chunks[1].id);
    assert(chunk_text(text, "s/1", 500, 50)[1].id != chunks[1].id);

    // No spaces at all: raw edges
    std::string solid(1200, 'x');
    auto raw = chunk_text(solid, "raw", 500, 50);
    assert(raw.size() == 3);
    assert(raw[0].end_offset == 500);
    assert(raw[1].start_offset == 450);
    assert(raw.back().end_offset == solid.size());

    // Whitespace only produces nothing
    assert(chunk_text("     \n  ", "blank", 500, 50).empty());

    std::cout << "  PASS" << std::endl;
}

void test_context_fallback() {
    std::cout << "Testing ContextIndex sequence fallback..." << std::endl;

    ContextIndex index(ContextConfig{});
    assert(!index.has_embedder());

    std::string text = long_backstory();
    size_t n = index.add_source("sess/1", text);
    assert(n > 3);
    assert(index.has_source("sess/1"));

    auto chunks = index.chunks("sess/1");
    std::string expected = chunks[0].content + "\n\n" + chunks[1].content + "\n\n" +
                           chunks[2].content;
    assert(index.query("sess/1", "anything at all", 1000) == expected);

    // Bounded: 10 units of 4 chars plus marker
    std::string clipped = index.query("sess/1", "anything", 10);
    assert(clipped.size() == 43);
    assert(clipped.substr(40) == "...");

    assert(index.query("nobody", "anything").empty());

    // Re-adding replaces wholesale
    index.add_source("sess/1", "Short now.");
    assert(index.chunks("sess/1").size() == 1);
    assert(index.full_text("sess/1") == "Short now.");

    index.add_source("sess/2", "Other.");
    index.add_source("other/1", "Elsewhere.");
    assert(index.remove_prefix("sess/") == 2);
    assert(index.stats().sources == 1);
    assert(index.remove_source("other/1"));
    assert(!index.remove_source("other/1"));

    std::cout << "  PASS" << std::endl;
}

void test_context_similarity() {
    std::cout << "Testing ContextIndex similarity ranking..." << std::endl;

    ContextConfig config;
    config.chunk_size = 60;
    config.chunk_overlap = 10;
    config.max_chunks_per_query = 1;
    ContextIndex index(config, std::make_shared<HashingEmbedder>());
    assert(index.has_embedder());

    std::string backstory =
        "Ada repaired fishing boats at the harbor every morning. "
        "She kept ledgers of debts owed by the tavern keeper. "
        "Her brother vanished during the winter storm last year.";
    index.add_source("s/ada", backstory);

    std::string slice = index.query("s/ada", "Whose ledgers recorded tavern debts?", 300);
    assert(slice.find("ledgers") != std::string::npos);
    assert(slice.find("fishing") == std::string::npos);

    std::string storm = index.query("s/ada", "Tell me about the winter storm and your brother", 300);
    assert(storm.find("brother") != std::string::npos);

    // Nothing embeddable in the query: first chunk in sequence order
    std::string fallback = index.query("s/ada", "?? !!", 300);
    assert(fallback == index.chunks("s/ada")[0].content);

    auto stats = index.stats();
    assert(stats.similarity_enabled);
    assert(stats.backend == "lexical");

    // Attaching later only affects sources added afterwards
    ContextIndex late(config);
    late.add_source("s/before", backstory);
    late.attach_embedder(std::make_shared<HashingEmbedder>());
    assert(late.has_embedder());
    late.add_source("s/after", backstory);
    assert(late.query("s/before", "Whose ledgers recorded tavern debts?", 300) ==
           late.chunks("s/before")[0].content);
    assert(late.query("s/after", "Whose ledgers recorded tavern debts?", 300).find("ledgers") !=
           std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_embedders() {
    std::cout << "Testing embedders..." << std::endl;

    auto lexical = std::make_shared<HashingEmbedder>(256);
    Embedding a = lexical->embed("The ferry crossed the harbor at dawn");
    Embedding b = lexical->embed("At dawn the ferry crossed the harbor");
    Embedding c = lexical->embed("Lighthouse keeper polished brass lamps");
    assert(a.certainty == 1.0f);
    assert(a.vector.size() == 256);
    assert(a.vector.cosine(b.vector) > 0.99f);
    assert(a.vector.cosine(c.vector) < 0.5f);
    assert(lexical->embed("a an of").certainty == 0.0f);

    CachedEmbedder cached(lexical, 2);
    cached.embed("one text here");
    cached.embed("one text here");
    assert(cached.cache().size() == 1);
    cached.embed_batch({"second text", "third text"});
    assert(cached.cache().size() == 2);
    assert(cached.name() == "cached:lexical");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Generator helpers and JSON
// ═══════════════════════════════════════════════════════════════════

void test_roster_parsing() {
    std::cout << "Testing roster parsing..." << std::endl;

    Roster roster = parse_roster(harbor_roster_json());
    assert(roster.size() == 4);
    assert(count_role(roster, Role::Killer) == 1);
    assert(count_role(roster, Role::Victim) == 1);
    assert(count_role(roster, Role::Suspect) == 2);
    assert(roster[1].is_killer());
    assert(parse_role("MURDERER") == Role::Killer);
    assert(parse_role("Butler") == Role::Suspect);
    assert(roster[0].persona() ==
           "Name: Ben Hook\nRole: Suspect\nBackstory: " + roster[0].backstory() + "\n");

    json two_killers = harbor_roster_json();
    two_killers["characters"][0]["role"] = "Killer";
    bool threw = false;
    try {
        parse_roster(two_killers);
    } catch (const GenerationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        parse_roster(json{{"characters", json::array({{{"name", "No role"}}})}});
    } catch (const GenerationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        parse_scenario(json{{"victim_name", "Silas"}});
    } catch (const GenerationError&) {
        threw = true;
    }
    assert(threw);

    Scenario s = parse_scenario(harbor_scenario_json());
    assert(s.victim_name == "Silas Crane");
    assert(json(s).get<Scenario>() == s);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// ConversationMachine
// ═══════════════════════════════════════════════════════════════════

Character ada() {
    return Character(Role::Killer, "Ada Marsh",
        "Ada repaired fishing boats at the harbor every morning. "
        "She kept ledgers of debts owed by the tavern keeper.");
}

Scenario harbor_scenario() {
    return harbor_scenario_json().get<Scenario>();
}

void test_conversation_exit_token() {
    std::cout << "Testing conversation exit token..." << std::endl;

    TextCache cache;
    ContextIndex index(ContextConfig{});
    ScriptedGenerator gen;
    ScriptedPresenter presenter;
    presenter.questions = {"Where were you at midnight?", "Thank you, I will exit now"};

    ConversationMachine visit(cache, index, gen, presenter);
    const auto& state = visit.run(ada(), harbor_scenario(), "x/1");

    assert(state.phase == ConversationPhase::Ended);
    assert(state.turn_count == 2);
    assert(state.message_log.size() == 4);
    assert(state.message_log[0].speaker == Speaker::Character);
    assert(state.message_log[1].speaker == Speaker::Detective);
    assert(state.message_log[2].speaker == Speaker::Character);
    assert(state.message_log[3].text == "Thank you, I will exit now");
    assert(gen.text_prompts.size() == 2);     // introduction + one answer
    assert(presenter.answers.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_conversation_turn_cap() {
    std::cout << "Testing conversation turn cap..." << std::endl;

    TextCache cache;
    ContextIndex index(ContextConfig{});
    ScriptedGenerator gen;
    ScriptedPresenter presenter;
    presenter.questions = {"one?", "two?", "three?"};

    ConversationConfig config;
    config.max_turns = 2;
    ConversationMachine visit(cache, index, gen, presenter, config);
    const auto& state = visit.run(ada(), harbor_scenario(), "x/1");

    assert(state.turn_count == 2);
    assert(state.message_log.size() == 5);
    assert(presenter.questions.size() == 1);   // third never asked

    std::cout << "  PASS" << std::endl;
}

void test_conversation_blank_and_assisted() {
    std::cout << "Testing conversation blank input and assisted questions..." << std::endl;

    TextCache cache;
    ContextIndex index(ContextConfig{});
    ScriptedGenerator gen;
    ScriptedPresenter presenter;
    presenter.assisted = {true, false};
    presenter.questions = {"", "   ", "EXIT"};

    ConversationMachine visit(cache, index, gen, presenter);
    const auto& state = visit.run(ada(), harbor_scenario(), "x/1");

    // Assisted question and the exit both count; blanks do not
    assert(state.turn_count == 2);
    assert(presenter.notices.size() == 2);
    // intro, generated question, answer, exit
    assert(gen.text_prompts.size() == 3);
    assert(state.message_log[1].speaker == Speaker::Detective);
    assert(state.message_log[1].text == "generated 2");

    std::cout << "  PASS" << std::endl;
}

void test_conversation_intro_cache() {
    std::cout << "Testing conversation introduction cache..." << std::endl;

    TextCache cache;
    ContextIndex index(ContextConfig{});
    ScriptedGenerator gen;
    ScriptedPresenter presenter;

    ConversationMachine first(cache, index, gen, presenter);
    first.run(ada(), harbor_scenario(), "x/1");
    ConversationMachine second(cache, index, gen, presenter);
    second.run(ada(), harbor_scenario(), "x/1");

    assert(gen.text_prompts.size() == 1);
    assert(presenter.introductions.size() == 2);
    assert(presenter.introductions[0] == presenter.introductions[1]);
    assert(cache.contains(intro_cache_key(ada(), harbor_scenario())));

    std::cout << "  PASS" << std::endl;
}

void test_conversation_answer_context() {
    std::cout << "Testing conversation answer context..." << std::endl;

    TextCache cache;
    ContextIndex index(ContextConfig{});
    index.add_source("x/1", "Indexed slice about the ledgers.");
    ScriptedGenerator gen;
    ScriptedPresenter presenter;

    ConversationMachine visit(cache, index, gen, presenter);
    visit.begin(ada(), harbor_scenario(), "x/1");
    auto answer = visit.ask("What do your ledgers say?");
    assert(answer.has_value());
    assert(gen.text_prompts.back().find("Relevant background: Indexed slice about the ledgers.")
           != std::string::npos);
    assert(gen.text_prompts.back().find("Question: What do your ledgers say?") != std::string::npos);

    // Blank question changes nothing
    uint32_t turns = visit.state().turn_count;
    assert(!visit.ask("  ").has_value());
    assert(visit.state().turn_count == turns);

    // Unknown source: whole backstory
    ConversationMachine other(cache, index, gen, presenter);
    other.begin(ada(), harbor_scenario(), "missing/9");
    other.ask("Anything?");
    assert(gen.text_prompts.back().find("Relevant background: " + ada().backstory())
           != std::string::npos);

    assert(!other.ask("exit").has_value());
    assert(other.ended());
    assert(other.state().turn_count == 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Shared stores under concurrent use
// ═══════════════════════════════════════════════════════════════════

void test_cache_concurrency() {
    std::cout << "Testing CacheStore under concurrent access..." << std::endl;

    CacheConfig config;
    config.max_size = 8;
    TextCache cache(config);

    std::atomic<bool> bad_value{false};
    std::vector<std::thread> workers;
    for (int t = 0; t < 6; ++t) {
        workers.emplace_back([&cache, &bad_value, t] {
            for (int i = 0; i < 2000; ++i) {
                std::string key = "k" + std::to_string((i * 7 + t) % 24);
                switch (i % 3) {
                    case 0:
                        cache.set(key, "v:" + key);
                        break;
                    case 1: {
                        auto v = cache.get(key);
                        if (v && *v != "v:" + key) bad_value = true;
                        break;
                    }
                    default: {
                        std::string v = cache.get_or_compute(key, [&] { return "v:" + key; });
                        if (v != "v:" + key) bad_value = true;
                        break;
                    }
                }
                if (cache.size() > 8) bad_value = true;
            }
        });
    }
    for (auto& w : workers) w.join();

    assert(!bad_value);
    assert(cache.size() <= 8);
    auto stats = cache.stats();
    assert(stats.size == cache.size());
    assert(stats.total_requests() > 0);

    // Ordering survived: filling with fresh keys evicts every old one
    for (int i = 0; i < 8; ++i) cache.set("fresh" + std::to_string(i), "x");
    assert(cache.size() == 8);
    for (int i = 0; i < 24; ++i) assert(!cache.contains("k" + std::to_string(i)));

    std::cout << "  PASS" << std::endl;
}

void test_context_concurrency() {
    std::cout << "Testing ContextIndex replace during queries..." << std::endl;

    ContextConfig config;
    config.chunk_size = 80;
    config.chunk_overlap = 10;
    ContextIndex index(config);

    std::string alpha, bravo;
    for (int i = 0; i < 40; ++i) {
        alpha += "alpha tide. ";
        bravo += "bravo wind. ";
    }
    index.add_source("s/0", alpha);

    std::atomic<bool> done{false};
    std::atomic<bool> mixed{false};
    std::atomic<size_t> answered{0};

    std::thread writer([&] {
        for (int i = 0; i < 300; ++i) {
            index.add_source("s/0", i % 2 ? bravo : alpha);
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 3; ++t) {
        readers.emplace_back([&] {
            while (!done) {
                std::string slice = index.query("s/0", "what happened", 1000);
                bool a = slice.find("alpha") != std::string::npos;
                bool b = slice.find("bravo") != std::string::npos;
                if (a == b) mixed = true;   // both versions, or nothing
                answered++;
            }
        });
    }
    writer.join();
    for (auto& r : readers) r.join();

    assert(!mixed);
    assert(index.stats().sources == 1);
    assert(index.full_text("s/0").find("bravo") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// SessionMachine
// ═══════════════════════════════════════════════════════════════════

void test_session_harbor_win() {
    std::cout << "Testing harbor town: correct accusation..." << std::endl;

    Rig rig;
    rig.presenter.selections = {std::nullopt};
    rig.presenter.accusations = {"Ada Marsh"};

    SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, harbor_config());
    const auto& state = machine.run();

    assert(state.phase() == SessionPhase::Won);
    assert(state.guesses_left() == 3);
    assert(state.roster().size() == 4);
    assert(count_role(state.roster(), Role::Killer) == 1);
    assert(count_role(state.roster(), Role::Victim) == 1);
    assert(count_role(state.roster(), Role::Suspect) == 2);
    assert(rig.presenter.verdicts.size() == 1 && rig.presenter.verdicts[0] == Verdict::Won);
    assert(rig.presenter.banners == 1);

    // Suspects exclude the victim, sorted by name
    std::vector<std::string> expected = {"Ada Marsh", "Ben Hook", "Cora Pike"};
    assert(rig.presenter.last_suspects == expected);

    // Narration landed in the log
    assert(state.log().size() == 1);
    assert(state.log()[0].speaker == Speaker::Narrator);

    // Every character indexed under the session
    assert(rig.index.has_source(character_source_id(state.id(), 3)));

    // Terminal: step is a no-op
    assert(!machine.step());
    assert(machine.state().phase() == SessionPhase::Won);

    std::cout << "  PASS" << std::endl;
}

void test_session_harbor_lose() {
    std::cout << "Testing harbor town: three wrong accusations..." << std::endl;

    Rig rig;
    rig.presenter.selections = {std::nullopt, std::nullopt, std::nullopt};
    rig.presenter.accusations = {"Ben Hook", "cora pike", "Ben Hook"};

    std::vector<uint32_t> guesses;
    SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, harbor_config());
    const auto& state = machine.run([&](const SessionState& s) { guesses.push_back(s.guesses_left()); });

    assert(state.phase() == SessionPhase::Lost);
    assert(state.guesses_left() == 0);
    assert(rig.presenter.verdicts.size() == 1 && rig.presenter.verdicts[0] == Verdict::Lost);
    assert(rig.presenter.accuse_calls == 3);
    for (size_t i = 1; i < guesses.size(); ++i) assert(guesses[i] <= guesses[i - 1]);

    std::cout << "  PASS" << std::endl;
}

void test_session_visits_and_budget() {
    std::cout << "Testing session visits and action budget..." << std::endl;

    Rig rig;
    // Visit Ben twice, Cora once, then accuse
    rig.presenter.selections = {0, 0, 3, std::nullopt};
    rig.presenter.questions = {"q1", "q2", "EXIT",      // Ben: 3 turns
                               "EXIT",                   // Ben again: 1 turn
                               "q3", "EXIT"};            // Cora: 2 turns
    rig.presenter.accusations = {"Ada Marsh"};

    std::vector<uint32_t> actions;
    SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, harbor_config());
    const auto& state = machine.run([&](const SessionState& s) { actions.push_back(s.total_actions()); });

    assert(state.phase() == SessionPhase::Won);
    assert(state.visited() == std::set<size_t>({0, 3}));
    assert(state.total_actions() == 6);
    for (size_t i = 1; i < actions.size(); ++i) assert(actions[i] >= actions[i - 1]);

    // narration + (intro, q1, a1, q2, a2, exit) + (intro, exit) + (intro, q3, a3, exit)
    assert(state.log().size() == 1 + 6 + 2 + 4);

    std::cout << "  PASS" << std::endl;
}

void test_session_invalid_input() {
    std::cout << "Testing session invalid selection and accusation..." << std::endl;

    Rig rig;
    rig.presenter.selections = {2, 17, std::nullopt};   // victim, out of range, accuse
    rig.presenter.accusations = {"Silas Crane", "Nobody", "Ada Marsh"};

    SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, harbor_config());
    const auto& state = machine.run();

    assert(state.phase() == SessionPhase::Won);
    assert(state.visited().empty());
    assert(state.total_actions() == 0);
    assert(state.guesses_left() == 3);               // invalid accusations cost nothing
    assert(rig.presenter.notices.size() == 4);
    assert(rig.presenter.select_calls == 3);

    std::cout << "  PASS" << std::endl;
}

void test_session_action_limit() {
    std::cout << "Testing session action limit..." << std::endl;

    Rig rig;
    SessionConfig config = harbor_config();
    config.action_limit = 2;
    rig.presenter.selections = {0};
    rig.presenter.questions = {"q1", "EXIT"};
    rig.presenter.accusations = {"Ben Hook", "Ada Marsh"};

    SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, config);
    const auto& state = machine.run();

    assert(state.phase() == SessionPhase::Won);
    assert(state.total_actions() == 2);
    assert(state.guesses_left() == 2);
    // Only the first selection prompt; afterwards the limit forces accusing
    assert(rig.presenter.select_calls == 1);

    std::cout << "  PASS" << std::endl;
}

void test_session_budget_caps_visit() {
    std::cout << "Testing action budget cuts a visit short..." << std::endl;

    // A single visit stops at the limit even with more questions queued
    {
        Rig rig;
        SessionConfig config = harbor_config();
        config.action_limit = 2;
        rig.presenter.selections = {0};
        rig.presenter.questions = {"q1", "q2", "q3", "q4", "q5", "q6"};
        rig.presenter.accusations = {"Ada Marsh"};

        SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, config);
        const auto& state = machine.run();

        assert(state.phase() == SessionPhase::Won);
        assert(state.total_actions() == 2);
        assert(rig.presenter.questions.size() == 4);
        assert(rig.presenter.select_calls == 1);
        // narration + intro, q1, a1, q2, a2
        assert(state.log().size() == 6);
    }

    // The second visit only gets what the first left over
    {
        Rig rig;
        SessionConfig config = harbor_config();
        config.action_limit = 5;
        rig.presenter.selections = {0, 3};
        rig.presenter.questions = {"q1", "q2", "EXIT", "q3", "q4", "q5", "q6"};
        rig.presenter.accusations = {"Ada Marsh"};

        SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, config);
        const auto& state = machine.run();

        assert(state.phase() == SessionPhase::Won);
        assert(state.total_actions() == 5);
        assert(state.visited() == std::set<size_t>({0, 3}));
        assert(rig.presenter.questions.size() == 2);
        assert(rig.presenter.select_calls == 2);
    }

    std::cout << "  PASS" << std::endl;
}

void test_session_input_closed_mid_visit() {
    std::cout << "Testing closed input during a visit keeps counted turns..." << std::endl;

    Rig rig;
    SessionConfig config = harbor_config();
    config.action_limit = 10;
    rig.presenter.selections = {0};
    rig.presenter.questions = {"q1", "q2", "q3"};
    rig.presenter.close_input_when_out = true;

    SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, config);
    bool closed = false;
    try {
        machine.run();
    } catch (const InputClosed&) {
        closed = true;
    }
    assert(closed);

    const auto& state = machine.state();
    assert(state.phase() == SessionPhase::Selecting);
    assert(state.total_actions() == 3);
    assert(state.visited() == std::set<size_t>({0}));
    assert(!state.selected().has_value());
    // narration + intro + three question/answer pairs
    assert(state.log().size() == 1 + 1 + 6);

    // The snapshot a front end would save carries the spent budget
    json snapshot = state;
    SessionState restored = snapshot.get<SessionState>();
    assert(restored.phase() == SessionPhase::Selecting);
    assert(restored.total_actions() == 3);
    assert(restored.visited() == std::set<size_t>({0}));

    std::cout << "  PASS" << std::endl;
}

void test_session_generation_failure() {
    std::cout << "Testing session generation failures..." << std::endl;

    // Invalid roster: fails in Creating, nothing mutated
    {
        TextCache cache;
        ContextIndex index(ContextConfig{});
        ScriptedGenerator gen;
        ScriptedPresenter presenter;
        json bad = harbor_roster_json();
        bad["characters"][2]["role"] = "Suspect";   // no victim
        gen.structured.push_back(bad);

        SessionMachine machine(cache, index, gen, presenter, harbor_config());
        bool threw = false;
        try {
            machine.step();
        } catch (const GenerationError&) {
            threw = true;
        }
        assert(threw);
        assert(machine.state().phase() == SessionPhase::Creating);
        assert(machine.state().roster().empty());
    }

    // Failure mid-visit: turns so far are still folded
    {
        Rig rig;
        rig.presenter.selections = {3};
        rig.presenter.questions = {"q1", "q2"};
        rig.generator.fail_on_text_call = 4;   // narration, intro, answer 1, answer 2

        size_t checkpoints = 0;
        SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, harbor_config());
        bool threw = false;
        try {
            machine.run([&](const SessionState&) { checkpoints++; });
        } catch (const GenerationError&) {
            threw = true;
        }
        assert(threw);
        const auto& state = machine.state();
        assert(state.visited() == std::set<size_t>({3}));
        assert(state.total_actions() == 2);
        assert(state.phase() == SessionPhase::Selecting);
        assert(checkpoints == 4);   // creating, narrating, selecting, failed visit
    }

    std::cout << "  PASS" << std::endl;
}

void test_session_json_and_resume() {
    std::cout << "Testing session JSON round-trip and resume..." << std::endl;

    Rig rig;
    rig.presenter.selections = {3, 0};
    rig.presenter.questions = {"q1", "EXIT", "EXIT"};

    SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, harbor_config());
    // Creating, Narrating, Selecting, Conversing, Selecting, Conversing
    for (int i = 0; i < 6; ++i) machine.step();
    assert(machine.state().phase() == SessionPhase::Selecting);

    json snapshot = machine.state();
    assert(snapshot["visited"] == json::array({0, 3}));
    assert(snapshot["action_limit"].is_null());

    SessionState restored = snapshot.get<SessionState>();
    assert(restored.id() == machine.state().id());
    assert(restored.visited() == machine.state().visited());
    assert(restored.log() == machine.state().log());
    assert(restored.total_actions() == 3);
    assert(restored.roster() == machine.state().roster());
    assert(json(restored) == snapshot);

    // A fresh machine continues where the snapshot stopped
    TextCache cache;
    ContextIndex index(ContextConfig{});
    ScriptedGenerator gen;
    ScriptedPresenter presenter;
    presenter.selections = {std::nullopt};
    presenter.accusations = {"Ada Marsh"};

    SessionMachine resumed(cache, index, gen, presenter, harbor_config());
    resumed.resume(restored);
    assert(index.has_source(character_source_id(restored.id(), 1)));
    const auto& done = resumed.run();
    assert(done.phase() == SessionPhase::Won);
    assert(done.id() == restored.id());
    assert(gen.structured_prompts.empty());    // no regeneration

    resumed.release();
    assert(index.stats().sources == 0);

    bool threw = false;
    json broken = snapshot;
    broken["phase"] = "dancing";
    try {
        broken.get<SessionState>();
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// SessionStore
// ═══════════════════════════════════════════════════════════════════

void test_session_store() {
    std::cout << "Testing SessionStore..." << std::endl;

    std::string dir = "/tmp/sleuth_test_" + std::to_string(getpid());
    std::string path = dir + "/nested/sessions.db";

    Rig rig;
    rig.presenter.selections = {std::nullopt};
    rig.presenter.accusations = {"Ada Marsh"};
    SessionMachine machine(rig.cache, rig.index, rig.generator, rig.presenter, harbor_config());

    {
        SessionStore store(path);
        assert(store.open());
        machine.run([&](const SessionState& s) { assert(store.save(s)); });

        assert(store.count() == 1);
        auto loaded = store.load(machine.state().id());
        assert(loaded.has_value());
        assert(loaded->phase() == SessionPhase::Won);
        assert(loaded->roster() == machine.state().roster());
        assert(!store.load("missing").has_value());
        assert(!store.last_error().empty());
    }

    // Reopen: schema already current, data intact
    {
        SessionStore store(path);
        assert(store.open());
        auto list = store.list();
        assert(list.size() == 1);
        assert(list[0].id == machine.state().id());
        assert(list[0].phase == "won");
        assert(list[0].environment == "a small harbor town");
        assert(store.remove(list[0].id));
        assert(!store.remove(list[0].id));
        assert(store.count() == 0);
    }

    std::remove(path.c_str());
    rmdir((dir + "/nested").c_str());
    rmdir(dir.c_str());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// RpcGenerator against an in-process backend
// ═══════════════════════════════════════════════════════════════════

// Serves `connections` clients in turn. With drop_first, the first request
// on the first connection is read and the connection closed unanswered.
void serve_backend(int listen_fd, int connections, bool drop_first) {
    for (int c = 0; c < connections; ++c) {
        int fd = accept(listen_fd, nullptr, nullptr);
        if (fd < 0) return;

        std::string buffer;
        char chunk[4096];
        bool open = true;
        while (open) {
            ssize_t n = read(fd, chunk, sizeof(chunk));
            if (n <= 0) break;
            buffer.append(chunk, static_cast<size_t>(n));

            size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                json req = json::parse(buffer.substr(0, pos));
                buffer.erase(0, pos + 1);

                if (drop_first && c == 0) {
                    open = false;
                    break;
                }

                json reply = {{"jsonrpc", "2.0"}, {"id", req["id"]}};
                std::string method = req["method"].get<std::string>();
                if (method == "version") {
                    reply["result"] = {{"software", "test-backend"},
                                       {"protocol_major", 1}, {"protocol_minor", 2}};
                } else if (method == "generate_text") {
                    reply["result"] = {{"text", "echo:" + req["params"]["prompt"].get<std::string>() +
                                        "|" + std::to_string(req["params"]["history"].size())}};
                } else if (method == "generate_structured") {
                    reply["result"] = {{"data", {{"schema_type", req["params"]["schema"]["type"]}}}};
                } else {
                    reply["error"] = {{"code", -32601}, {"message", "Method not found"}};
                }
                std::string line = reply.dump() + "\n";
                ssize_t written = write(fd, line.data(), line.size());
                assert(written == static_cast<ssize_t>(line.size()));
            }
        }
        close(fd);
    }
}

int listen_on(const std::string& path) {
    unlink(path.c_str());
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    assert(fd >= 0);
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    int rc = bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    rc = listen(fd, 4);
    assert(rc == 0);
    (void)rc;
    return fd;
}

void test_rpc_generator() {
    std::cout << "Testing RpcGenerator..." << std::endl;

    std::string path = "/tmp/sleuth_test_" + std::to_string(getpid()) + ".sock";

    {
        int listen_fd = listen_on(path);
        std::thread backend(serve_backend, listen_fd, 1, false);
        {
            RpcGenerator gen(path, 5000);
            assert(gen.handshake());

            MessageLog history = {{Speaker::Character, "hello"}, {Speaker::Detective, "why?"}};
            assert(gen.generate_text("prompt", history) == "echo:prompt|2");

            json data = gen.generate_structured("cast please", roster_schema());
            assert(data["schema_type"] == "object");

            bool threw = false;
            try {
                gen.call("no_such_method", json::object());
            } catch (const GenerationError& e) {
                threw = std::string(e.what()).find("Method not found") != std::string::npos;
            }
            assert(threw);
        }
        backend.join();
        close(listen_fd);
    }

    // Dropped connection: one reconnect, then success
    {
        int listen_fd = listen_on(path);
        std::thread backend(serve_backend, listen_fd, 2, true);
        {
            RpcGenerator gen(path, 5000);
            assert(gen.generate_text("again", {}) == "echo:again|0");
        }
        backend.join();
        close(listen_fd);
    }

    // Nothing listening
    unlink(path.c_str());
    {
        RpcGenerator gen(path, 1000);
        assert(!gen.handshake());
        bool threw = false;
        try {
            gen.generate_text("x", {});
        } catch (const GenerationError&) {
            threw = true;
        }
        assert(threw);
    }

    auto rpc_history = history_to_rpc({{Speaker::Detective, "q"}, {Speaker::Character, "a"}});
    assert(rpc_history[0]["role"] == "user");
    assert(rpc_history[1]["role"] == "assistant");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// ConsolePresenter
// ═══════════════════════════════════════════════════════════════════

void test_console_presenter() {
    std::cout << "Testing ConsolePresenter..." << std::endl;

    Roster roster = parse_roster(harbor_roster_json());
    std::istringstream in("abc\n2\n0\nholmes\n  Who was there?  \n1\n");
    std::ostringstream out;
    ConsolePresenter presenter(in, out);

    assert(presenter.select_character(roster, {0}) == std::optional<size_t>(1));
    assert(!presenter.select_character(roster, {}).has_value());
    assert(presenter.wants_assisted_question(roster[0]));
    assert(presenter.ask_question(roster[0]) == "Who was there?");

    std::vector<Character> suspects = {roster[1], roster[0]};
    assert(presenter.accuse(suspects) == "Ada Marsh");

    assert(out.str().find("(questioned)") != std::string::npos);
    assert(out.str().find("(victim)") != std::string::npos);

    bool closed = false;
    try {
        presenter.ask_question(roster[0]);
    } catch (const InputClosed&) {
        closed = true;
    }
    assert(closed);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Sleuth C++ Tests ===" << std::endl;
    std::cout << std::endl;

    test_cache_determinism();
    test_cache_ttl_expiry();
    test_cache_capacity();
    test_cache_invalidation();

    test_chunk_coverage();
    test_context_fallback();
    test_context_similarity();
    test_embedders();
    test_cache_concurrency();
    test_context_concurrency();

    test_roster_parsing();

    test_conversation_exit_token();
    test_conversation_turn_cap();
    test_conversation_blank_and_assisted();
    test_conversation_intro_cache();
    test_conversation_answer_context();

    test_session_harbor_win();
    test_session_harbor_lose();
    test_session_visits_and_budget();
    test_session_invalid_input();
    test_session_action_limit();
    test_session_budget_caps_visit();
    test_session_input_closed_mid_visit();
    test_session_generation_failure();
    test_session_json_and_resume();

    std::cout << std::endl;
    std::cout << "=== Persistence and Transport ===" << std::endl;
    test_session_store();
    test_rpc_generator();
    test_console_presenter();

    std::cout << std::endl;
    std::cout << "All tests passed!" << std::endl;
    return 0;
}
