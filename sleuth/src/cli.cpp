// sleuth: Command-line front end for investigation sessions
//
// Usage: sleuth <command> [options]
//
// Commands:
//   play         Start a new investigation
//   resume <id>  Continue a saved investigation
//   sessions     List saved investigations
//   stats        Show store statistics
//   help         Show this help

#include <sleuth/sleuth.hpp>
#include <sleuth/console_presenter.hpp>
#include <sleuth/rpc_generator.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <map>
#include <memory>

using namespace sleuth;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "sleuth " << SLEUTH_VERSION << " - Murder investigation sessions\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  play               Start a new investigation\n"
              << "  resume <id>        Continue a saved investigation\n"
              << "  sessions           List saved investigations\n"
              << "  stats              Show store statistics\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --env TEXT         Setting of the mystery (or SLEUTH_ENV)\n"
              << "  --characters N     Cast size, 3-15 (default: 5)\n"
              << "  --guesses N        Accusation attempts (default: 3)\n"
              << "  --actions N        Question budget across visits (default: unlimited)\n"
              << "  --max-turns N      Questions per visit (default: 25)\n"
              << "  --socket PATH      Generation backend socket (default: /tmp/sleuth-gen.sock)\n"
              << "  --db PATH          Session database (default: ~/.sleuth/sessions.db)\n"
              << "  --no-save          Do not persist the session\n"
              << "  --similarity MODE  Backstory retrieval: lexical|onnx|none (default: lexical)\n"
#ifdef SLEUTH_WITH_ONNX
              << "  --model PATH       ONNX model path\n"
              << "  --vocab PATH       Vocabulary file path\n"
#endif
              << "  --cache-size N     Cached generations kept (default: 200)\n"
              << "  --cache-ttl SECS   Lifetime of cached generations (default: 7200)\n"
              << "  --json             Output as JSON (sessions, stats)\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

// Strict integer parse; false on junk or overflow
static bool parse_int(const char* s, long& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
    out = v;
    return true;
}

struct Options {
    std::string command;
    std::string session_id;
    std::string environment;
    long characters = 5;
    long guesses = 3;
    long actions = 0;            // < 1 = unlimited
    long max_turns = 25;
    std::string socket_path;
    std::string db_path;
    bool save = true;
    std::string similarity = "lexical";
    std::string model_path;
    std::string vocab_path;
    long cache_size = 200;
    long cache_ttl = 7200;
    bool json_output = false;
};

static std::shared_ptr<Embedder> make_embedder(const Options& opts) {
    if (opts.similarity == "none") {
        return nullptr;
    }
#ifdef SLEUTH_WITH_ONNX
    if (opts.similarity == "onnx") {
        if (opts.model_path.empty() || opts.vocab_path.empty()) {
            std::cerr << "[cli] --similarity onnx needs --model and --vocab, using lexical\n";
        } else {
            auto onnx = std::make_shared<OnnxEmbedder>();
            if (onnx->load(opts.model_path, opts.vocab_path)) {
                return std::make_shared<CachedEmbedder>(onnx);
            }
            std::cerr << "[cli] Failed to load ONNX model: " << onnx->error()
                      << ", using lexical\n";
        }
    }
#else
    if (opts.similarity == "onnx") {
        std::cerr << "[cli] Built without ONNX support, using lexical\n";
    }
#endif
    return std::make_shared<CachedEmbedder>(std::make_shared<HashingEmbedder>());
}

static SessionConfig session_config(const Options& opts) {
    SessionConfig config;
    config.environment = opts.environment;
    config.roster_size = static_cast<size_t>(opts.characters);
    config.guess_budget = static_cast<uint32_t>(opts.guesses);
    if (opts.actions >= 1) config.action_limit = static_cast<uint32_t>(opts.actions);
    config.conversation.max_turns = static_cast<uint32_t>(opts.max_turns);
    return config;
}

static void print_outcome(const SessionState& state) {
    auto killer = state.killer_index();
    std::cout << "Session " << state.id() << " is over: "
              << (state.phase() == SessionPhase::Won ? "solved" : "unsolved");
    if (killer) std::cout << " (killer: " << state.roster()[*killer].name() << ")";
    std::cout << "\n";
}

// Drive one session to the end, checkpointing into the store when given
static int run_session(const Options& opts, SessionStore* store,
                       const std::optional<SessionState>& resumed) {
    CacheConfig cache_config;
    cache_config.max_size = static_cast<size_t>(opts.cache_size);
    cache_config.default_ttl = std::chrono::seconds(opts.cache_ttl);
    TextCache cache(cache_config);
    ContextIndex index(ContextConfig{});
    if (auto embedder = make_embedder(opts)) {
        index.attach_embedder(std::move(embedder));
    }

    RpcGenerator generator(opts.socket_path);
    if (!generator.handshake()) {
        std::cerr << "Error: generation backend unavailable at " << opts.socket_path
                  << ": " << generator.last_error() << "\n";
        return 1;
    }

    SessionConfig config = session_config(opts);
    ConsolePresenter presenter(std::cin, std::cout, config.conversation.exit_token);

    if (!resumed && config.environment.empty()) {
        try {
            while (config.environment.empty()) {
                config.environment = presenter.prompt("Where does the mystery take place? ");
            }
        } catch (const InputClosed&) {
            std::cerr << "Error: no environment given\n";
            return 1;
        }
    }

    SessionMachine machine(cache, index, generator, presenter, config);
    if (resumed) machine.resume(*resumed);

    auto checkpoint = [&](const SessionState& state) {
        if (store && !store->save(state)) {
            std::cerr << "[cli] Checkpoint failed: " << store->last_error() << "\n";
        }
    };

    try {
        machine.run(checkpoint);
    } catch (const GenerationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (store) {
            std::cerr << "Session saved. Resume with: sleuth resume " << machine.state().id() << "\n";
        }
        machine.release();
        return 1;
    } catch (const InputClosed&) {
        checkpoint(machine.state());
        std::cout << "\n";
        if (store) {
            std::cout << "Session saved. Resume with: sleuth resume " << machine.state().id() << "\n";
        }
        machine.release();
        return 0;
    }

    print_outcome(machine.state());
    auto cs = cache.stats();
    auto is = index.stats();
    log_debug("cli", "cache %zu/%zu entries, hit rate %.1f%%; index %zu sources, %zu chunks (%s)",
              cs.size, cs.max_size, cs.hit_rate(), is.sources, is.chunks, is.backend.c_str());
    machine.release();
    return 0;
}

static int cmd_sessions(SessionStore& store, bool json_output) {
    auto sessions = store.list();
    if (json_output) {
        json out = json::array();
        for (const auto& s : sessions) {
            out.push_back({{"id", s.id}, {"environment", s.environment}, {"phase", s.phase},
                           {"created_at", s.created_at}, {"updated_at", s.updated_at}});
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (sessions.empty()) {
        std::cout << "No saved sessions.\n";
        return 0;
    }
    for (const auto& s : sessions) {
        std::cout << s.id << "  " << s.phase;
        for (size_t pad = s.phase.size(); pad < 12; ++pad) std::cout << ' ';
        std::cout << s.environment << "\n";
    }
    return 0;
}

static int cmd_stats(SessionStore& store, bool json_output) {
    auto sessions = store.list();
    std::map<std::string, size_t> by_phase;
    for (const auto& s : sessions) by_phase[s.phase]++;

    if (json_output) {
        json out = {{"version", SLEUTH_VERSION},
                    {"db", store.path()},
                    {"sessions", sessions.size()},
                    {"phases", by_phase}};
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "sleuth " << SLEUTH_VERSION << "\n"
              << "Store:    " << store.path() << "\n"
              << "Sessions: " << sessions.size() << "\n";
    for (const auto& [phase, count] : by_phase) {
        std::cout << "  " << phase << ": " << count << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    Options opts;
    opts.socket_path = RpcGenerator::default_socket_path();
    opts.db_path = SessionStore::default_path();
    if (const char* env = std::getenv("SLEUTH_ENV")) opts.environment = env;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        long n = 0;
        auto numeric = [&](long& target) {
            if (i + 1 >= argc || !parse_int(argv[i + 1], n)) {
                std::cerr << "Invalid value for " << argv[i] << "\n";
                return false;
            }
            target = n;
            ++i;
            return true;
        };

        if (strcmp(argv[i], "--env") == 0 && i + 1 < argc) {
            opts.environment = argv[++i];
        } else if (strcmp(argv[i], "--characters") == 0) {
            if (!numeric(opts.characters)) return 1;
        } else if (strcmp(argv[i], "--guesses") == 0) {
            if (!numeric(opts.guesses)) return 1;
        } else if (strcmp(argv[i], "--actions") == 0) {
            if (!numeric(opts.actions)) return 1;
        } else if (strcmp(argv[i], "--max-turns") == 0) {
            if (!numeric(opts.max_turns)) return 1;
        } else if (strcmp(argv[i], "--cache-size") == 0) {
            if (!numeric(opts.cache_size)) return 1;
        } else if (strcmp(argv[i], "--cache-ttl") == 0) {
            if (!numeric(opts.cache_ttl)) return 1;
        } else if (strcmp(argv[i], "--socket") == 0 && i + 1 < argc) {
            opts.socket_path = argv[++i];
        } else if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            opts.db_path = argv[++i];
        } else if (strcmp(argv[i], "--no-save") == 0) {
            opts.save = false;
        } else if (strcmp(argv[i], "--similarity") == 0 && i + 1 < argc) {
            opts.similarity = argv[++i];
        } else if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            opts.model_path = argv[++i];
        } else if (strcmp(argv[i], "--vocab") == 0 && i + 1 < argc) {
            opts.vocab_path = argv[++i];
        } else if (strcmp(argv[i], "--json") == 0) {
            opts.json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            set_verbose(true);
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "sleuth " << SLEUTH_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (opts.command.empty()) {
                opts.command = argv[i];
            } else if (opts.command == "resume" && opts.session_id.empty()) {
                opts.session_id = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (opts.command.empty() || opts.command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    if (opts.characters < 3 || opts.characters > 15) {
        std::cerr << "Error: --characters must be between 3 and 15\n";
        return 1;
    }
    if (opts.guesses < 1) {
        std::cerr << "Error: --guesses must be at least 1\n";
        return 1;
    }
    if (opts.max_turns < 1) {
        std::cerr << "Error: --max-turns must be at least 1\n";
        return 1;
    }
    if (opts.cache_size < 1 || opts.cache_ttl < 0) {
        std::cerr << "Error: --cache-size must be positive and --cache-ttl non-negative\n";
        return 1;
    }
    if (opts.similarity != "lexical" && opts.similarity != "onnx" && opts.similarity != "none") {
        std::cerr << "Error: --similarity must be lexical, onnx or none\n";
        return 1;
    }

    try {
        if (opts.command == "play") {
            if (!opts.save) {
                return run_session(opts, nullptr, std::nullopt);
            }
            SessionStore store(opts.db_path);
            if (!store.open()) {
                std::cerr << "[cli] Cannot open " << opts.db_path << ": " << store.last_error()
                          << " - playing without saving\n";
                return run_session(opts, nullptr, std::nullopt);
            }
            return run_session(opts, &store, std::nullopt);
        }

        SessionStore store(opts.db_path);
        if (!store.open()) {
            std::cerr << "Error: Failed to open store at " << opts.db_path << ": "
                      << store.last_error() << "\n";
            return 1;
        }

        if (opts.command == "resume") {
            if (opts.session_id.empty()) {
                std::cerr << "Usage: sleuth resume <id>\n";
                return 1;
            }
            auto state = store.load(opts.session_id);
            if (!state) {
                std::cerr << "Error: " << store.last_error() << "\n";
                return 1;
            }
            if (state->terminal()) {
                print_outcome(*state);
                return 0;
            }
            return run_session(opts, opts.save ? &store : nullptr, state);
        }
        if (opts.command == "sessions") {
            return cmd_sessions(store, opts.json_output);
        }
        if (opts.command == "stats") {
            return cmd_stats(store, opts.json_output);
        }

        std::cerr << "Unknown command: " << opts.command << "\n\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
