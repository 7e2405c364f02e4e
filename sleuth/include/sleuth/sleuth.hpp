#pragma once
// Sleuth: interactive murder-investigation session engine
//
// - Types: Characters, Scenario, Messages
// - CacheStore: bounded, expiring memo of generated prose
// - Embedder / ContextIndex: chunked backstories, relevant slice per question
// - Generator / Presenter: the two collaborators the core talks to
// - ConversationMachine: one interview
// - SessionMachine: cast, narration, visits, accusation, verdict
// - SessionStore: snapshots in SQLite

#include "version.hpp"
#include "log.hpp"
#include "types.hpp"
#include "cache_store.hpp"
#include "embedder.hpp"
#ifdef SLEUTH_WITH_ONNX
#include "embedder_onnx.hpp"
#endif
#include "context_index.hpp"
#include "generator.hpp"
#include "presenter.hpp"
#include "prompts.hpp"
#include "conversation.hpp"
#include "session.hpp"
#include "session_store.hpp"
