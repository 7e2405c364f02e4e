#pragma once
// ContextIndex: bounded background retrieval per character
//
// Long backstories are cut into overlapping chunks once, at add time.
// A query returns the k most relevant chunks, joined and clipped to a size
// budget, so a prompt never carries a whole dossier.
//
// Retrieval paths:
// - Embedder attached and ready: cosine ranking of precomputed chunk vectors
// - Otherwise: first k chunks in sequence order (degraded, never an error)
//
// Thread-safe: one mutex per index. Embedding work happens outside the
// lock; replacing a source swaps its chunk set atomically.

#include "embedder.hpp"
#include "log.hpp"
#include "types.hpp"
#include <algorithm>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sleuth {

struct TextChunk {
    std::string content;
    std::string id;
    std::string source_id;
    size_t start_offset = 0;
    size_t end_offset = 0;     // exclusive
    size_t sequence_index = 0;
};

struct ContextConfig {
    size_t chunk_size = 500;
    size_t chunk_overlap = 50;
    size_t max_chunks_per_query = 3;
    size_t chars_per_unit = 4;        // rough chars per token
    std::string separator = "\n\n";
    std::string truncation_marker = "...";
};

struct ContextStats {
    size_t sources = 0;
    size_t chunks = 0;
    double avg_chunks_per_source = 0.0;
    bool similarity_enabled = false;
    std::string backend;
};

inline std::string chunk_id(const std::string& source_id, size_t start,
                            const std::string& content) {
    char buf[9];
    snprintf(buf, sizeof(buf), "%08x",
             djb2_hash(source_id + "_" + std::to_string(start) + "_" + content.substr(0, 50)));
    return buf;
}

// Split text into overlapping windows, preferring sentence then word breaks.
// Every offset of `text` lands in at least one chunk.
inline std::vector<TextChunk> chunk_text(const std::string& text,
                                         const std::string& source_id,
                                         size_t chunk_size,
                                         size_t chunk_overlap) {
    std::vector<TextChunk> chunks;
    if (chunk_size == 0) chunk_size = 1;

    size_t start = 0;
    const size_t length = text.size();

    while (start < length) {
        size_t end = std::min(start + chunk_size, length);

        if (end < length) {
            // ". " must lie wholly inside [start, end)
            size_t sentence = std::string::npos;
            if (end - start >= 2) {
                sentence = text.rfind(". ", end - 2);
            }
            if (sentence != std::string::npos && sentence > start) {
                end = sentence + 1;
            } else {
                size_t space = text.rfind(' ', end - 1);
                if (space != std::string::npos && space > start) {
                    end = space;
                }
            }
        }

        std::string content = text.substr(start, end - start);
        if (!trim(content).empty()) {
            TextChunk chunk;
            chunk.id = chunk_id(source_id, start, content);
            chunk.content = std::move(content);
            chunk.source_id = source_id;
            chunk.start_offset = start;
            chunk.end_offset = end;
            chunk.sequence_index = chunks.size();
            chunks.push_back(std::move(chunk));
        }

        if (end >= length) break;

        // Step back by the overlap, but always move forward
        size_t next = end > chunk_overlap ? end - chunk_overlap : end;
        if (next <= start) next = end;
        start = next;
    }

    return chunks;
}

class ContextIndex {
public:
    ContextIndex() = default;
    explicit ContextIndex(ContextConfig config,
                          std::shared_ptr<Embedder> embedder = nullptr)
        : config_(std::move(config)), embedder_(std::move(embedder)) {
        if (config_.chunk_overlap >= config_.chunk_size && config_.chunk_size > 0) {
            config_.chunk_overlap = config_.chunk_size - 1;
        }
    }

    ContextIndex(const ContextIndex&) = delete;
    ContextIndex& operator=(const ContextIndex&) = delete;

    // Applies to sources added afterwards
    void attach_embedder(std::shared_ptr<Embedder> embedder) {
        std::lock_guard<std::mutex> lock(mutex_);
        embedder_ = std::move(embedder);
    }

    bool has_embedder() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return embedder_ && embedder_->ready();
    }

    // Replace everything known about source_id
    size_t add_source(const std::string& source_id, const std::string& full_text) {
        Source source;
        source.chunks = chunk_text(full_text, source_id,
                                   config_.chunk_size, config_.chunk_overlap);

        std::shared_ptr<Embedder> embedder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            embedder = embedder_;
        }

        if (embedder && embedder->ready() && !source.chunks.empty()) {
            std::vector<std::string> texts;
            texts.reserve(source.chunks.size());
            for (const auto& c : source.chunks) texts.push_back(c.content);

            auto embeddings = embedder->embed_batch(texts);
            // Chunks with nothing embeddable keep a zero vector and never rank
            bool usable = false;
            if (embeddings.size() == source.chunks.size()) {
                for (const auto& e : embeddings) {
                    if (e.certainty > 0.0f) usable = true;
                }
            }
            if (usable) {
                source.vectors.reserve(embeddings.size());
                for (auto& e : embeddings) source.vectors.push_back(std::move(e.vector));
                source.embedder = embedder;
            } else {
                log_debug("context", "embedding failed for %s, sequence order only",
                          source_id.c_str());
            }
        }

        size_t count = source.chunks.size();
        std::lock_guard<std::mutex> lock(mutex_);
        sources_[source_id] = std::move(source);
        return count;
    }

    // Most relevant slice of source_id for query, at most max_units * chars_per_unit
    // characters. Empty when the source is unknown.
    std::string query(const std::string& source_id, const std::string& query_text,
                      size_t max_units = 1000) const {
        std::vector<TextChunk> chunks;
        std::vector<Vector> vectors;
        std::shared_ptr<Embedder> embedder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sources_.find(source_id);
            if (it == sources_.end()) return "";
            chunks = it->second.chunks;
            vectors = it->second.vectors;
            embedder = it->second.embedder;
        }
        if (chunks.empty()) return "";

        std::vector<size_t> chosen = (embedder && !vectors.empty())
            ? rank_by_similarity(*embedder, query_text, vectors)
            : std::vector<size_t>{};

        if (chosen.empty()) {
            // Degraded mode: sequence order
            for (size_t i = 0; i < chunks.size() && i < config_.max_chunks_per_query; ++i) {
                chosen.push_back(i);
            }
        }

        std::string combined;
        for (size_t i = 0; i < chosen.size(); ++i) {
            if (i > 0) combined += config_.separator;
            combined += chunks[chosen[i]].content;
        }

        size_t max_chars = max_units * config_.chars_per_unit;
        if (combined.size() > max_chars) {
            combined = combined.substr(0, max_chars) + config_.truncation_marker;
        }
        return combined;
    }

    bool remove_source(const std::string& source_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return sources_.erase(source_id) > 0;
    }

    // Drop every source whose id starts with prefix (one session's cast)
    size_t remove_prefix(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = sources_.begin(); it != sources_.end(); ) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                it = sources_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        sources_.clear();
    }

    bool has_source(const std::string& source_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sources_.count(source_id) > 0;
    }

    std::vector<TextChunk> chunks(const std::string& source_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sources_.find(source_id);
        return it != sources_.end() ? it->second.chunks : std::vector<TextChunk>{};
    }

    // All chunk contents in order, newline joined
    std::string full_text(const std::string& source_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sources_.find(source_id);
        if (it == sources_.end()) return "";
        std::string out;
        for (const auto& c : it->second.chunks) {
            if (!out.empty()) out += "\n";
            out += c.content;
        }
        return out;
    }

    ContextStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ContextStats s;
        s.sources = sources_.size();
        for (const auto& [id, src] : sources_) {
            s.chunks += src.chunks.size();
        }
        s.avg_chunks_per_source = s.sources > 0
            ? static_cast<double>(s.chunks) / static_cast<double>(s.sources) : 0.0;
        s.similarity_enabled = embedder_ && embedder_->ready();
        s.backend = s.similarity_enabled ? embedder_->name() : "sequence";
        return s;
    }

    const ContextConfig& config() const { return config_; }

private:
    struct Source {
        std::vector<TextChunk> chunks;
        std::vector<Vector> vectors;            // parallel to chunks, empty if unembedded
        std::shared_ptr<Embedder> embedder;     // the one that produced `vectors`
    };

    std::vector<size_t> rank_by_similarity(Embedder& embedder, const std::string& query_text,
                                           const std::vector<Vector>& vectors) const {
        Embedding q = embedder.embed(query_text);
        if (q.certainty <= 0.0f || q.vector.is_zero()) {
            log_debug("context", "query not embeddable, falling back to sequence order");
            return {};
        }

        std::vector<std::pair<float, size_t>> scored;
        scored.reserve(vectors.size());
        for (size_t i = 0; i < vectors.size(); ++i) {
            scored.emplace_back(q.vector.cosine(vectors[i]), i);
        }
        // Stable on ties: earlier chunks first
        std::stable_sort(scored.begin(), scored.end(),
            [](const auto& a, const auto& b) { return a.first > b.first; });

        std::vector<size_t> top;
        for (size_t i = 0; i < scored.size() && i < config_.max_chunks_per_query; ++i) {
            top.push_back(scored[i].second);
        }
        return top;
    }

    ContextConfig config_;
    std::shared_ptr<Embedder> embedder_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Source> sources_;
};

} // namespace sleuth
