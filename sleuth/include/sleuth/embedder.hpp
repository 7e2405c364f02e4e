#pragma once
// Embedder: text becoming position in a similarity space
//
// The similarity backend behind ContextIndex. Anything that can turn a
// string into a vector qualifies:
// - HashingEmbedder: lexical feature hashing, no model files needed
// - OnnxEmbedder: sentence-transformer via ONNX Runtime (embedder_onnx.hpp)
// - CachedEmbedder: wraps any embedder with a bounded memo table

#include "types.hpp"
#include <cmath>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sleuth {

class Vector {
public:
    std::vector<float> data;

    Vector() = default;
    explicit Vector(size_t dim) : data(dim, 0.0f) {}
    explicit Vector(std::vector<float> v) : data(std::move(v)) {}

    size_t size() const { return data.size(); }
    float& operator[](size_t i) { return data[i]; }
    const float& operator[](size_t i) const { return data[i]; }

    // Cosine similarity (single pass; mismatched dimensions compare the overlap)
    float cosine(const Vector& other) const {
        size_t n = std::min(data.size(), other.data.size());
        float dot = 0.0f, norm_a = 0.0f, norm_b = 0.0f;
        for (size_t i = 0; i < n; ++i) {
            float ai = data[i];
            float bi = other.data[i];
            dot += ai * bi;
            norm_a += ai * ai;
            norm_b += bi * bi;
        }
        float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
        return denom > 0.0f ? dot / denom : 0.0f;
    }

    void normalize() {
        float norm = 0.0f;
        for (float x : data) norm += x * x;
        norm = std::sqrt(norm);
        if (norm > 0.0f) {
            for (float& x : data) x /= norm;
        }
    }

    bool is_zero() const {
        for (float x : data) {
            if (x != 0.0f) return false;
        }
        return true;
    }
};

struct Embedding {
    Vector vector;
    float certainty = 1.0f;   // 0 when the backend could not embed
    std::string source;

    Embedding() = default;
    Embedding(Vector v, float c = 1.0f, std::string s = "")
        : vector(std::move(v)), certainty(c), source(std::move(s)) {}
};

// Abstract similarity backend
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual Embedding embed(const std::string& text) = 0;

    virtual std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) {
        std::vector<Embedding> results;
        results.reserve(texts.size());
        for (const auto& text : texts) {
            results.push_back(embed(text));
        }
        return results;
    }

    virtual size_t dimension() const = 0;
    virtual bool ready() const = 0;
    virtual std::string name() const = 0;
};

// Bounded memo of text -> embedding; oldest insert goes first at capacity
class EmbeddingCache {
public:
    explicit EmbeddingCache(size_t max_size = 10000) : max_size_(max_size) {}

    void remember(const std::string& text, Embedding embedding) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (cache_.count(text) == 0 && cache_.size() >= max_size_ && !insert_order_.empty()) {
            cache_.erase(insert_order_.front());
            insert_order_.erase(insert_order_.begin());
        }

        if (cache_.count(text) == 0) {
            insert_order_.push_back(text);
        }
        cache_[text] = std::move(embedding);
    }

    bool recall(const std::string& text, Embedding& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(text);
        if (it == cache_.end()) return false;
        out = it->second;
        return true;
    }

    void forget() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.clear();
        insert_order_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Embedding> cache_;
    std::vector<std::string> insert_order_;
    size_t max_size_;
};

class CachedEmbedder : public Embedder {
public:
    CachedEmbedder(std::shared_ptr<Embedder> inner, size_t cache_size = 10000)
        : inner_(std::move(inner)), cache_(cache_size) {}

    Embedding embed(const std::string& text) override {
        Embedding remembered;
        if (cache_.recall(text, remembered)) {
            return remembered;
        }
        Embedding fresh = inner_->embed(text);
        if (fresh.certainty > 0.0f) {
            cache_.remember(text, fresh);
        }
        return fresh;
    }

    std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) override {
        std::vector<Embedding> results(texts.size());
        std::vector<std::string> to_compute;
        std::vector<size_t> compute_indices;

        for (size_t i = 0; i < texts.size(); ++i) {
            if (!cache_.recall(texts[i], results[i])) {
                to_compute.push_back(texts[i]);
                compute_indices.push_back(i);
            }
        }

        if (!to_compute.empty()) {
            auto computed = inner_->embed_batch(to_compute);
            for (size_t i = 0; i < computed.size() && i < compute_indices.size(); ++i) {
                results[compute_indices[i]] = computed[i];
                if (computed[i].certainty > 0.0f) {
                    cache_.remember(to_compute[i], computed[i]);
                }
            }
        }

        return results;
    }

    size_t dimension() const override { return inner_->dimension(); }
    bool ready() const override { return inner_->ready(); }
    std::string name() const override { return "cached:" + inner_->name(); }

    EmbeddingCache& cache() { return cache_; }

private:
    std::shared_ptr<Embedder> inner_;
    EmbeddingCache cache_;
};

// Lexical embedder: signed feature hashing of lowercase word unigrams,
// sublinear term frequency, L2 normalized. Shared vocabulary means shared
// direction, which is all relevance ranking of backstory chunks needs.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimension = 512) : dimension_(dimension) {
        if (dimension_ == 0) dimension_ = 1;
    }

    Embedding embed(const std::string& text) override {
        std::unordered_map<std::string, int> counts;
        for (auto& word : split_words(text)) {
            if (word.size() < 3 || is_stopword(word)) continue;
            counts[word]++;
        }

        Vector v(dimension_);
        for (const auto& [word, count] : counts) {
            uint32_t h = djb2_hash(word);
            size_t bucket = h % dimension_;
            float sign = ((h >> 31) & 1u) ? -1.0f : 1.0f;
            v[bucket] += sign * (1.0f + std::log(static_cast<float>(count)));
        }
        v.normalize();

        float certainty = v.is_zero() ? 0.0f : 1.0f;
        return Embedding(std::move(v), certainty, text);
    }

    size_t dimension() const override { return dimension_; }
    bool ready() const override { return true; }
    std::string name() const override { return "lexical"; }

    static std::vector<std::string> split_words(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        for (char ch : text) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || c >= 0x80) {
                current += static_cast<char>(std::tolower(c));
            } else if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        }
        if (!current.empty()) words.push_back(current);
        return words;
    }

private:
    static bool is_stopword(const std::string& w) {
        static const char* const kStop[] = {
            "the", "and", "was", "were", "for", "with", "that", "this", "his", "her",
            "she", "him", "they", "you", "your", "are", "had", "has", "have", "but",
            "not", "from", "what", "who", "when", "where", "did", "does", "about"
        };
        for (const char* s : kStop) {
            if (w == s) return true;
        }
        return false;
    }

    size_t dimension_;
};

} // namespace sleuth
