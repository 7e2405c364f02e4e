#pragma once
// OnnxEmbedder: sentence-transformer embeddings through ONNX Runtime
//
// Built only with SLEUTH_WITH_ONNX. Pipeline:
// - whitespace/control normalization
// - WordPiece tokenization against the model's vocab.txt
// - model introspection for input names and output rank
// - attention-masked mean pooling, L2 normalization

#include "embedder.hpp"
#include <onnxruntime/core/session/onnxruntime_cxx_api.h>
#include <array>
#include <cmath>
#include <fstream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sleuth {

class WordPieceTokenizer {
public:
    bool load(const std::string& vocab_path) {
        std::ifstream file(vocab_path);
        if (!file) return false;

        vocab_.clear();
        std::string line;
        int64_t id = 0;
        while (std::getline(file, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
                line.pop_back();
            }
            if (!line.empty()) {
                vocab_[line] = id++;
            }
        }

        cls_id_ = id_of("[CLS]");
        sep_id_ = id_of("[SEP]");
        pad_id_ = std::max<int64_t>(id_of("[PAD]"), 0);
        unk_id_ = id_of("[UNK]");

        return unk_id_ >= 0;  // Must have UNK token
    }

    struct Encoding {
        std::vector<int64_t> input_ids;
        std::vector<int64_t> attention_mask;
        std::vector<int64_t> token_type_ids;
    };

    Encoding encode(const std::string& text, size_t max_length) const {
        std::vector<int64_t> tokens;
        if (cls_id_ >= 0) tokens.push_back(cls_id_);

        for (const auto& word : split_words(text)) {
            for (int64_t tok : tokenize_word(word)) {
                if (tokens.size() >= max_length - 1) break;
                tokens.push_back(tok);
            }
            if (tokens.size() >= max_length - 1) break;
        }
        if (sep_id_ >= 0) tokens.push_back(sep_id_);

        Encoding enc;
        enc.input_ids = tokens;
        enc.attention_mask.assign(tokens.size(), 1);
        enc.token_type_ids.assign(tokens.size(), 0);
        while (enc.input_ids.size() < max_length) {
            enc.input_ids.push_back(pad_id_);
            enc.attention_mask.push_back(0);
            enc.token_type_ids.push_back(0);
        }
        return enc;
    }

    size_t vocab_size() const { return vocab_.size(); }

private:
    int64_t id_of(const std::string& token) const {
        auto it = vocab_.find(token);
        return it != vocab_.end() ? it->second : -1;
    }

    static std::vector<std::string> split_words(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        for (char ch : text) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (c < 0x80 && std::isspace(c)) {
                if (!current.empty()) { words.push_back(current); current.clear(); }
            } else if (c < 0x80 && std::ispunct(c)) {
                if (!current.empty()) { words.push_back(current); current.clear(); }
                words.emplace_back(1, ch);
            } else {
                current += (c < 0x80) ? static_cast<char>(std::tolower(c)) : ch;
            }
        }
        if (!current.empty()) words.push_back(current);
        return words;
    }

    std::vector<int64_t> tokenize_word(const std::string& word) const {
        std::vector<int64_t> tokens;
        auto whole = vocab_.find(word);
        if (whole != vocab_.end()) {
            tokens.push_back(whole->second);
            return tokens;
        }

        // Greedy longest-match-first over "##" continuation pieces
        size_t start = 0;
        while (start < word.size()) {
            size_t end = word.size();
            int64_t cur_id = -1;
            while (start < end) {
                std::string piece = word.substr(start, end - start);
                if (start > 0) piece = "##" + piece;
                auto it = vocab_.find(piece);
                if (it != vocab_.end()) {
                    cur_id = it->second;
                    break;
                }
                end--;
            }
            if (cur_id < 0) {
                tokens.push_back(unk_id_);
                start++;
            } else {
                tokens.push_back(cur_id);
                start = end;
            }
        }
        return tokens;
    }

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t cls_id_ = -1;
    int64_t sep_id_ = -1;
    int64_t pad_id_ = 0;
    int64_t unk_id_ = -1;
};

class OnnxEmbedder : public Embedder {
public:
    struct Config {
        size_t max_seq_length = 128;
        int num_threads = 0;          // 0 = runtime default
    };

    OnnxEmbedder() : env_(ORT_LOGGING_LEVEL_WARNING, "sleuth") {}
    explicit OnnxEmbedder(Config config)
        : env_(ORT_LOGGING_LEVEL_WARNING, "sleuth"), config_(config) {}

    bool load(const std::string& model_path, const std::string& vocab_path) {
        try {
            if (!tokenizer_.load(vocab_path)) {
                error_ = "Failed to load vocabulary from: " + vocab_path;
                return false;
            }

            Ort::SessionOptions opts;
            if (config_.num_threads > 0) {
                opts.SetIntraOpNumThreads(config_.num_threads);
            }
            opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), opts);

            introspect();
            ready_ = true;
            return true;
        } catch (const Ort::Exception& e) {
            error_ = std::string("ONNX error: ") + e.what();
            return false;
        }
    }

    Embedding embed(const std::string& text) override {
        auto results = embed_batch({text});
        return results.empty() ? Embedding(Vector(dimension()), 0.0f, text) : results[0];
    }

    std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) override {
        if (!ready_ || texts.empty()) {
            return unembedded(texts);
        }
        try {
            return run(texts);
        } catch (const Ort::Exception& e) {
            error_ = std::string("Inference error: ") + e.what();
            return unembedded(texts);
        }
    }

    size_t dimension() const override { return static_cast<size_t>(hidden_dim_); }
    bool ready() const override { return ready_; }
    std::string name() const override { return "onnx"; }
    const std::string& error() const { return error_; }

private:
    std::vector<Embedding> unembedded(const std::vector<std::string>& texts) const {
        std::vector<Embedding> out;
        out.reserve(texts.size());
        for (const auto& t : texts) {
            out.emplace_back(Vector(dimension()), 0.0f, t);
        }
        return out;
    }

    void introspect() {
        Ort::AllocatorWithDefaultOptions allocator;

        input_names_.clear();
        for (size_t i = 0; i < session_->GetInputCount(); ++i) {
            input_names_.push_back(session_->GetInputNameAllocated(i, allocator).get());
        }
        output_names_.clear();
        for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
            output_names_.push_back(session_->GetOutputNameAllocated(i, allocator).get());
        }

        auto shape = session_->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() == 2 && shape[1] > 0) hidden_dim_ = shape[1];
        if (shape.size() == 3 && shape[2] > 0) hidden_dim_ = shape[2];

        input_cstr_.clear();
        for (const auto& n : input_names_) input_cstr_.push_back(n.c_str());
        output_cstr_.clear();
        for (const auto& n : output_names_) output_cstr_.push_back(n.c_str());
    }

    std::vector<Embedding> run(const std::vector<std::string>& texts) {
        size_t batch = texts.size();
        size_t seq_len = config_.max_seq_length;

        std::vector<WordPieceTokenizer::Encoding> encodings;
        encodings.reserve(batch);
        std::vector<int64_t> ids, mask, types;
        ids.reserve(batch * seq_len);
        mask.reserve(batch * seq_len);
        types.reserve(batch * seq_len);

        for (const auto& text : texts) {
            encodings.push_back(tokenizer_.encode(normalize(text), seq_len));
            const auto& enc = encodings.back();
            ids.insert(ids.end(), enc.input_ids.begin(), enc.input_ids.end());
            mask.insert(mask.end(), enc.attention_mask.begin(), enc.attention_mask.end());
            types.insert(types.end(), enc.token_type_ids.begin(), enc.token_type_ids.end());
        }

        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::array<int64_t, 2> shape = {static_cast<int64_t>(batch), static_cast<int64_t>(seq_len)};

        std::vector<Ort::Value> inputs;
        for (const auto& name : input_names_) {
            std::vector<int64_t>* src = nullptr;
            if (name == "input_ids") src = &ids;
            else if (name == "attention_mask") src = &mask;
            else if (name == "token_type_ids") src = &types;
            if (!src) continue;
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memory_info, src->data(), src->size(), shape.data(), shape.size()));
        }

        auto outputs = session_->Run(Ort::RunOptions{nullptr},
            input_cstr_.data(), inputs.data(), inputs.size(),
            output_cstr_.data(), output_cstr_.size());

        auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();

        std::vector<Embedding> results;
        results.reserve(batch);
        for (size_t b = 0; b < batch; ++b) {
            Vector v;
            if (out_shape.size() == 2) {
                int64_t dim = out_shape[1];
                v = Vector(std::vector<float>(data + b * dim, data + (b + 1) * dim));
            } else {
                int64_t len = out_shape[1];
                int64_t dim = out_shape[2];
                v = mean_pool(data + b * len * dim, len, dim, encodings[b].attention_mask);
            }
            v.normalize();
            results.emplace_back(std::move(v), 1.0f, texts[b]);
        }
        return results;
    }

    static Vector mean_pool(const float* tokens, int64_t seq_len, int64_t dim,
                            const std::vector<int64_t>& attention_mask) {
        Vector pooled(static_cast<size_t>(dim));
        float count = 0.0f;
        for (int64_t t = 0; t < seq_len; ++t) {
            if (attention_mask[static_cast<size_t>(t)] != 1) continue;
            count += 1.0f;
            for (int64_t d = 0; d < dim; ++d) {
                pooled[static_cast<size_t>(d)] += tokens[t * dim + d];
            }
        }
        if (count > 0.0f) {
            for (auto& x : pooled.data) x /= count;
        }
        return pooled;
    }

    // Control characters become spaces, runs of spaces collapse
    static std::string normalize(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        bool last_space = true;
        for (char ch : text) {
            unsigned char c = static_cast<unsigned char>(ch);
            bool space = c < 0x20 || c == ' ';
            if (space) {
                if (!last_space) out += ' ';
                last_space = true;
            } else {
                out += ch;
                last_space = false;
            }
        }
        if (!out.empty() && out.back() == ' ') out.pop_back();
        return out;
    }

    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;
    WordPieceTokenizer tokenizer_;
    Config config_;

    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<const char*> input_cstr_;
    std::vector<const char*> output_cstr_;
    int64_t hidden_dim_ = 384;

    bool ready_ = false;
    std::string error_;
};

} // namespace sleuth
