#pragma once
// RpcGenerator: Generator backed by a generation daemon over a Unix socket
//
// Newline-delimited JSON-RPC 2.0. The daemon wraps whatever model it
// likes; this side only knows three methods:
//   generate_text        {prompt, history:[{role, content}]} -> {text}
//   generate_structured  {prompt, schema}                    -> {data}
//   version              {}                                   -> {software, protocol_major, protocol_minor}
//
// A dropped connection is retried once. Everything else surfaces as
// GenerationError.

#include "generator.hpp"
#include "version.hpp"
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string>

namespace sleuth {

// Version info returned by the daemon
struct BackendVersion {
    std::string software;
    int protocol_major = 0;
    int protocol_minor = 0;
};

// History as the daemon expects it: detective turns are the user side
inline json history_to_rpc(const MessageLog& history) {
    json out = json::array();
    for (const auto& m : history) {
        out.push_back({{"role", m.speaker == Speaker::Detective ? "user" : "assistant"},
                       {"content", m.text}});
    }
    return out;
}

class RpcGenerator : public Generator {
public:
    static std::string default_socket_path() {
        if (const char* path = std::getenv("SLEUTH_GEN_SOCKET")) {
            return path;
        }
        return "/tmp/sleuth-gen.sock";
    }

    static constexpr int RESPONSE_TIMEOUT_MS = 120000;
    static constexpr size_t MAX_RESPONSE_SIZE = 16 * 1024 * 1024;

    RpcGenerator();
    explicit RpcGenerator(std::string socket_path, int timeout_ms = RESPONSE_TIMEOUT_MS);
    ~RpcGenerator() override;

    // Owns a file descriptor
    RpcGenerator(const RpcGenerator&) = delete;
    RpcGenerator& operator=(const RpcGenerator&) = delete;

    bool connect();
    void disconnect();
    bool connected() const { return fd_ >= 0; }

    // Connect and verify protocol compatibility
    bool handshake();

    std::optional<BackendVersion> check_version();

    json generate_structured(const std::string& prompt, const json& schema) override;
    std::string generate_text(const std::string& prompt, const MessageLog& history) override;
    std::string name() const override { return "rpc:" + socket_path_; }

    // Raw JSON-RPC call; result member, or GenerationError
    json call(const std::string& method, const json& params);

    const std::string& last_error() const { return last_error_; }
    const std::string& socket_path() const { return socket_path_; }

private:
    // One line out, one line back. nullopt on transport failure.
    std::optional<std::string> request(const std::string& line);

    std::string socket_path_;
    int timeout_ms_;
    int fd_ = -1;
    bool dropped_ = false;    // last request lost the connection mid-flight
    uint64_t next_id_ = 1;
    std::string last_error_;
    std::mutex mutex_;
};

} // namespace sleuth
