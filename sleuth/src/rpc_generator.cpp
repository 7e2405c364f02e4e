#include <sleuth/rpc_generator.hpp>
#include <sleuth/log.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace sleuth {

RpcGenerator::RpcGenerator()
    : RpcGenerator(default_socket_path()) {}

RpcGenerator::RpcGenerator(std::string socket_path, int timeout_ms)
    : socket_path_(std::move(socket_path)), timeout_ms_(timeout_ms) {}

RpcGenerator::~RpcGenerator() {
    disconnect();
}

bool RpcGenerator::connect() {
    if (fd_ >= 0) return true;  // Already connected

    fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        return false;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = std::string("connect(") + socket_path_ + ") failed: " + strerror(errno);
        close(fd_);
        fd_ = -1;
        return false;
    }

    return true;
}

void RpcGenerator::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

bool RpcGenerator::handshake() {
    if (!connect()) return false;

    auto ver = check_version();
    if (!ver) return false;

    if (!sleuth::version::protocol_compatible(ver->protocol_major, ver->protocol_minor)) {
        last_error_ = "Backend v" + ver->software + " speaks protocol " +
                      std::to_string(ver->protocol_major) + "." +
                      std::to_string(ver->protocol_minor) + ", client needs " +
                      std::to_string(SLEUTH_PROTOCOL_VERSION_MAJOR) + "." +
                      std::to_string(SLEUTH_PROTOCOL_VERSION_MINOR);
        disconnect();
        return false;
    }

    std::cerr << "[rpc_generator] Connected to backend v" << ver->software
              << " (protocol " << ver->protocol_major << "."
              << ver->protocol_minor << ")\n";
    return true;
}

std::optional<BackendVersion> RpcGenerator::check_version() {
    try {
        json result = call("version", json::object());
        BackendVersion ver;
        ver.software = result.value("software", "");
        ver.protocol_major = result.value("protocol_major", 0);
        ver.protocol_minor = result.value("protocol_minor", 0);
        return ver;
    } catch (const GenerationError& e) {
        last_error_ = std::string("Version check failed: ") + e.what();
        return std::nullopt;
    }
}

json RpcGenerator::generate_structured(const std::string& prompt, const json& schema) {
    json result = call("generate_structured", {{"prompt", prompt}, {"schema", schema}});
    if (!result.is_object() || !result.contains("data")) {
        throw GenerationError("generate_structured: result has no 'data'");
    }
    return result["data"];
}

std::string RpcGenerator::generate_text(const std::string& prompt, const MessageLog& history) {
    json result = call("generate_text", {{"prompt", prompt}, {"history", history_to_rpc(history)}});
    if (!result.is_object() || !result.contains("text") || !result["text"].is_string()) {
        throw GenerationError("generate_text: result has no 'text'");
    }
    return result["text"].get<std::string>();
}

json RpcGenerator::call(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t id = next_id_++;
    std::string line = json{{"jsonrpc", "2.0"}, {"id", id},
                            {"method", method}, {"params", params}}.dump();

    log_debug("rpc_generator", "-> %s (%zu bytes)", method.c_str(), line.size());

    auto response = request(line);
    if (!response && dropped_) {
        // One reconnect on a dropped connection
        log_debug("rpc_generator", "retrying %s after: %s", method.c_str(), last_error_.c_str());
        disconnect();
        response = request(line);
    }
    if (!response) {
        throw GenerationError(method + ": " + last_error_);
    }

    json reply;
    try {
        reply = json::parse(*response);
    } catch (const json::parse_error& e) {
        throw GenerationError(method + ": malformed response: " + e.what());
    }

    if (!reply.is_object()) {
        throw GenerationError(method + ": response is not an object");
    }
    if (reply.contains("error") && !reply["error"].is_null()) {
        const json& err = reply["error"];
        std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
        int code = err.is_object() ? err.value("code", 0) : 0;
        throw GenerationError(method + " failed (" + std::to_string(code) + "): " + message);
    }
    if (!reply.contains("result")) {
        throw GenerationError(method + ": response has no result");
    }
    if (reply.contains("id") && reply["id"] != json(id)) {
        throw GenerationError(method + ": response id mismatch");
    }
    return reply["result"];
}

std::optional<std::string> RpcGenerator::request(const std::string& line) {
    dropped_ = false;
    if (fd_ < 0 && !connect()) {
        return std::nullopt;
    }

    // Send request (newline-delimited)
    std::string msg = line + "\n";
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = send(fd_, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            last_error_ = std::string("send() failed: ") + strerror(errno);
            dropped_ = true;
            disconnect();
            return std::nullopt;
        }
        sent += static_cast<size_t>(n);
    }

    // Wait for response
    std::string response;
    pollfd pfd = {fd_, POLLIN, 0};

    while (true) {
        int ret = poll(&pfd, 1, timeout_ms_);

        if (ret < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("poll() failed: ") + strerror(errno);
            disconnect();
            return std::nullopt;
        }

        if (ret == 0) {
            last_error_ = "Response timeout after " + std::to_string(timeout_ms_) + "ms";
            disconnect();
            return std::nullopt;
        }

        char buf[4096];
        ssize_t n = read(fd_, buf, sizeof(buf));

        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            last_error_ = n == 0 ? "Connection closed" :
                          std::string("read() failed: ") + strerror(errno);
            dropped_ = true;
            disconnect();
            return std::nullopt;
        }

        response.append(buf, static_cast<size_t>(n));
        if (response.size() > MAX_RESPONSE_SIZE) {
            last_error_ = "Response exceeds " + std::to_string(MAX_RESPONSE_SIZE) + " bytes";
            disconnect();
            return std::nullopt;
        }

        // Check for complete message (newline)
        size_t pos = response.find('\n');
        if (pos != std::string::npos) {
            return response.substr(0, pos);
        }
    }
}

} // namespace sleuth
