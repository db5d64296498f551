/// Echo tool server: a scriptable stdio tool server for the demo and the
/// integration tests. Speaks newline-delimited JSON on stdin/stdout and logs
/// to stderr.
/// Usage: ./echo_tool_server [options]
///   --models=a,b              models advertised in the capability reply
///   --capability-style=S      "id" (reply to the request id) or "typed"
///                             ({"type":"capability_response"})
///   --no-capabilities         never answer the capability request
///   --capability-delay-ms=N   answer the capability request after N ms
///   --unrelated-first         send a notification before the capability reply
///   --banner                  print a startup message before any request
///   --heartbeat-ms=N          emit {"type":"heartbeat"} every N ms
///   --stderr-on-start         write diagnostics to stderr at startup
///   --error-on=METHOD         answer METHOD with error code -1
///   --ignore=METHOD           never answer METHOD
///   --reverse-batch=N         hold N requests, then answer newest first
///   --exit-after-ms=N         exit N ms after startup
///   --exit-on=METHOD          exit when METHOD arrives
///   --exit-code=K             status for the two exit options (default 0)
///   --ignore-sigterm          survive SIGTERM

#include <mcphost/codec.hpp>
#include <mcphost/line_framer.hpp>
#include <mcphost/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using mcphost::Codec;
using mcphost::RequestMessage;
using mcphost::ResponseMessage;

namespace {

struct Options {
    std::vector<std::string> models{"echo-1"};
    bool typed_capabilities = false;
    bool answer_capabilities = true;
    std::chrono::milliseconds capability_delay{0};
    bool unrelated_first = false;
    bool banner = false;
    std::optional<std::chrono::milliseconds> heartbeat;
    bool stderr_on_start = false;
    std::set<std::string> error_on;
    std::set<std::string> ignore;
    std::size_t reverse_batch = 0;
    std::optional<std::chrono::milliseconds> exit_after;
    std::set<std::string> exit_on;
    int exit_code = 0;
    bool ignore_sigterm = false;
};

struct Outgoing {
    Clock::time_point due;
    std::string line;
};

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto eq = arg.find('=');
        std::string key = arg.substr(0, eq);
        std::string value = eq == std::string::npos ? std::string() : arg.substr(eq + 1);

        if (key == "--models") opts.models = split(value, ',');
        else if (key == "--capability-style") opts.typed_capabilities = (value == "typed");
        else if (key == "--no-capabilities") opts.answer_capabilities = false;
        else if (key == "--capability-delay-ms") opts.capability_delay = std::chrono::milliseconds(std::stoi(value));
        else if (key == "--unrelated-first") opts.unrelated_first = true;
        else if (key == "--banner") opts.banner = true;
        else if (key == "--heartbeat-ms") opts.heartbeat = std::chrono::milliseconds(std::stoi(value));
        else if (key == "--stderr-on-start") opts.stderr_on_start = true;
        else if (key == "--error-on") opts.error_on.insert(value);
        else if (key == "--ignore") opts.ignore.insert(value);
        else if (key == "--reverse-batch") opts.reverse_batch = static_cast<std::size_t>(std::stoi(value));
        else if (key == "--exit-after-ms") opts.exit_after = std::chrono::milliseconds(std::stoi(value));
        else if (key == "--exit-on") opts.exit_on.insert(value);
        else if (key == "--exit-code") opts.exit_code = std::stoi(value);
        else if (key == "--ignore-sigterm") opts.ignore_sigterm = true;
        else spdlog::warn("Unknown option: {}", arg);
    }
    return opts;
}

void emit(const std::string& line) {
    std::cout << line << '\n' << std::flush;
}

class EchoToolServer {
public:
    explicit EchoToolServer(Options opts) : opts_(std::move(opts)) {}

    int run() {
        auto started = Clock::now();
        auto next_heartbeat = opts_.heartbeat ? started + *opts_.heartbeat : Clock::time_point::max();
        auto exit_at = opts_.exit_after ? started + *opts_.exit_after : Clock::time_point::max();

        if (opts_.stderr_on_start) {
            spdlog::warn("echo_tool_server starting up");
            spdlog::info("loading models: {}", opts_.models.size());
        }
        if (opts_.banner) {
            emit(nlohmann::json{{"type", "startup"}, {"status", "ready"}, {"models", opts_.models}}.dump());
        }

        mcphost::LineFramer framer;
        char chunk[4096];
        while (true) {
            auto now = Clock::now();
            if (now >= exit_at) return opts_.exit_code;
            flush_due(now);
            if (now >= next_heartbeat) {
                emit(nlohmann::json{{"type", "heartbeat"}, {"models", opts_.models}}.dump());
                next_heartbeat = now + *opts_.heartbeat;
            }

            auto wake = std::min({exit_at, next_heartbeat, next_due()});
            int timeout = -1;
            if (wake != Clock::time_point::max()) {
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(wake - now).count();
                timeout = static_cast<int>(std::max<long long>(ms, 0));
            }

            struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
            int ret = ::poll(&pfd, 1, timeout);
            if (ret < 0) {
                if (errno == EINTR) continue;
                return 1;
            }
            if (ret == 0) continue;

            ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR) continue;
                return 1;
            }
            if (n == 0) return 0;   // host closed stdin

            for (const auto& line : framer.append(std::string_view(chunk, static_cast<size_t>(n)))) {
                if (auto code = handle_line(line)) return *code;
            }
        }
    }

private:
    Clock::time_point next_due() const {
        auto due = Clock::time_point::max();
        for (const auto& o : outgoing_) due = std::min(due, o.due);
        return due;
    }

    void flush_due(Clock::time_point now) {
        std::stable_sort(outgoing_.begin(), outgoing_.end(),
                         [](const Outgoing& a, const Outgoing& b) { return a.due < b.due; });
        auto it = outgoing_.begin();
        for (; it != outgoing_.end() && it->due <= now; ++it) emit(it->line);
        outgoing_.erase(outgoing_.begin(), it);
    }

    void send_later(std::string line, std::chrono::milliseconds delay) {
        outgoing_.push_back({Clock::now() + delay, std::move(line)});
    }

    nlohmann::json capability_result() const {
        return {
            {"models", opts_.models},
            {"capabilities", nlohmann::json::array({
                {{"name", "echo"}, {"description", "Return the params unchanged"},
                 {"inputSchema", {{"type", "object"}}}},
                {{"name", "search"}, {"description", "Search nothing, find nothing"},
                 {"inputSchema", {{"type", "object"},
                                  {"properties", {{"q", {{"type", "string"}}}}}}}}
            })},
            {"contextTypes", {"text"}}
        };
    }

    std::optional<int> handle_line(const std::string& line) {
        mcphost::InboundMessage msg;
        try {
            msg = Codec::parse(line);
        } catch (const mcphost::ParseError& e) {
            spdlog::warn("Ignoring bad input: {}", e.what());
            return std::nullopt;
        }
        auto* req = std::get_if<RequestMessage>(&msg);
        if (!req) return std::nullopt;

        if (opts_.exit_on.count(req->method)) return opts_.exit_code;
        if (opts_.ignore.count(req->method)) return std::nullopt;

        if (req->method == mcphost::CAPABILITY_METHOD) {
            if (!opts_.answer_capabilities) return std::nullopt;
            if (opts_.unrelated_first) {
                emit(nlohmann::json{{"jsonrpc", "2.0"}, {"method", "notifications/message"},
                                    {"params", {{"level", "info"}, {"data", "warming up"}}}}.dump());
            }
            std::string reply;
            if (opts_.typed_capabilities) {
                reply = Codec::serialize(mcphost::InboundMessage{
                    mcphost::CapabilityResponseMessage{req->id, capability_result()}});
            } else {
                reply = Codec::serialize(ResponseMessage{req->id, capability_result(), std::nullopt});
            }
            send_later(std::move(reply), opts_.capability_delay);
            return std::nullopt;
        }

        ResponseMessage resp{req->id, std::nullopt, std::nullopt};
        std::chrono::milliseconds delay{0};
        auto params = req->params.value_or(nlohmann::json::object());
        if (opts_.error_on.count(req->method)) {
            resp.error = mcphost::RpcErrorInfo{-1, req->method + " failed", nlohmann::json{{"method", req->method}}};
        } else if (req->method == "echo") {
            resp.result = params;
        } else if (req->method == "search") {
            resp.result = {{"hits", nlohmann::json::array()}};
        } else if (req->method == "ping") {
            resp.result = nlohmann::json::object();
        } else if (req->method == "sleep") {
            delay = std::chrono::milliseconds(params.value("ms", 0));
            resp.result = {{"slept", delay.count()}};
        } else {
            resp.error = mcphost::RpcErrorInfo{mcphost::error::MethodNotFound,
                                               "Method not found: " + req->method, std::nullopt};
        }

        std::string reply = Codec::serialize(resp);
        if (opts_.reverse_batch > 1) {
            held_.push_back(std::move(reply));
            if (held_.size() >= opts_.reverse_batch) {
                for (auto it = held_.rbegin(); it != held_.rend(); ++it) emit(*it);
                held_.clear();
            }
            return std::nullopt;
        }
        send_later(std::move(reply), delay);
        return std::nullopt;
    }

    Options opts_;
    std::vector<Outgoing> outgoing_;
    std::vector<std::string> held_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    // stdout carries the protocol; logs go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("echo_tool_server"));

    Options opts = parse_args(argc, argv);
    if (opts.ignore_sigterm) std::signal(SIGTERM, SIG_IGN);

    EchoToolServer server{std::move(opts)};
    return server.run();
}
