//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Child-process transport implementation (newline-delimited JSON-RPC over stdio pipes)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cstring>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/ProcessTransport.hpp"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {
constexpr int kWaitTimeoutMs = 100;
constexpr std::size_t kMaxLineBytes = 16 * 1024 * 1024;
constexpr std::size_t kLogSnippetBytes = 200;

void ignoreSigpipeOnce() {
    // A child that dies while we write to its stdin must surface as EPIPE, not kill the host.
    static std::once_flag once;
    std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::string snippet(const std::string& s) {
    if (s.size() <= kLogSnippetBytes) {
        return s;
    }
    return s.substr(0, kLogSnippetBytes) + "...";
}

[[noreturn]] void startupError(const std::string& msg) {
    throw errors::HostError(errors::ErrorCategory::StartupFailure, msg);
}
} // namespace

class ProcessTransport::Impl {
public:
    struct Pending {
        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        std::chrono::steady_clock::time_point deadline;
        std::string method;
    };

    ServerConfig config;
    HostOptions options;
    std::string sessionId;

    std::atomic<bool> running{false};    // between Start and Close
    std::atomic<bool> connected{false};  // child's stdout still open
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};

    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;

    std::thread readerThread;
    std::thread writerThread;
    std::thread timeoutThread;
    std::thread stderrThread;

    mutable std::mutex requestMutex;
    std::unordered_map<int64_t, Pending> pendingRequests;
    std::atomic<int64_t> requestCounter{0};

    std::mutex writeMutex;  // protects writeQueue
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;

    std::mutex sweepMutex;
    std::condition_variable cvSweep;

    std::mutex lifecycleMutex;
    bool started{false};
    bool closed{false};

    Impl(ServerConfig cfg, HostOptions opts) : config(std::move(cfg)), options(std::move(opts)) {
        sessionId = "proc-" + config.name;
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("ProcessTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        closeFd(wakeEventFd);
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
    }

    std::chrono::milliseconds requestTimeout() const {
        if (options.requestTimeoutMs == 0) {
            return ClampedMillis(kMaxDurationMs);
        }
        return ClampedMillis(options.requestTimeoutMs);
    }

    ////////////////////////////////////////// Spawn //////////////////////////////////////////
    void spawn() {
        ignoreSigpipeOnce();

        // argv and envp are fully built before fork so the child only makes syscalls.
        std::vector<std::string> argvStrings;
        argvStrings.push_back(config.command);
        argvStrings.insert(argvStrings.end(), config.args.begin(), config.args.end());
        std::vector<char*> argv;
        argv.reserve(argvStrings.size() + 1);
        for (auto& a : argvStrings) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        std::map<std::string, std::string> envMap;
        if (options.inheritParentEnv) {
            envMap = SnapshotEnvironment();
        }
        for (const auto& [k, v] : config.env) {
            envMap[k] = v;
        }
        std::vector<std::string> envStrings;
        envStrings.reserve(envMap.size());
        for (const auto& [k, v] : envMap) {
            envStrings.push_back(k + "=" + v);
        }
        std::vector<char*> envp;
        envp.reserve(envStrings.size() + 1);
        for (auto& e : envStrings) {
            envp.push_back(e.data());
        }
        envp.push_back(nullptr);

        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int errPipe[2]{-1, -1};
        int execPipe[2]{-1, -1};
        auto closeAll = [&]() {
            for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
            int err = errno;
            closeAll();
            startupError(fmt::format("pipe() failed for MCP server '{}': {}", config.name, ::strerror(err)));
        }

        pid_t child = ::fork();
        if (child < 0) {
            int err = errno;
            closeAll();
            startupError(fmt::format("fork() failed for MCP server '{}': {}", config.name, ::strerror(err)));
        }

        if (child == 0) {
            // Own process group so shutdown can signal launchers (npx, uvx) and what they spawn.
            (void)::setpgid(0, 0);
            auto dupTo = [](int from, int to) {
                if (from == to) {
                    (void)::fcntl(to, F_SETFD, 0);
                } else {
                    (void)::dup2(from, to);
                }
            };
            dupTo(inPipe[0], STDIN_FILENO);
            dupTo(outPipe[1], STDOUT_FILENO);
            dupTo(errPipe[1], STDERR_FILENO);
            ::execvpe(argv[0], argv.data(), envp.data());
            int err = errno;
            ssize_t w;
            do {
                w = ::write(execPipe[1], &err, sizeof(err));
            } while (w < 0 && errno == EINTR);
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(execPipe[1]);

        // The exec pipe closes on a successful exec; otherwise the child reports errno through it.
        int execErr = 0;
        ssize_t r;
        do {
            r = ::read(execPipe[0], &execErr, sizeof(execErr));
        } while (r < 0 && errno == EINTR);
        closeFd(execPipe[0]);
        if (r == static_cast<ssize_t>(sizeof(execErr))) {
            int status = 0;
            (void)::waitpid(child, &status, 0);
            closeAll();
            startupError(fmt::format("Failed to start MCP server '{}' ({}): {}",
                                     config.name, config.command, ::strerror(execErr)));
        }

        pid = child;
        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        setNonBlocking(stdinFd);
        setNonBlocking(stdoutFd);
        setNonBlocking(stderrFd);
        sessionId = fmt::format("proc-{}-{}", config.name, pid);
        LOG_INFO("Started MCP server '{}' (command={} pid={})", config.name, config.command, pid);
    }

    ////////////////////////////////////////// Wake / queue //////////////////////////////////////////
    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("ProcessTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            }
            break;
        }
    }

    void enqueueLine(std::string payload) {
        payload.push_back('\n');
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            writeQueue.emplace_back(std::move(payload));
        }
        cvWrite.notify_one();
    }

    ////////////////////////////////////////// Pending requests //////////////////////////////////////////
    void failAllPending(int code, const std::string& message) {
        std::unordered_map<int64_t, Pending> drained;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            drained.swap(pendingRequests);
        }
        for (auto& [id, pending] : drained) {
            pending.promise.set_value(CreateLocalErrorResponse(JSONRPCId{id}, code, message));
        }
        if (!drained.empty()) {
            LOG_WARN("Failed {} pending request(s) to MCP server '{}': {}", drained.size(), config.name, message);
        }
    }

    void handleResponse(std::unique_ptr<JSONRPCResponse> response) {
        int64_t id = -1;
        if (std::holds_alternative<int64_t>(response->id)) {
            id = std::get<int64_t>(response->id);
        } else if (std::holds_alternative<std::string>(response->id)) {
            // Tolerate servers that echo numeric ids as strings
            const auto& s = std::get<std::string>(response->id);
            try {
                std::size_t used = 0;
                long long v = std::stoll(s, &used);
                if (used == s.size()) {
                    id = static_cast<int64_t>(v);
                }
            } catch (const std::exception&) {
                id = -1;
            }
        }

        Pending pending;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            auto it = pendingRequests.find(id);
            if (it == pendingRequests.end()) {
                LOG_WARN("MCP server '{}' answered unknown or expired request id {}", config.name, IdToString(response->id));
                return;
            }
            pending = std::move(it->second);
            pendingRequests.erase(it);
        }
        pending.promise.set_value(std::move(response));
    }

    void processLine(const std::string& line) {
        LOG_DEBUG("[{}] <- {}", config.name, snippet(line));
        IncomingMessage msg = ClassifyMessage(line);
        switch (msg.kind) {
            case IncomingMessage::Kind::Response:
                handleResponse(std::move(msg.response));
                break;
            case IncomingMessage::Kind::Notification:
                LOG_DEBUG("Notification from MCP server '{}': {}", config.name, msg.notification->method);
                if (notificationHandler) {
                    notificationHandler(std::move(msg.notification));
                }
                break;
            case IncomingMessage::Kind::Request: {
                // Server-initiated requests (sampling, roots) are not offered in our capabilities.
                LOG_WARN("MCP server '{}' sent unsupported request '{}'", config.name, msg.request->method);
                auto resp = CreateErrorResponse(msg.request->id, JSONRPCErrorCodes::MethodNotFound,
                                                "Method not supported by host: " + msg.request->method);
                enqueueLine(resp->Serialize());
                break;
            }
            case IncomingMessage::Kind::Invalid:
                LOG_WARN("Skipping malformed line from MCP server '{}': {} ({})", config.name, snippet(line), msg.error);
                break;
        }
    }

    ////////////////////////////////////////// Threads //////////////////////////////////////////
    void startReader() {
        readerThread = std::thread([this]() {
            std::string buffer;
            std::vector<char> tmp(8192);
            bool eof = false;

            int ep = ::epoll_create1(EPOLL_CLOEXEC);
            if (ep < 0) {
                LOG_ERROR("ProcessTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
                connected = false;
                return;
            }
            epoll_event evIn{};
            evIn.events = EPOLLIN | EPOLLRDHUP;
            evIn.data.fd = stdoutFd;
            (void)::epoll_ctl(ep, EPOLL_CTL_ADD, stdoutFd, &evIn);
            if (wakeEventFd >= 0) {
                epoll_event evWake{};
                evWake.events = EPOLLIN;
                evWake.data.fd = wakeEventFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
            }

            while (running && !eof) {
                epoll_event events[2];
                int rc = ::epoll_wait(ep, events, 2, kWaitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("ProcessTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                    break;
                }
                bool readable = false;
                for (int i = 0; i < rc; ++i) {
                    if (events[i].data.fd == stdoutFd) {
                        readable = true;
                    } else {
                        uint64_t v = 0;
                        ssize_t r;
                        do {
                            r = ::read(wakeEventFd, &v, sizeof(v));
                        } while (r < 0 && errno == EINTR);
                    }
                }
                if (!running) {
                    break;
                }
                if (!readable) {
                    continue;
                }

                // Drain everything available; HUP still leaves buffered bytes to read.
                for (;;) {
                    ssize_t n = ::read(stdoutFd, tmp.data(), tmp.size());
                    if (n > 0) {
                        buffer.append(tmp.data(), static_cast<std::size_t>(n));
                        continue;
                    }
                    if (n == 0) {
                        eof = true;
                        break;
                    }
                    if (errno == EINTR) {
                        continue;
                    }
                    if (errno != EAGAIN && errno != EWOULDBLOCK) {
                        LOG_ERROR("ProcessTransport: read error from '{}' (errno={} msg={})", config.name, errno, ::strerror(errno));
                        eof = true;
                    }
                    break;
                }

                std::size_t pos;
                while ((pos = buffer.find('\n')) != std::string::npos) {
                    std::string line = buffer.substr(0, pos);
                    buffer.erase(0, pos + 1);
                    if (!line.empty() && line.back() == '\r') {
                        line.pop_back();
                    }
                    if (!line.empty()) {
                        processLine(line);
                    }
                }
                if (buffer.size() > kMaxLineBytes) {
                    LOG_WARN("Dropping {} bytes without newline from MCP server '{}'", buffer.size(), config.name);
                    buffer.clear();
                }
                if (eof && !buffer.empty()) {
                    processLine(buffer);
                    buffer.clear();
                }
            }
            ::close(ep);

            connected = false;
            if (eof) {
                LOG_WARN("MCP server '{}' closed its output stream (pid {})", config.name, pid);
                if (errorHandler) {
                    errorHandler("ProcessTransport: stdout closed");
                }
                if (options.failPendingOnExit) {
                    failAllPending(JSONRPCErrorCodes::ConnectionClosed,
                                   fmt::format("MCP server '{}' connection closed", config.name));
                }
            }
        });
    }

    bool writeAll(const std::string& data) {
        std::size_t total = 0;
        while (total < data.size()) {
            ssize_t w = ::write(stdinFd, data.data() + total, data.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (!running) {
                    return false;
                }
                pollfd p{stdinFd, POLLOUT, 0};
                (void)::poll(&p, 1, kWaitTimeoutMs);
                continue;
            }
            LOG_WARN("Write to MCP server '{}' failed (errno={} msg={})", config.name, errno, ::strerror(errno));
            if (errorHandler) {
                errorHandler("ProcessTransport: write failed");
            }
            return false;
        }
        return true;
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            while (true) {
                std::string line;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, [&] { return !running || !writeQueue.empty(); });
                    if (!running) {
                        break;
                    }
                    line = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                LOG_DEBUG("[{}] -> {}", config.name, snippet(line.substr(0, line.size() - 1)));
                if (!writeAll(line)) {
                    // stdin is gone; the requests behind these lines are left to their deadlines.
                    std::lock_guard<std::mutex> lk(writeMutex);
                    writeQueue.clear();
                }
            }
        });
    }

    void startTimeouts() {
        timeoutThread = std::thread([this]() {
            using clock = std::chrono::steady_clock;
            while (running) {
                std::vector<std::pair<int64_t, Pending>> expired;
                auto now = clock::now();
                {
                    std::lock_guard<std::mutex> lock(requestMutex);
                    for (auto it = pendingRequests.begin(); it != pendingRequests.end();) {
                        if (it->second.deadline <= now) {
                            expired.emplace_back(it->first, std::move(it->second));
                            it = pendingRequests.erase(it);
                        } else {
                            ++it;
                        }
                    }
                }
                for (auto& [id, pending] : expired) {
                    const std::string msg = fmt::format("MCP request {} timed out after {} ms",
                                                        pending.method, options.requestTimeoutMs);
                    LOG_WARN("{} (server '{}', id {})", msg, config.name, id);
                    pending.promise.set_value(CreateLocalErrorResponse(JSONRPCId{id}, JSONRPCErrorCodes::RequestTimeout, msg));
                    if (options.notifyCancelOnTimeout && connected) {
                        JSONValue::Object params;
                        params["requestId"] = MakeJSON(id);
                        params["reason"] = MakeJSON(msg);
                        JSONRPCNotification note(Methods::Cancelled, JSONValue(std::move(params)));
                        enqueueLine(note.Serialize());
                    }
                }
                std::unique_lock<std::mutex> lk(sweepMutex);
                cvSweep.wait_for(lk, std::chrono::milliseconds(50), [&] { return !running; });
            }
        });
    }

    void startStderrDrain() {
        stderrThread = std::thread([this]() {
            std::string buffer;
            std::vector<char> tmp(4096);
            while (running) {
                pollfd p{stderrFd, POLLIN, 0};
                int rc = ::poll(&p, 1, kWaitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    break;
                }
                if (rc == 0) {
                    continue;
                }
                ssize_t n = ::read(stderrFd, tmp.data(), tmp.size());
                if (n > 0) {
                    buffer.append(tmp.data(), static_cast<std::size_t>(n));
                    std::size_t pos;
                    while ((pos = buffer.find('\n')) != std::string::npos) {
                        LOG_DEBUG("[{} stderr] {}", config.name, buffer.substr(0, pos));
                        buffer.erase(0, pos + 1);
                    }
                    if (buffer.size() > 64 * 1024) {
                        buffer.clear();
                    }
                    continue;
                }
                if (n == 0) {
                    break;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    break;
                }
            }
            if (!buffer.empty()) {
                LOG_DEBUG("[{} stderr] {}", config.name, buffer);
            }
        });
    }

    ////////////////////////////////////////// Shutdown //////////////////////////////////////////
    // true once the child has been reaped (or was never ours to reap)
    bool waitForExit(std::chrono::milliseconds budget) {
        auto deadline = std::chrono::steady_clock::now() + budget;
        for (;;) {
            int status = 0;
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                if (WIFEXITED(status)) {
                    LOG_INFO("MCP server '{}' (pid {}) exited with status {}", config.name, pid, WEXITSTATUS(status));
                } else if (WIFSIGNALED(status)) {
                    LOG_INFO("MCP server '{}' (pid {}) terminated by signal {}", config.name, pid, WTERMSIG(status));
                }
                return true;
            }
            if (r < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno != ECHILD) {
                    LOG_WARN("waitpid failed for MCP server '{}' (errno={} msg={})", config.name, errno, ::strerror(errno));
                }
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    void signalChild(int sig) {
        if (::kill(-pid, sig) != 0 && ::kill(pid, sig) != 0 && errno != ESRCH) {
            LOG_WARN("kill({}, {}) failed for MCP server '{}' (errno={} msg={})", pid, sig, config.name, errno, ::strerror(errno));
        }
    }

    void reapChild() {
        if (pid <= 0) {
            return;
        }
        if (waitForExit(ClampedMillis(options.shutdownTimeoutMs))) {
            return;
        }
        LOG_WARN("MCP server '{}' (pid {}) did not exit within {} ms; sending SIGTERM", config.name, pid, options.shutdownTimeoutMs);
        signalChild(SIGTERM);
        if (waitForExit(std::chrono::milliseconds(1000))) {
            return;
        }
        LOG_WARN("MCP server '{}' (pid {}) ignored SIGTERM; sending SIGKILL", config.name, pid);
        signalChild(SIGKILL);
        if (!waitForExit(std::chrono::milliseconds(5000))) {
            LOG_ERROR("MCP server '{}' (pid {}) could not be reaped", config.name, pid);
        }
    }

    void joinAll() {
        running = false;
        wake();
        cvWrite.notify_all();
        cvSweep.notify_all();
        if (readerThread.joinable()) readerThread.join();
        if (writerThread.joinable()) writerThread.join();
        if (timeoutThread.joinable()) timeoutThread.join();
    }
};

ProcessTransport::ProcessTransport(ServerConfig config, HostOptions options)
    : pImpl(std::make_unique<Impl>(std::move(config), std::move(options))) {
    FUNC_SCOPE();
}

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    Close().wait();
}

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    {
        std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
        if (pImpl->started || pImpl->closed) {
            promise.set_exception(std::make_exception_ptr(errors::HostError(
                errors::ErrorCategory::StartupFailure, "ProcessTransport already started or closed")));
            return fut;
        }
        pImpl->started = true;
    }
    try {
        pImpl->spawn();
    } catch (const errors::HostError& e) {
        LOG_ERROR("{}", e.what());
        promise.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running = true;
    pImpl->connected = true;
    pImpl->startReader();
    pImpl->startWriter();
    pImpl->startTimeouts();
    pImpl->startStderrDrain();
    promise.set_value();
    return fut;
}

std::future<void> ProcessTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    {
        std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
        if (pImpl->closed) {
            done.set_value();
            return fut;
        }
        pImpl->closed = true;
    }
    if (pImpl->pid > 0) {
        LOG_INFO("Stopping MCP server '{}' (pid {})", pImpl->config.name, pImpl->pid);
    }

    // Reader, writer and sweeper first; then EOF on the child's stdin so it can exit on its own.
    pImpl->joinAll();
    closeFd(pImpl->stdinFd);
    pImpl->reapChild();
    if (pImpl->stderrThread.joinable()) {
        pImpl->stderrThread.join();
    }
    pImpl->failAllPending(JSONRPCErrorCodes::ConnectionClosed,
                          fmt::format("MCP server '{}' transport closed", pImpl->config.name));
    closeFd(pImpl->stdoutFd);
    closeFd(pImpl->stderrFd);
    pImpl->connected = false;
    done.set_value();
    return fut;
}

bool ProcessTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }
std::string ProcessTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }
int ProcessTransport::GetProcessId() const { return static_cast<int>(pImpl->pid); }

std::size_t ProcessTransport::PendingRequestCount() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

std::future<std::unique_ptr<JSONRPCResponse>> ProcessTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();

    const int64_t id = ++pImpl->requestCounter;
    request->id = id;
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        // Checked under the lock so a concurrent stream close either sees this entry or we see it closed.
        if (!pImpl->running || !pImpl->connected) {
            LOG_DEBUG("ProcessTransport: {} on closed transport '{}'", request->method, pImpl->config.name);
            promise.set_value(CreateLocalErrorResponse(request->id, JSONRPCErrorCodes::ConnectionClosed,
                fmt::format("MCP server '{}' connection closed", pImpl->config.name)));
            return future;
        }
        Impl::Pending pending;
        pending.promise = std::move(promise);
        pending.deadline = std::chrono::steady_clock::now() + pImpl->requestTimeout();
        pending.method = request->method;
        pImpl->pendingRequests.emplace(id, std::move(pending));
    }
    pImpl->enqueueLine(request->Serialize());
    return future;
}

std::future<void> ProcessTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (!pImpl->running || !pImpl->connected) {
        promise.set_exception(std::make_exception_ptr(errors::HostError(
            errors::ErrorCategory::ConnectionClosed,
            fmt::format("MCP server '{}' connection closed", pImpl->config.name),
            JSONRPCErrorCodes::ConnectionClosed)));
        return fut;
    }
    pImpl->enqueueLine(notification->Serialize());
    promise.set_value();
    return fut;
}

void ProcessTransport::SetNotificationHandler(NotificationHandler handler) { FUNC_SCOPE(); pImpl->notificationHandler = std::move(handler); }
void ProcessTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }

std::unique_ptr<ITransport> ProcessTransportFactory::CreateTransport(const ServerConfig& config,
                                                                     const HostOptions& options) {
    return std::make_unique<ProcessTransport>(config, options);
}

} // namespace mcphost
