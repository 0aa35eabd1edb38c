//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements language-server child processes over POSIX pipes.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/ServerProcess.h"

#include "codeintel/LSP/Error.h"
#include "codeintel/Support/Log.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <map>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

extern char** environ;

namespace codeintel::lsp
{
namespace
{

constexpr auto TerminateGracePeriod = std::chrono::milliseconds(200);
constexpr auto ReapPollInterval     = std::chrono::milliseconds(10);
constexpr int  StderrPollMillis     = 100;

/// Parent environment overlaid with `overrides`, as `KEY=VALUE` strings.
std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides)
{
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry)
    {
        llvm::StringRef text(*entry);
        const auto [key, value] = text.split('=');
        merged.insert_or_assign(key.str(), value.str());
    }
    for (const auto& [key, value] : overrides)
    {
        merged.insert_or_assign(key, value);
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged)
    {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> toArgv(std::vector<std::string>& strings)
{
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1U);
    for (std::string& text : strings)
    {
        argv.push_back(text.data());
    }
    argv.push_back(nullptr);
    return argv;
}

llvm::Error spawnError(const ServerConfig& config, const llvm::Twine& cause)
{
    return makeLspError(ErrorKind::SpawnFailure,
                        "failed to start " + llvm::Twine(config.language) + " server '" + config.command +
                            "': " + cause);
}

}  // namespace

void ignoreBrokenPipeSignal()
{
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

llvm::Expected<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const ServerConfig& config)
{
    ignoreBrokenPipeSignal();

    UniqueFd stdinRead;
    UniqueFd stdinWrite;
    UniqueFd stdoutRead;
    UniqueFd stdoutWrite;
    UniqueFd stderrRead;
    UniqueFd stderrWrite;
    if (!makePipe(stdinRead, stdinWrite) || !makePipe(stdoutRead, stdoutWrite) || !makePipe(stderrRead, stderrWrite))
    {
        return spawnError(config, llvm::Twine("pipe: ") + std::strerror(errno));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinRead.get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutWrite.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrWrite.get(), STDERR_FILENO);

    // A dedicated process group lets terminate() reach helper processes the
    // server forks, which would otherwise keep the pipes open.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    std::vector<std::string> argvStrings;
    argvStrings.reserve(config.args.size() + 1U);
    argvStrings.push_back(config.command);
    argvStrings.insert(argvStrings.end(), config.args.begin(), config.args.end());
    std::vector<std::string> envStrings = buildEnvironment(config.env);
    std::vector<char*>       argv       = toArgv(argvStrings);
    std::vector<char*>       envp       = toArgv(envStrings);

    pid_t     pid    = -1;
    const int status = ::posix_spawnp(&pid, config.command.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);
    if (status != 0)
    {
        return spawnError(config, std::strerror(status));
    }

    // Child-side ends belong to the child now.
    stdinRead.reset();
    stdoutWrite.reset();
    stderrWrite.reset();

    logInfo(config.language, "started '" + llvm::Twine(config.command) + "' (pid " + llvm::Twine(pid) + ")");
    return std::unique_ptr<ChildProcess>(new ChildProcess(config.language,
                                                          pid,
                                                          std::move(stdinWrite),
                                                          std::move(stdoutRead),
                                                          std::move(stderrRead)));
}

ChildProcess::ChildProcess(std::string language,
                           const pid_t pid,
                           UniqueFd    stdinWrite,
                           UniqueFd    stdoutRead,
                           UniqueFd    stderrRead)
    : language_(std::move(language))
    , pid_(pid)
    , stdin_(std::move(stdinWrite))
    , stdout_(std::move(stdoutRead))
{
    stderrThread_ = std::thread([this, fd = std::move(stderrRead)]() mutable { drainStderr(std::move(fd)); });
}

ChildProcess::~ChildProcess()
{
    terminate();
    closeInput();
}

std::ostream& ChildProcess::input()
{
    return stdin_;
}

std::istream& ChildProcess::output()
{
    return stdout_;
}

void ChildProcess::closeInput()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (inputClosed_)
    {
        return;
    }
    inputClosed_ = true;
    stdin_.close();
}

void ChildProcess::terminate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_)
    {
        return;
    }
    terminated_ = true;

    if (!exitedLocked())
    {
        ::kill(-pid_, SIGTERM);
        const auto deadline = std::chrono::steady_clock::now() + TerminateGracePeriod;
        while (!exitedLocked() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(ReapPollInterval);
        }
        if (!exitedLocked())
        {
            logDebug(language_, "server ignored SIGTERM, sending SIGKILL");
        }
    }
    if (!exitStatus_)
    {
        // Helpers may outlive the server itself. The unreaped leader keeps the
        // group id from being reused until it is reaped here.
        ::kill(-pid_, SIGKILL);
        reapLocked(0);
    }

    stderrStopping_.store(true);
    if (stderrThread_.joinable())
    {
        stderrThread_.join();
    }
}

std::optional<pid_t> ChildProcess::processId() const
{
    return pid_;
}

std::optional<int> ChildProcess::exitStatus() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return exitStatus_;
}

bool ChildProcess::exitedLocked()
{
    if (exitStatus_)
    {
        return true;
    }
    siginfo_t info{};
    int       result = -1;
    do
    {
        result = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (result < 0 && errno == EINTR);
    if (result < 0)
    {
        // ECHILD: already reaped elsewhere, so the group id is no longer ours.
        exitStatus_ = -1;
        return true;
    }
    return info.si_pid == pid_;
}

bool ChildProcess::reapLocked(const int options)
{
    if (exitStatus_)
    {
        return true;
    }
    int   status = 0;
    pid_t result = -1;
    do
    {
        result = ::waitpid(pid_, &status, options);
    } while (result < 0 && errno == EINTR);

    if (result == pid_)
    {
        exitStatus_ = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        logInfo(language_, "server exited with status " + llvm::Twine(*exitStatus_));
        return true;
    }
    if (result < 0)
    {
        // ECHILD: already reaped elsewhere; nothing left to wait for.
        exitStatus_ = -1;
        return true;
    }
    return false;
}

void ChildProcess::drainStderr(UniqueFd stderrRead)
{
    std::string pending;
    char        buffer[1024];
    while (true)
    {
        pollfd descriptor{stderrRead.get(), POLLIN, 0};
        const int ready = ::poll(&descriptor, 1, StderrPollMillis);
        if (ready < 0 && errno != EINTR)
        {
            break;
        }
        if (ready <= 0)
        {
            if (stderrStopping_.load())
            {
                break;
            }
            continue;
        }

        const ssize_t count = ::read(stderrRead.get(), buffer, sizeof(buffer));
        if (count < 0 && errno == EINTR)
        {
            continue;
        }
        if (count <= 0)
        {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(count));

        std::size_t newline = pending.find('\n');
        while (newline != std::string::npos)
        {
            llvm::StringRef line = llvm::StringRef(pending).take_front(newline).rtrim();
            if (!line.empty())
            {
                logDebug(language_, "stderr: " + line);
            }
            pending.erase(0, newline + 1U);
            newline = pending.find('\n');
        }
    }
    if (!llvm::StringRef(pending).trim().empty())
    {
        logDebug(language_, "stderr: " + llvm::StringRef(pending).rtrim());
    }
}

}  // namespace codeintel::lsp
