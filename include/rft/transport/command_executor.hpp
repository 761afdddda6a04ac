#pragma once

#include "rft/core/result.hpp"

#include <string>

namespace rft::transport {

/**
 * @brief Output of one remote command or script
 */
struct CommandOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

/**
 * @brief Remote command channel the transfer engine runs on
 *
 * Implementations wrap a concrete remote shell (WinRM, SSH, ...). The engine
 * only needs an open/close session pair and the two run primitives.
 * Any transport-level failure (connection loss, authentication, abort) is
 * returned as an Error with ErrorKind::Transport; a command that ran but
 * failed is returned as a successful CommandOutput with a non-zero exit code.
 */
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    virtual Result<void> open() = 0;
    virtual void close() = 0;

    virtual Result<CommandOutput> run_cmd(const std::string& command) = 0;
    virtual Result<CommandOutput> run_powershell_script(const std::string& script) = 0;
};

/**
 * @brief Keeps a CommandExecutor session open for the lifetime of the guard
 */
class ExecutorSession {
public:
    explicit ExecutorSession(CommandExecutor& executor) : executor_(&executor) {}
    ~ExecutorSession() { close(); }

    ExecutorSession(const ExecutorSession&) = delete;
    ExecutorSession& operator=(const ExecutorSession&) = delete;

    Result<void> open();
    void close();

    [[nodiscard]] bool is_open() const noexcept { return open_; }

private:
    CommandExecutor* executor_;
    bool open_ = false;
};

} // namespace rft::transport
