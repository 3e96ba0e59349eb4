#include "btrmig/io_utils.hpp"

#include <sys/wait.h>  // for waitpid
#include <unistd.h>    // for execvp, fork, pipe, dup2

#include <cerrno>   // for errno
#include <cstddef>  // for size_t
#include <cstdint>  // for int32_t
#include <cstdlib>  // for getenv
#include <cstring>  // for strerror

#include <algorithm>  // for transform
#include <array>      // for array
#include <iterator>   // for back_inserter

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// Forks and executes vec, optionally wiring stdin/stdout to the given fds.
// Returns child pid or -1.
auto spawn_child(const std::vector<std::string>& vec, int stdin_fd, int stdout_fd, int close_fd) noexcept -> pid_t {
    if (vec.empty()) {
        return -1;
    }

    const auto pid = fork();
    if (pid == 0) {
        if (stdin_fd >= 0) {
            dup2(stdin_fd, STDIN_FILENO);
            close(stdin_fd);
        }
        if (stdout_fd >= 0) {
            dup2(stdout_fd, STDOUT_FILENO);
            close(stdout_fd);
        }
        if (close_fd >= 0) {
            close(close_fd);
        }

        std::vector<char*> args;
        std::transform(vec.cbegin(), vec.cend(), std::back_inserter(args),
            [=](const std::string& arg) -> char* { return const_cast<char*>(arg.data()); });
        args.push_back(nullptr);

        char** command = args.data();
        execvp(command[0], command);
        _exit(127);
    }
    return pid;
}

auto wait_child(pid_t pid) noexcept -> std::int32_t {
    std::int32_t status{};
    do {
        if (waitpid(pid, &status, 0) < 0) {
            return -1;
        }
    } while ((!WIFEXITED(status)) && (!WIFSIGNALED(status)));

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return WEXITSTATUS(status);
}

}  // namespace

namespace btrmig::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto exec(const std::vector<std::string>& vec) noexcept -> bool {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    const bool dirty_cmd_run = utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd := {}", vec);
    }
    if (dirty_cmd_run) {
        return true;
    }

    const auto pid = spawn_child(vec, -1, -1, -1);
    if (pid < 0) {
        spdlog::error("[exec] failed to spawn {}: {}", vec, std::strerror(errno));
        return false;
    }

    const auto ret_code = wait_child(pid);
    if (ret_code != 0) {
        spdlog::debug("[exec] {} exited with {}", vec, ret_code);
    }
    return ret_code == 0;
}

auto exec_capture(const std::vector<std::string>& vec) noexcept -> std::string {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec_capture] cmd := {}", vec);
    }

    std::array<int, 2> pipe_fds{-1, -1};
    if (pipe(pipe_fds.data()) != 0) {
        spdlog::error("[exec_capture] pipe failed: {}", std::strerror(errno));
        return {};
    }
    const auto [read_fd, write_fd] = pipe_fds;

    const auto pid = spawn_child(vec, -1, write_fd, read_fd);
    close(write_fd);
    if (pid < 0) {
        spdlog::error("[exec_capture] failed to spawn {}: {}", vec, std::strerror(errno));
        close(read_fd);
        return {};
    }

    std::string result{};
    std::array<char, 128> buffer{};
    ssize_t count{};
    while ((count = read(read_fd, buffer.data(), buffer.size())) != 0) {
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[exec_capture] read from {} failed: {}", vec, std::strerror(errno));
            break;
        }
        result.append(buffer.data(), static_cast<std::size_t>(count));
    }
    close(read_fd);

    const auto ret_code = wait_child(pid);
    if (ret_code != 0) {
        spdlog::debug("[exec_capture] {} exited with {}", vec, ret_code);
    }

    if (result.ends_with('\n')) {
        result.pop_back();
    }
    return result;
}

auto exec_pipeline(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs) noexcept -> bool {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    const bool dirty_cmd_run = utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec_pipeline] cmd := {} | {}", lhs, rhs);
    }
    if (dirty_cmd_run) {
        return true;
    }

    std::array<int, 2> pipe_fds{-1, -1};
    if (pipe(pipe_fds.data()) != 0) {
        spdlog::error("[exec_pipeline] pipe failed: {}", std::strerror(errno));
        return false;
    }
    const auto [read_fd, write_fd] = pipe_fds;

    const auto producer = spawn_child(lhs, -1, write_fd, read_fd);
    if (producer < 0) {
        spdlog::error("[exec_pipeline] failed to spawn {}: {}", lhs, std::strerror(errno));
        close(read_fd);
        close(write_fd);
        return false;
    }
    const auto consumer = spawn_child(rhs, read_fd, -1, write_fd);

    // parent must drop both ends, otherwise consumer never sees EOF
    close(read_fd);
    close(write_fd);

    if (consumer < 0) {
        spdlog::error("[exec_pipeline] failed to spawn {}: {}", rhs, std::strerror(errno));
        const auto producer_status = wait_child(producer);
        spdlog::debug("[exec_pipeline] reaped producer with {}", producer_status);
        return false;
    }

    const auto producer_status = wait_child(producer);
    const auto consumer_status = wait_child(consumer);
    if (producer_status != 0 || consumer_status != 0) {
        spdlog::error("[exec_pipeline] '{}' exited with {}, '{}' exited with {}", fmt::join(lhs, " "), producer_status, fmt::join(rhs, " "), consumer_status);
        return false;
    }
    return true;
}

}  // namespace btrmig::utils
