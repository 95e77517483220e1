// cargo.cpp - Running cargo and reading its JSON message stream
// Part of rustimport - on-demand native extension builds

#include "core/cargo.hpp"
#include "config/json_parser.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <sys/types.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string_view>
#include <algorithm>

namespace rustimport {

namespace {

bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;  // File doesn't exist
    }
    if (!S_ISREG(st.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Hand every complete line in `buffer` to the handler, keeping the tail.
void flush_lines(std::string& buffer, const CargoMessageHandler& handler,
                 CargoInvoker::BuildResult& result) {
    size_t start = 0;
    size_t eol;
    while ((eol = buffer.find('\n', start)) != std::string::npos) {
        handler.handle_line(buffer.substr(start, eol - start), result);
        start = eol + 1;
    }
    buffer.erase(0, start);
}

} // namespace

std::optional<std::string> find_executable_in_path(const std::string& name) {
    const char* path = std::getenv("PATH");
    if (!path || !*path) return std::nullopt;

    std::string_view paths(path);
    while (!paths.empty()) {
        const auto pos = paths.find(':');
        std::string_view dir = (pos == std::string_view::npos) ? paths : paths.substr(0, pos);
        if (!dir.empty()) {
            std::string candidate = (fs::path(std::string(dir)) / name).string();
            if (is_executable_file(candidate)) return candidate;
        }
        if (pos == std::string_view::npos) break;
        paths.remove_prefix(pos + 1);
    }
    return std::nullopt;
}

void copy_artifact(const fs::path& from, const fs::path& to) {
    fs::path staging = to;
    staging += ".tmp";

    fs::copy_file(from, staging, fs::copy_options::overwrite_existing);
    fs::permissions(staging, fs::status(from).permissions());
    fs::last_write_time(staging, fs::last_write_time(from));
    fs::rename(staging, to);
}

// ============================================================================
// Message stream
// ============================================================================

CargoMessageHandler::CargoMessageHandler(fs::path crate_dir, bool buffer_diagnostics)
    : crate_dir_(std::move(crate_dir)), buffer_diagnostics_(buffer_diagnostics) {}

void CargoMessageHandler::handle_line(const std::string& line,
                                      CargoInvoker::BuildResult& result) const {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return;
    }

    config::Value message;
    try {
        message = config::parse_json(line);
    } catch (const config::ParseError& e) {
        RUSTIMPORT_LOG_WARN("Ignoring malformed cargo message (" << e.what() << "): " << line);
        return;
    }

    if (!message.is_table()) {
        result.compiler_messages.push_back(std::move(message));
        return;
    }

    const std::string reason = message.get_string("reason");
    if (reason == "compiler-artifact") {
        fs::path manifest_path(message.get_string("manifest_path"));
        const config::Value* filenames = message.find("filenames");
        if (manifest_path.parent_path().lexically_normal() == crate_dir_ &&
            filenames && filenames->is_array() && !filenames->as_array().empty() &&
            filenames->as_array().front().is_string()) {
            result.artifact_path = fs::path(filenames->as_array().front().as_string());
        }
    } else if (reason == "compiler-message") {
        const config::Value* diagnostic = message.find("message");
        std::string rendered = diagnostic ? diagnostic->get_string("rendered") : std::string();
        if (!buffer_diagnostics_) {
            std::cerr << rendered << std::flush;
        }
        result.error_output.push_back(std::move(rendered));
    }

    result.compiler_messages.push_back(std::move(message));
}

// ============================================================================
// Invocation
// ============================================================================

CargoInvoker::CargoInvoker(const Settings& settings) {
    if (settings.cargo_executable) {
        const std::string& configured = *settings.cargo_executable;
        if (configured.find('/') != std::string::npos) {
            if (!is_executable_file(configured)) {
                throw ToolchainNotFoundError(configured);
            }
            executable_path_ = configured;
            return;
        }
        auto found = find_executable_in_path(configured);
        if (!found) {
            throw ToolchainNotFoundError(configured);
        }
        executable_path_ = *found;
        return;
    }

    auto found = find_executable_in_path("cargo");
    if (!found) {
        throw ToolchainNotFoundError("cargo");
    }
    executable_path_ = *found;
}

std::vector<std::string> CargoInvoker::build_command_args(
    bool release, bool quiet, const std::vector<std::string>& extra_args
) const {
    std::vector<std::string> args = {
        executable_path_, "rustc",
        "--lib",
        "--message-format", "json",
    };

    if (quiet) {
        args.push_back("--quiet");
    }
    if (release) {
        args.push_back("--release");
    }
    for (const auto& arg : extra_args) {
        args.push_back(arg);
    }

    return args;
}

CargoInvoker::BuildResult CargoInvoker::execute(
    const std::vector<std::string>& args,
    const fs::path& crate_path,
    bool quiet
) const {
    auto start_time = std::chrono::steady_clock::now();

    fs::path crate_dir = fs::weakly_canonical(crate_path).lexically_normal();
    CargoMessageHandler handler(crate_dir, quiet);

    int stdout_pipe[2];
    int stderr_pipe[2] = {-1, -1};

    if (pipe(stdout_pipe) != 0) {
        throw std::runtime_error(
            std::string("Failed to create stdout pipe: ") + strerror(errno)
        );
    }

    // stderr is only captured when diagnostics are buffered; otherwise cargo
    // writes its progress straight to ours
    if (quiet && pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw std::runtime_error(
            std::string("Failed to create stderr pipe: ") + strerror(errno)
        );
    }

    std::cerr << std::flush;
    pid_t pid = fork();

    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        if (quiet) { close(stderr_pipe[0]); close(stderr_pipe[1]); }
        throw std::runtime_error(
            std::string("Failed to fork process: ") + strerror(errno)
        );
    }

    if (pid == 0) {
        // Child process
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);

        if (quiet) {
            dup2(stderr_pipe[1], STDERR_FILENO);
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
        }

        if (chdir(crate_path.c_str()) != 0) {
            std::cerr << "Failed to enter " << crate_path.string() << ": "
                      << strerror(errno) << std::endl;
            _exit(127);
        }

        std::vector<char*> argv;
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());

        // If we get here, execvp failed
        std::cerr << "Failed to execute " << args[0] << ": "
                  << strerror(errno) << std::endl;
        _exit(127);  // Use _exit to avoid flushing parent's buffers
    }

    // Parent process
    close(stdout_pipe[1]);
    if (quiet) close(stderr_pipe[1]);

    set_nonblocking(stdout_pipe[0]);
    if (quiet) set_nonblocking(stderr_pipe[0]);

    BuildResult result;
    std::string line_buffer;
    char buffer[4096];
    bool stdout_open = true;
    bool stderr_open = quiet;
    bool reaped = false;
    int status = 0;

    while (stdout_open || stderr_open) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        int max_fd = -1;

        if (stdout_open) {
            FD_SET(stdout_pipe[0], &read_fds);
            max_fd = std::max(max_fd, stdout_pipe[0]);
        }
        if (stderr_open) {
            FD_SET(stderr_pipe[0], &read_fds);
            max_fd = std::max(max_fd, stderr_pipe[0]);
        }

        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 10000; // 10ms

        int ready = select(max_fd + 1, &read_fds, nullptr, nullptr, &timeout);

        if (ready > 0) {
            if (stdout_open && FD_ISSET(stdout_pipe[0], &read_fds)) {
                ssize_t n = read(stdout_pipe[0], buffer, sizeof(buffer));
                if (n > 0) {
                    line_buffer.append(buffer, n);
                    flush_lines(line_buffer, handler, result);
                } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                    stdout_open = false;
                }
            }

            if (stderr_open && FD_ISSET(stderr_pipe[0], &read_fds)) {
                ssize_t n = read(stderr_pipe[0], buffer, sizeof(buffer));
                if (n > 0) {
                    result.stderr_output.append(buffer, n);
                } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                    stderr_open = false;
                }
            }
        }

        // Child exited: drain what is left and stop
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            ssize_t n;
            while (stdout_open && (n = read(stdout_pipe[0], buffer, sizeof(buffer))) > 0) {
                line_buffer.append(buffer, n);
            }
            while (stderr_open && (n = read(stderr_pipe[0], buffer, sizeof(buffer))) > 0) {
                result.stderr_output.append(buffer, n);
            }
            break;
        }
    }

    // Last line may lack a terminating newline
    flush_lines(line_buffer, handler, result);
    if (!line_buffer.empty()) {
        handler.handle_line(line_buffer, result);
    }

    close(stdout_pipe[0]);
    if (quiet) close(stderr_pipe[0]);

    if (!reaped) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    auto end_time = std::chrono::steady_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time
    );

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // Process was killed by signal
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    result.success = result.exit_code == 0;

    return result;
}

CargoInvoker::BuildResult CargoInvoker::build(
    const fs::path& crate_path,
    const std::optional<fs::path>& destination,
    bool release,
    bool quiet,
    const std::vector<std::string>& extra_args
) const {
    std::vector<std::string> args = build_command_args(release, quiet, extra_args);

    RUSTIMPORT_LOG_DEBUG("Building " << crate_path.string() << ": " << join(args, " "));

    BuildResult result = execute(args, crate_path, quiet);

    if (!result.success && quiet) {
        RUSTIMPORT_LOG_ERROR("Compilation failed. Cargo build output:\n\n"
                             << join(result.error_output, "\n")
                             << result.stderr_output);
    }

    RUSTIMPORT_LOG_INFO("Cargo exited with code " << result.exit_code << ".");

    if (result.success && result.artifact_path && destination) {
        RUSTIMPORT_LOG_INFO("Copying artifact " << result.artifact_path->string()
                            << " to " << destination->string());
        copy_artifact(*result.artifact_path, *destination);
    }

    return result;
}

} // namespace rustimport
