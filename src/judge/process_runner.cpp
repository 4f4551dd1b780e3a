#include "judge/process_runner.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace codify {
using namespace std;

// 子进程通过 status pipe 报告启动失败的阶段
static constexpr int STAGE_SETUP = 0;
static constexpr int STAGE_EXEC = 1;

static once_flag sigpipe_flag;

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void open_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) < 0)
        throw system_error(errno, system_category(), "Unable to create pipe");
}

[[noreturn]] static void report_child_failure(int fd, int stage) {
    int failure[2] = {stage, errno};
    ssize_t ignored = write(fd, failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

process_result run_process(const process_options &options) {
    if (options.argv.empty()) throw invalid_argument("Command line is empty");
    // 子进程提前关闭 stdin 时，写入不能导致评测进程被 SIGPIPE 终止
    call_once(sigpipe_flag, [] { signal(SIGPIPE, SIG_IGN); });

    vector<char *> argv;
    for (auto &arg : options.argv) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string workdir = options.workdir.string();

    if (DEBUG)
        LOG(INFO) << "Spawning [" << boost::algorithm::join(options.argv, " ") << "] in " << workdir;
    else
        DLOG(INFO) << "Spawning [" << boost::algorithm::join(options.argv, " ") << "] in " << workdir;

    int in[2] = {-1, -1}, out[2] = {-1, -1}, err[2] = {-1, -1}, status_pipe[2] = {-1, -1};
    defer {
        for (int *fds : {in, out, err, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };
    open_pipe(in);
    open_pipe(out);
    open_pipe(err);
    open_pipe(status_pipe);

    process_result result;
    elapsed_time timer;
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(options.time_limit);

    pid_t pid = fork();
    if (pid < 0) throw system_error(errno, system_category(), "Unable to fork");
    if (pid == 0) {
        // 子进程只调用 async-signal-safe 的函数
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        if (dup2(in[0], STDIN_FILENO) < 0 || dup2(out[1], STDOUT_FILENO) < 0 || dup2(err[1], STDERR_FILENO) < 0)
            report_child_failure(status_pipe[1], STAGE_SETUP);
        if (!workdir.empty() && chdir(workdir.c_str()) < 0)
            report_child_failure(status_pipe[1], STAGE_SETUP);
        execvp(argv[0], argv.data());
        report_child_failure(status_pipe[1], STAGE_EXEC);
    }

    setpgid(pid, pid);
    close_fd(in[0]);
    close_fd(out[1]);
    close_fd(err[1]);
    close_fd(status_pipe[1]);

    // exec 成功时 status pipe 因为 O_CLOEXEC 被关闭，read 返回 0
    int failure[2];
    ssize_t n;
    do {
        n = read(status_pipe[0], failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    if (n == sizeof(failure)) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        if (failure[0] == STAGE_SETUP)
            throw system_error(failure[1], system_category(), "Unable to prepare child process in " + workdir);
        result.spawn_failed = true;
        result.spawn_errno = failure[1];
        result.exit_code = -1;
        result.elapsed = timer.duration<chrono::milliseconds>().count();
        return result;
    }

    bool killed = false;
    auto kill_group = [&] {
        if (killed) return;
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        killed = true;
    };

    fcntl(in[1], F_SETFL, fcntl(in[1], F_GETFL) | O_NONBLOCK);
    size_t written = 0;
    if (options.input.empty()) close_fd(in[1]);

    char buffer[1 << 16];
    while (out[0] >= 0 || err[0] >= 0) {
        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            kill_group();
            break;
        }
        int timeout = chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1;

        pollfd fds[3];
        int *targets[3];
        int nfds = 0;
        for (int *fd : {&in[1], &out[0], &err[0]}) {
            if (*fd < 0) continue;
            fds[nfds] = {*fd, static_cast<short>(fd == &in[1] ? POLLOUT : POLLIN), 0};
            targets[nfds++] = fd;
        }

        int ready = poll(fds, nfds, timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            int code = errno;
            kill_group();
            while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
            throw system_error(code, system_category(), "Unable to poll child process");
        }

        for (int i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            int &fd = *targets[i];
            if (&fd == &in[1]) {
                size_t chunk = min(options.input.size() - written, sizeof(buffer));
                ssize_t w = write(fd, options.input.data() + written, chunk);
                if (w > 0) {
                    written += w;
                    if (written == options.input.size()) close_fd(fd);
                } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
                    // 子进程不再读取 stdin
                    close_fd(fd);
                }
            } else {
                string &sink = &fd == &out[0] ? result.output : result.error;
                ssize_t r = read(fd, buffer, sizeof(buffer));
                if (r > 0) {
                    sink.append(buffer, r);
                    if (sink.size() > options.output_limit) {
                        sink.resize(options.output_limit);
                        result.output_limit_exceeded = true;
                    }
                } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
                    close_fd(fd);
                }
            }
        }

        if (result.output_limit_exceeded) {
            kill_group();
            break;
        }
    }

    // 子进程可能关闭了输出但仍在运行
    int status = 0;
    struct rusage usage {};
    while (true) {
        pid_t r = wait4(pid, &status, killed ? 0 : WNOHANG, &usage);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "Unable to wait for child process");
        }
        if (chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            kill_group();
        } else {
            this_thread::sleep_for(chrono::milliseconds(1));
        }
    }

    result.elapsed = timer.duration<chrono::milliseconds>().count();
    result.memory_used = usage.ru_maxrss * 1024L;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

const char *get_outcome_name(outcome_kind kind) {
    switch (kind) {
        case outcome_kind::SUCCESS: return "success";
        case outcome_kind::COMPILE_ERROR: return "compileError";
        case outcome_kind::RUNTIME_ERROR: return "runtimeError";
        case outcome_kind::TIMEOUT: return "timeout";
    }
    return "unknown";
}

bool execution_outcome::success() const {
    return kind == outcome_kind::SUCCESS;
}

execution_limits execution_limits::judging() {
    return {COMPILE_TIME_LIMIT, COMPILE_OUTPUT_LIMIT, RUN_TIME_LIMIT, RUN_OUTPUT_LIMIT};
}

execution_limits execution_limits::interactive() {
    return {INTERACTIVE_TIME_LIMIT, INTERACTIVE_OUTPUT_LIMIT, INTERACTIVE_TIME_LIMIT, INTERACTIVE_OUTPUT_LIMIT};
}

static void append_line(string &text, const string &line) {
    if (!text.empty() && text.back() != '\n') text += '\n';
    text += line;
}

/**
 * @brief 将子进程的原始结果分类
 * @param compile_step 是否为编译步骤，编译步骤的任何失败都归为编译错误
 */
static execution_outcome classify(const process_result &result, const vector<string> &argv, bool compile_step, int time_limit, size_t output_limit) {
    execution_outcome outcome;
    outcome.output = result.output;
    outcome.error = result.error;
    outcome.elapsed = result.elapsed;
    outcome.exit_code = result.exit_code;
    outcome.term_signal = result.term_signal;
    outcome.memory_used = result.memory_used;

    outcome_kind failure = compile_step ? outcome_kind::COMPILE_ERROR : outcome_kind::RUNTIME_ERROR;
    error_type failure_type = compile_step ? error_type::COMPILATION : error_type::RUNTIME;

    if (result.spawn_failed) {
        outcome.kind = failure;
        if (result.spawn_errno == ENOENT || result.spawn_errno == EACCES) {
            outcome.fault = error_type::CONFIGURATION;
            outcome.error = fmt::format("{} {} not found on system", compile_step ? "Compiler" : "Interpreter", argv.front());
        } else {
            outcome.fault = failure_type;
            outcome.error = fmt::format("Unable to start {}: {}", argv.front(), system_category().message(result.spawn_errno));
        }
    } else if (result.timed_out) {
        if (compile_step) {
            outcome.kind = outcome_kind::COMPILE_ERROR;
            outcome.fault = error_type::COMPILATION;
            append_line(outcome.error, fmt::format("Compilation timed out after {} ms", time_limit));
        } else {
            outcome.kind = outcome_kind::TIMEOUT;
            outcome.fault = error_type::TIMEOUT;
            if (outcome.error.empty())
                outcome.error = fmt::format("Execution timed out after {} ms", time_limit);
        }
    } else if (result.output_limit_exceeded) {
        outcome.kind = failure;
        outcome.fault = compile_step ? error_type::COMPILATION : error_type::OUTPUT_LIMIT;
        append_line(outcome.error, fmt::format("Output exceeded {} bytes", output_limit));
    } else if (result.exit_code != 0 || result.term_signal != 0) {
        outcome.kind = failure;
        outcome.fault = failure_type;
        if (compile_step && outcome.error.empty())
            outcome.error = outcome.output;
        if (outcome.error.empty()) {
            if (result.term_signal)
                outcome.error = fmt::format("Terminated by signal {} ({})", result.term_signal, strsignal(result.term_signal));
            else
                outcome.error = fmt::format("Exited with code {}", result.exit_code);
        }
    }
    return outcome;
}

process_runner::process_runner(const workspace_manager &workspaces)
    : workspaces(workspaces) {}

vector<string> process_runner::expand(const vector<string> &command, const workspace &ws) {
    vector<string> argv;
    for (auto arg : command) {
        boost::replace_all(arg, "{source}", ws.source_path.string());
        boost::replace_all(arg, "{executable}", ws.executable_path ? ws.executable_path->string() : "");
        boost::replace_all(arg, "{entry}", ws.entry_point);
        boost::replace_all(arg, "{workdir}", ws.working_directory().string());
        argv.push_back(move(arg));
    }
    return argv;
}

execution_outcome process_runner::compile(const workspace &ws, const toolchain &tc, int time_limit, size_t output_limit) const {
    if (!tc.has_compile_step()) return execution_outcome();

    vector<string> argv = expand(tc.compile_command, ws);
    process_result result = run_process({argv, ws.working_directory(), "", time_limit, output_limit});
    execution_outcome outcome = classify(result, argv, true, time_limit, output_limit);
    if (outcome.fault == error_type::CONFIGURATION)
        LOG(ERROR) << "Toolchain for " << tc.language << " is not available: " << outcome.error;
    return outcome;
}

execution_outcome process_runner::run(const workspace &ws, const toolchain &tc, const string &input, int time_limit, size_t output_limit) const {
    vector<string> argv = expand(tc.run_command, ws);
    process_result result = run_process({argv, ws.working_directory(), input, time_limit, output_limit});
    execution_outcome outcome = classify(result, argv, false, time_limit, output_limit);
    if (outcome.fault == error_type::CONFIGURATION)
        LOG(ERROR) << "Toolchain for " << tc.language << " is not available: " << outcome.error;
    return outcome;
}

execution_outcome process_runner::execute(const toolchain &tc, const string &code, const string &input, const execution_limits &limits) const {
    workspace ws = workspaces.create(tc, code);
    defer { workspaces.destroy(ws); };

    execution_outcome compiled = compile(ws, tc, limits.compile_time_limit, limits.compile_output_limit);
    if (!compiled.success()) return compiled;
    return run(ws, tc, input, limits.run_time_limit, limits.run_output_limit);
}

}  // namespace codify
