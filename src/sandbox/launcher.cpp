#include "sandbox/launcher.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/time_stats.hpp"

namespace scorer {
using namespace std;

// 发送 SIGTERM 之后等待多久再发送 SIGKILL
static const struct timespec killdelay = {0, 100000000L};  // 0.1 seconds

static constexpr size_t MiB = 1024 * 1024;

static once_flag sigpipe_flag;

/**
 * @brief 选手程序可能不读取标准输入就退出，此时写入管道会收到 SIGPIPE
 * 忽略 SIGPIPE 后 write 会返回 EPIPE
 */
static void ignore_sigpipe() {
    call_once(sigpipe_flag, [] { signal(SIGPIPE, SIG_IGN); });
}

static bool is_shell_safe(const string &arg) {
    if (arg.empty()) return false;
    for (char c : arg)
        if (!isalnum((unsigned char)c) && (c == '\0' || !strchr("_-./:=+,@%", c)))
            return false;
    return true;
}

static string shell_quote(const string &arg) {
    if (is_shell_safe(arg)) return arg;
    string quoted = "'";
    for (char c : arg) {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    return quoted + "'";
}

static string run_user() {
    if (!RUN_USER.empty()) return RUN_USER;
    return fmt::format("{}:{}", getuid(), getgid());
}

/**
 * @brief 终止超时的选手程序
 * 先终止 docker 客户端所在的进程组，再终止容器本身，最后回收子进程
 */
static void terminate(pid_t pid, const filesystem::path &docker, const string &container_name) {
    LOG(INFO) << "Sending SIGTERM to docker client " << pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to send SIGTERM to process group " << pid << ": " << strerror(errno);

    // Prefer nanosleep over sleep because of higher resolution and
    // it does not interfere with signals.
    nanosleep(&killdelay, NULL);

    LOG(INFO) << "Sending SIGKILL to docker client " << pid;
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to send SIGKILL to process group " << pid << ": " << strerror(errno);

    // 杀死 docker 客户端并不会停止容器，需要通知 daemon 终止容器
    try {
        int ret = call_process(docker, "kill", container_name);
        if (ret != 0)
            LOG(INFO) << "docker kill " << container_name << " returned " << ret << ", the container may have already stopped";
    } catch (system_error &ex) {
        LOG(ERROR) << "Unable to kill container " << container_name << ": " << ex.what();
    }

    // 容器可能刚刚创建还没有启动，docker kill 对其无效，失去客户端后 --rm 也不会生效
    try {
        int ret = call_process(docker, "rm", "-f", container_name);
        if (ret == 0)
            LOG(INFO) << "Container " << container_name << " removed";
        else
            LOG(INFO) << "docker rm -f " << container_name << " returned " << ret << ", the container may have already been removed";
    } catch (system_error &ex) {
        LOG(ERROR) << "Unable to remove container " << container_name << ": " << ex.what();
    }

    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        ;
}

launcher::~launcher() {}

docker_launcher::docker_launcher(const language &lang) : lang(lang) {}

vector<string> docker_launcher::build_command(const filesystem::path &docker, const workspace &ws, const execution_request &request, const string &container_name) const {
    size_t memory_mb = max<size_t>(1, (request.memory_limit + MiB - 1) / MiB);

    vector<string> program;
    for (auto &arg : lang.run_command(ws.source_filename()))
        program.push_back(shell_quote(arg));

    string script = fmt::format("echo {}; {} -v -o {} {} > {} 2> {}",
                                shell_quote(STARTED_MARKER),
                                shell_quote(TIME_BINARY),
                                workspace::STATS_FILE,
                                boost::algorithm::join(program, " "),
                                workspace::STDOUT_FILE,
                                workspace::STDERR_FILE);

    return {
        docker.string(), "run",
        "--rm", "-i",
        "--name", container_name,
        "--network", "none",
        "--memory", fmt::format("{}m", memory_mb),
        "--memory-swap", fmt::format("{}m", memory_mb),
        "--cpus", CPU_LIMIT,
        "--user", run_user(),
        "-v", fmt::format("{}:{}", ws.sandbox(), MOUNT_POINT),
        "-w", MOUNT_POINT,
        DOCKER_IMAGE,
        "bash", "-c", script};
}

execution_result docker_launcher::run(const workspace &ws, const execution_request &request) const {
    ignore_sigpipe();

    execution_result result;
    result.wall_time = chrono::duration<double>::zero();

    auto docker = find_executable(DOCKER_BINARY);
    if (!docker) {
        string message = fmt::format("Container runtime {} is not found", DOCKER_BINARY);
        LOG(ERROR) << message;
        result.status = exit_status::launch_failed{message};
        return result;
    }

    string container_name = "scorer-" + ws.path().filename().string();
    vector<string> args = build_command(*docker, ws, request, container_name);
    vector<const char *> argv;
    for (auto &arg : args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    LOG(INFO) << "Running " << lang.name() << " program in " << ws.path()
              << " [time limit: " << request.time_limit.count() << "s, memory limit: " << request.memory_limit << " bytes]";

    int stdin_pipe[2];
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0)
        throw internal_error(fmt::format("Unable to create pipe: {}", strerror(errno)));

    filesystem::path runtime_log = ws.host_file(workspace::RUNTIME_LOG);
    int log_fd = open(runtime_log.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        int err = errno;
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        throw internal_error(fmt::format("Unable to open {}: {}", runtime_log, strerror(err)));
    }

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(log_fd);
        throw internal_error(fmt::format("Unable to fork: {}", strerror(err)));
    }

    if (pid == 0) {  // 子进程，只允许调用异步信号安全的函数
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
            dup2(log_fd, STDOUT_FILENO) < 0 ||
            dup2(log_fd, STDERR_FILENO) < 0)
            _exit(127);
        execv(argv[0], (char **)argv.data());
        _exit(127);
    }

    // 与子进程中的 setpgid 竞争，确保超时时 kill(-pid) 一定有效
    setpgid(pid, pid);
    close(stdin_pipe[0]);
    close(log_fd);

    int in_fd = stdin_pipe[1];
    defer {
        if (in_fd >= 0) close(in_fd);
    };
    if (fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK) < 0)
        LOG(WARNING) << "Unable to set stdin pipe to non-blocking mode: " << strerror(errno);

    const string &input = request.input;
    size_t written = 0;
    if (input.empty()) {
        close(in_fd);
        in_fd = -1;
    }

    int status = 0;
    bool exited = false;
    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            exited = true;
            break;
        } else if (ret < 0 && errno != EINTR) {
            int err = errno;
            terminate(pid, *docker, container_name);
            throw internal_error(fmt::format("Unable to wait for docker client: {}", strerror(err)));
        }

        if (timer.duration<chrono::duration<double>>() >= request.time_limit) break;

        if (in_fd < 0) {
            usleep(10 * 1000);  // 10ms
            continue;
        }

        struct pollfd pfd = {in_fd, POLLOUT, 0};
        int ready = poll(&pfd, 1, 10);
        if (ready <= 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP)) {
            // 选手程序已经不再读取标准输入
            close(in_fd);
            in_fd = -1;
        } else if (pfd.revents & POLLOUT) {
            ssize_t n = write(in_fd, input.data() + written, input.size() - written);
            if (n > 0) {
                written += n;
            } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                if (errno != EPIPE)
                    LOG(WARNING) << "Unable to write stdin of " << ws.path() << ": " << strerror(errno);
                close(in_fd);
                in_fd = -1;
                continue;
            }
            if (written >= input.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }
    }

    if (!exited) {
        LOG(INFO) << "Program in " << ws.path() << " exceeded the time limit of " << request.time_limit.count() << "s";
        terminate(pid, *docker, container_name);
        result.status = exit_status::timed_out{};
        result.wall_time = request.time_limit;
        result.error = fmt::format("Execution time exceeded the limit of {} seconds.", request.time_limit.count());
        return result;
    }

    result.wall_time = timer.duration<chrono::duration<double>>();

    // 运行结果位于选手程序可以修改的沙箱目录中，符号链接、FIFO 等文件视为不存在
    ws.restore_permissions();
    auto stats = read_time_statistics(ws.file(workspace::STATS_FILE));
    result.output = read_regular_file(ws.file(workspace::STDOUT_FILE)).value_or("");
    result.error = read_regular_file(ws.file(workspace::STDERR_FILE)).value_or("");
    if (stats) {
        if (stats->max_resident_kb) result.peak_memory = (size_t)*stats->max_resident_kb * 1024;
        result.user_time = stats->user_time;
        result.sys_time = stats->sys_time;
    }

    if (WIFSIGNALED(status)) {
        result.status = exit_status::signaled{WTERMSIG(status), false};
    } else {
        int code = WEXITSTATUS(status);
        string runtime_output = read_file_content(runtime_log, "");
        if ((code == 125 || code == 126 || code == 127) && runtime_output.find(STARTED_MARKER) == string::npos) {
            // 容器没有启动，选手程序根本没有运行
            boost::algorithm::trim(runtime_output);
            string message = runtime_output.empty() ? fmt::format("Container runtime exited with status {}", code) : runtime_output;
            LOG(ERROR) << "Unable to launch container for " << ws.path() << ": " << message;
            result.status = exit_status::launch_failed{message};
            return result;
        } else if (code == OOM_EXIT_CODE) {
            if (result.error.empty())
                result.error = "The process was terminated because it exceeded the memory limit.";
            result.status = exit_status::signaled{SIGKILL, true};
        } else if (stats && stats->terminating_signal && code == 128 + *stats->terminating_signal) {
            result.status = exit_status::signaled{*stats->terminating_signal, false};
        } else {
            result.status = exit_status::completed{code};
        }
    }

    LOG(INFO) << "Program in " << ws.path() << " finished in " << result.wall_time.count() << "s"
              << ", peak memory: " << (result.peak_memory ? to_string(*result.peak_memory) : "unknown");
    return result;
}

}  // namespace scorer
