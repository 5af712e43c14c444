#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <system_error>
using namespace std;

namespace scorer {

int exec_program(const char **argv) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork");
        case 0: {  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) dup2(devnull, STDOUT_FILENO);
            execvp(argv[0], (char **)argv);
            _exit(EXIT_FAILURE);
        }
        default:  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0)
                if (errno != EINTR) throw system_error(errno, system_category(), "waiting on child");
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
    return 0;
}

optional<filesystem::path> find_executable(const string &name) {
    if (name.empty()) return {};
    if (name.find('/') != string::npos) {
        if (access(name.c_str(), X_OK) == 0) return filesystem::path(name);
        return {};
    }

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path candidate = filesystem::path(dir) / name;
        error_code ec;
        if (filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return {};
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace scorer
