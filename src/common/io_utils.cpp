#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace scorer {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

optional<string> read_regular_file(const filesystem::path &path) {
    // O_NONBLOCK 避免打开 FIFO 时阻塞，打开后再检查文件类型
    int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) return {};

    struct stat st;
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        close(fd);
        return {};
    }

    string content;
    char buffer[65536];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            content.append(buffer, n);
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            close(fd);
            return {};
        }
    }
    close(fd);
    return content;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.close();
    if (!fout) throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find('/') != string::npos || subpath == "." || subpath == "..")
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace scorer
