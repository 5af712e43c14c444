#include "sandbox/workspace.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace scorer {
using namespace std;

workspace workspace::acquire(const execution_request &request, const language &lang) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    filesystem::path rundir = filesystem::absolute(RUN_DIR) / ("run-" + uuid);

    error_code ec;
    if (!filesystem::create_directories(RUN_DIR, ec) && ec)
        throw internal_error(fmt::format("Unable to create run directory {}: {}", RUN_DIR, ec.message()));
    if (!filesystem::create_directory(rundir, ec))
        throw internal_error(fmt::format("Unable to create workspace {}: {}", rundir, ec ? ec.message() : "already exists"));

    // 从这里开始目录已经由 ws 持有，失败时 ws 析构会删除目录
    workspace ws(rundir, assert_safe_path(lang.source_filename()));
    if (!filesystem::create_directory(ws.sandbox(), ec))
        throw internal_error(fmt::format("Unable to create sandbox directory {}: {}", ws.sandbox(), ec ? ec.message() : "already exists"));
    try {
        write_file_content(ws.file(ws.source_filename()), request.source_code);
    } catch (system_error &ex) {
        throw internal_error(fmt::format("Unable to write source code to {}: {}", rundir, ex.what()));
    }
    DLOG(INFO) << "Workspace " << rundir << " acquired";
    return ws;
}

workspace::workspace(filesystem::path dir, string source_filename)
    : dir(move(dir)), source(move(source_filename)) {}

workspace::workspace(workspace &&other)
    : dir(move(other.dir)), source(move(other.source)) {
    other.dir.clear();
}

workspace &workspace::operator=(workspace &&other) {
    if (this != &other) {
        try {
            release();
        } catch (internal_error &ex) {
            LOG(ERROR) << ex.what();
        }
        dir = move(other.dir);
        source = move(other.source);
        other.dir.clear();
    }
    return *this;
}

workspace::~workspace() {
    try {
        release();
    } catch (internal_error &ex) {
        LOG(ERROR) << ex.what();
    }
}

const filesystem::path &workspace::path() const {
    return dir;
}

filesystem::path workspace::sandbox() const {
    return dir / SANDBOX_DIR;
}

filesystem::path workspace::file(const string &name) const {
    return sandbox() / assert_safe_path(name);
}

filesystem::path workspace::host_file(const string &name) const {
    return dir / assert_safe_path(name);
}

/**
 * @brief 为目录及其子目录加上所有者的全部权限，为普通文件加上所有者的读写权限
 * 只根据 symlink_status 判断类型，符号链接本身和它指向的文件都不会被修改
 */
static void restore_permissions(const filesystem::path &path) {
    error_code ec;
    filesystem::permissions(path, filesystem::perms::owner_all, filesystem::perm_options::add, ec);
    if (ec) {
        LOG(WARNING) << "Unable to restore permissions of " << path << ": " << ec.message();
        return;
    }

    filesystem::directory_iterator it(path, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        error_code status_ec;
        auto type = it->symlink_status(status_ec).type();
        if (status_ec) continue;
        if (type == filesystem::file_type::directory) {
            restore_permissions(it->path());
        } else if (type == filesystem::file_type::regular) {
            error_code perm_ec;
            filesystem::permissions(it->path(), filesystem::perms::owner_read | filesystem::perms::owner_write, filesystem::perm_options::add, perm_ec);
        }
    }
    if (ec)
        LOG(WARNING) << "Unable to list " << path << ": " << ec.message();
}

void workspace::restore_permissions() const {
    if (dir.empty()) return;
    error_code ec;
    if (filesystem::symlink_status(sandbox(), ec).type() == filesystem::file_type::directory)
        scorer::restore_permissions(sandbox());
}

const string &workspace::source_filename() const {
    return source;
}

bool workspace::valid() const {
    return !dir.empty();
}

void workspace::release() {
    if (dir.empty()) return;
    filesystem::path target = move(dir);
    dir.clear();

    error_code status_ec;
    if (filesystem::symlink_status(target / SANDBOX_DIR, status_ec).type() == filesystem::file_type::directory)
        scorer::restore_permissions(target / SANDBOX_DIR);

    error_code ec;
    filesystem::remove_all(target, ec);
    if (ec)
        throw internal_error(fmt::format("Unable to remove workspace {}: {}", target, ec.message()));
    DLOG(INFO) << "Workspace " << target << " released";
}

}  // namespace scorer
