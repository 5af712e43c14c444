#include "test/fake_runtime.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/io_utils.hpp"
#include "config.hpp"

namespace scorer::test {
using namespace std;

static const char *FAKE_DOCKER = R"SH(#!/bin/bash
case "$1" in
    kill|rm)
        echo "$*" >> "$(dirname "$0")/commands.log"
        exit 0 ;;
    version) exit 0 ;;
    image) [ "$3" = "missing-image" ] && exit 1; exit 0 ;;
    run) shift ;;
    *) echo "unknown command: $1" >&2; exit 125 ;;
esac

workdir=""
while [ $# -gt 0 ]; do
    case "$1" in
        --rm|-i) shift ;;
        --name|--network|--memory|--memory-swap|--cpus|--user|-w) shift 2 ;;
        -v) workdir="${2%%:*}"; shift 2 ;;
        *) break ;;
    esac
done

image="$1"
shift
if [ "$image" = "unreachable" ]; then
    echo "Cannot connect to the Docker daemon at unix:///var/run/docker.sock. Is the docker daemon running?" >&2
    exit 125
fi

cd "$workdir" || exit 125
exec "$@"
)SH";

// 与 GNU time 一样，在运行程序之前打开 -o 指定的统计文件
static const char *FAKE_TIME = R"SH(#!/bin/bash
[ "$1" = "-v" ] && shift
if [ "$1" = "-o" ]; then
    exec 3> "$2"
    shift 2
else
    exec 3>&2
fi

"$@"
status=$?

{
    if [ $status -gt 128 ]; then
        echo "Command terminated by signal $((status - 128))"
    elif [ $status -ne 0 ]; then
        echo "Command exited with non-zero status $status"
    fi
    printf '\tCommand being timed: "%s"\n' "$*"
    printf '\tUser time (seconds): 0.01\n'
    printf '\tSystem time (seconds): 0.00\n'
    printf '\tElapsed (wall clock) time (h:mm:ss or m:ss): 0:00.01\n'
    printf '\tMaximum resident set size (kbytes): 2048\n'
    printf '\tExit status: %d\n' $status
} >&3
exit $status
)SH";

string shell_language::name() const {
    return "sh";
}

string shell_language::source_filename() const {
    return "client_script.sh";
}

vector<string> shell_language::run_command(const string &source) const {
    return {"sh", source};
}

bool shell_language::is_compilation_error(const string &error) const {
    return error.find("Syntax error") != string::npos || error.find("syntax error") != string::npos;
}

static void write_script(const filesystem::path &path, const char *content) {
    write_file_content(path, content);
    filesystem::permissions(path, filesystem::perms::owner_all | filesystem::perms::group_read | filesystem::perms::group_exec | filesystem::perms::others_read | filesystem::perms::others_exec);
}

fake_runtime::fake_runtime()
    : docker_binary(DOCKER_BINARY), docker_image(DOCKER_IMAGE), time_binary(TIME_BINARY), run_dir(RUN_DIR) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    dir = filesystem::temp_directory_path() / ("scorer-fake-" + uuid);
    filesystem::create_directories(dir / "run");

    write_script(dir / "docker", FAKE_DOCKER);
    write_script(dir / "time", FAKE_TIME);

    DOCKER_BINARY = (dir / "docker").string();
    DOCKER_IMAGE = "fake-image";
    TIME_BINARY = (dir / "time").string();
    RUN_DIR = dir / "run";
}

fake_runtime::~fake_runtime() {
    DOCKER_BINARY = docker_binary;
    DOCKER_IMAGE = docker_image;
    TIME_BINARY = time_binary;
    RUN_DIR = run_dir;

    error_code ec;
    filesystem::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove " << dir << ": " << ec.message();
}

const filesystem::path &fake_runtime::root() const {
    return dir;
}

string fake_runtime::commands() const {
    return read_file_content(dir / "commands.log", "");
}

void setup_test_environment() {
    scorer::RUN_DIR = filesystem::path("/tmp/test/run");
    filesystem::create_directories(scorer::RUN_DIR);
}

}  // namespace scorer::test
