#include "config.hpp"

namespace scorer {
using namespace std;

string DOCKER_BINARY = "docker";
string DOCKER_IMAGE = "python-with-time";
string TIME_BINARY = "/usr/bin/time";
string INTERPRETER = "python";
string CPU_LIMIT = "0.5";
double DEFAULT_TIME_LIMIT = 10;  // 10s
int DEFAULT_MEMORY_LIMIT = 128;  // 128M

filesystem::path RUN_DIR = "/tmp";
string MOUNT_POINT = "/sandbox";
string RUN_USER;
size_t MAX_PARALLEL = 0;

}  // namespace scorer
