#include "env.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <filesystem>
#include <system_error>
#include "common/utils.hpp"
#include "config.hpp"

namespace scorer {
using namespace std;

bool container_runtime_available(string &message) {
    auto docker = find_executable(DOCKER_BINARY);
    if (!docker) {
        message = fmt::format("Container runtime {} is not found", DOCKER_BINARY);
        return false;
    }

    try {
        int ret = call_process(*docker, "version");
        if (ret != 0) {
            message = fmt::format("{} version exited with status {}, the daemon may be unreachable", *docker, ret);
            return false;
        }

        ret = call_process(*docker, "image", "inspect", DOCKER_IMAGE);
        if (ret != 0) {
            message = fmt::format("Image {} is not available", DOCKER_IMAGE);
            return false;
        }
    } catch (system_error &ex) {
        LOG(ERROR) << "Unable to run " << *docker << ": " << ex.what();
        message = fmt::format("Unable to run {}: {}", *docker, ex.what());
        return false;
    }

    DLOG(INFO) << "Container runtime " << *docker << " with image " << DOCKER_IMAGE << " is available";
    return true;
}

}  // namespace scorer
