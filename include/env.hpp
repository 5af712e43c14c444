#pragma once

#include <string>

namespace scorer {

/**
 * @brief 检查容器运行时是否可用
 * 依次检查 DOCKER_BINARY 是否存在、docker daemon 是否可以连接、
 * DOCKER_IMAGE 镜像是否存在，无法创建子进程时同样视为不可用
 * @param message 不可用时写入原因
 * @return 容器运行时是否可用
 */
bool container_runtime_available(std::string &message);

}  // namespace scorer
