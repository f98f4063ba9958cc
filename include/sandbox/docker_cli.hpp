#pragma once

#include <filesystem>
#include <optional>
#include "sandbox/backend.hpp"
#include "sandbox/supervisor.hpp"

namespace codebox {

/**
 * @brief 通过 docker 命令行客户端操作容器的后端
 * 只有在能找到 docker 可执行文件时才启用，所有命令都在进程监督下运行并有时间限制。
 */
struct docker_cli_backend : public engine_backend {
    explicit docker_cli_backend(const std::string &executable);

    std::string name() const override;

    /**
     * @brief docker 可执行文件是否存在
     */
    bool available() const;

    void ping(std::chrono::milliseconds timeout) override;

    void provision(execution_context &ctx, const std::string &image) override;

    raw_run exec(execution_context &ctx, const std::vector<std::string> &command,
                 const resource_limits &limits, const cancellation_token *cancel) override;

    void reset(execution_context &ctx) override;

    void destroy(execution_context &ctx) override;

private:
    /**
     * @brief 运行 docker 命令
     * @throw engine_unreachable docker 不存在或者守护进程无法连接
     */
    supervisor_result docker(const std::vector<std::string> &args, std::chrono::milliseconds limit,
                             const cancellation_token *cancel, std::size_t stream_size);

    std::optional<std::filesystem::path> executable;
};

/**
 * @brief docker 命令行的输出是否表示守护进程无法连接
 */
bool is_daemon_unreachable(int exitcode, const std::string &error_output);

}  // namespace codebox
