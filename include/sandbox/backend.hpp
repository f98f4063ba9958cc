#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "sandbox/context.hpp"
#include "sandbox/limits.hpp"

namespace codebox {

/**
 * @brief 容器引擎后端
 * 后端只负责操作容器，不关心语言和测试点。所有方法都可以在多个线程中对不同的上下文同时调用。
 * 无法连接容器引擎时抛出 engine_unreachable，其他失败抛出 internal_error。
 */
struct engine_backend {
    virtual ~engine_backend();

    /**
     * @brief 后端名称，用于日志，如 "docker-api"
     */
    virtual std::string name() const = 0;

    /**
     * @brief 检查后端是否可用
     * @param timeout 最长等待时间
     * @throw engine_unreachable 后端不可用
     */
    virtual void ping(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 创建容器，容器的主进程为 sleep infinity，程序通过 exec 运行
     * 成功后 ctx.container_id 被设置
     * @param image 容器镜像，本地不存在时会先拉取
     */
    virtual void provision(execution_context &ctx, const std::string &image) = 0;

    /**
     * @brief 在容器的 /code 目录下运行命令
     * 达到 limits.wall_timeout 或者被取消时立即停止等待并返回，
     * 容器内残留的进程由调用方通过 reset 清理。
     */
    virtual raw_run exec(execution_context &ctx, const std::vector<std::string> &command,
                         const resource_limits &limits, const cancellation_token *cancel) = 0;

    /**
     * @brief 杀死容器内除主进程以外的所有进程
     * @throw context_fault 无法杀死进程
     */
    virtual void reset(execution_context &ctx) = 0;

    /**
     * @brief 删除容器
     */
    virtual void destroy(execution_context &ctx) = 0;
};

/**
 * @brief 容器内的清理命令：杀死所有进程并清空 /tmp
 * kill -1 不会杀死容器的主进程和调用者自己
 */
extern const std::vector<std::string> RESET_COMMAND;

}  // namespace codebox
