#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "sandbox/language.hpp"
#include "sandbox/limits.hpp"

namespace codebox {

struct engine_backend;

/**
 * @brief 执行上下文的生命周期状态
 *
 *   PROVISIONING ──> READY ──> RUNNING ──> READY
 *        │             │          │
 *        │             │          └──> FAULTED ──> TERMINATED
 *        └──> FAULTED  └──> TERMINATED
 */
enum class context_state {
    /**
     * @brief 正在创建容器
     */
    PROVISIONING,

    /**
     * @brief 空闲，可以运行程序
     */
    READY,

    /**
     * @brief 正在运行程序，被某个请求独占
     */
    RUNNING,

    /**
     * @brief 已经损坏（创建失败、取消、无法清理），只能被销毁
     */
    FAULTED,

    /**
     * @brief 已经销毁，不再持有任何系统资源
     */
    TERMINATED
};

const char *get_state_name(context_state state);

/**
 * @brief 执行上下文，对应容器引擎中的一个容器
 * 一个上下文只服务于一种语言，同一时刻只会被一个请求使用。
 */
struct execution_context {
    execution_context(std::string id, language lang, resource_limits limits, std::filesystem::path scratch_dir);

    /**
     * @brief 上下文 id，也是容器名称的一部分
     */
    std::string id;

    language lang;

    /**
     * @brief 创建容器时使用的资源限制
     */
    resource_limits limits;

    /**
     * @brief 宿主机上的工作目录，挂载到容器内的 /code
     */
    std::filesystem::path scratch_dir;

    std::chrono::steady_clock::time_point created_at;

    std::chrono::steady_clock::time_point last_used_at;

    /**
     * @brief 创建这个上下文的后端
     */
    engine_backend *backend = nullptr;

    /**
     * @brief 容器引擎中的容器 id
     */
    std::string container_id;

    context_state state() const;

    /**
     * @brief 状态转移，非法的转移抛出 internal_error
     */
    void transition(context_state next);

    bool can_transition(context_state next) const;

    /**
     * @brief 更新 last_used_at
     */
    void touch();

private:
    context_state current = context_state::PROVISIONING;
};

}  // namespace codebox
