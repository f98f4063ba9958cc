#pragma once

#include <string>

namespace codebox {

/**
 * @brief 表示一次运行、一个测试点或者整个提交的执行结果
 */
enum class status {
    /**
     * @brief 程序正常退出（退出码为 0）
     * 对于整个提交，表示所有可见测试点均通过
     */
    SUCCESS = 0,

    /**
     * @brief 程序以非 0 退出码退出，或者被信号杀死
     * 空的解释型语言代码也会返回该结果
     */
    RUNTIME_ERROR = 1,

    /**
     * @brief 程序运行时间超出时钟时间限制，已被强制终止
     */
    TIMEOUT = 2,

    /**
     * @brief 程序运行内存超限
     * 容器的 cgroup 记录到了 OOM kill，或者程序在我们没有终止它的情况下被 SIGKILL 杀死
     */
    MEMORY_EXCEEDED = 3,

    /**
     * @brief 代码编译失败，结果中会携带编译器的输出
     */
    COMPILE_ERROR = 4,

    /**
     * @brief 沙箱内部错误
     * 比如无法终止程序、无法清理执行上下文，详细信息只会写进日志
     */
    INTERNAL_ERROR = 5,

    /**
     * @brief 没有可用的容器引擎
     */
    ENGINE_UNAVAILABLE = 6,

    /**
     * @brief 执行被调用方取消
     */
    CANCELLED = 7,

    /**
     * @brief 仅用于整个提交：所有程序都正常运行，但有可见测试点答案错误
     */
    TESTS_FAILED = 8
};

/**
 * @brief 用于日志的可读名称，如 "Memory Exceeded"
 */
const char *get_display_message(status);

/**
 * @brief 对外接口使用的名称，如 "memory_exceeded"
 */
const char *get_status_name(status);

/**
 * @brief 根据对外接口的名称查找结果，找不到时抛出 std::invalid_argument
 */
status parse_status(const std::string &name);

/**
 * @brief 是否为基础设施错误（而不是选手代码导致的错误）
 * 基础设施错误会中止整个提交剩余的测试点
 */
bool is_infrastructure_failure(status);

}  // namespace codebox
