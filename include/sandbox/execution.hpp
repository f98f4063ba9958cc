#pragma once

#include <cstdint>
#include <string>
#include "common/status.hpp"

namespace codebox {

/**
 * @brief 一次运行（编译或者运行选手程序）的结果
 */
struct execution_result {
    codebox::status status = status::INTERNAL_ERROR;

    /**
     * @brief 程序的标准输出，按字节原样保存，可能不是合法的 UTF-8
     */
    std::string stdout_data;

    /**
     * @brief 程序的标准错误输出，编译失败时为编译器的输出
     */
    std::string stderr_data;

    bool stdout_truncated = false;

    bool stderr_truncated = false;

    /**
     * @brief 退出码，没有正常退出（超时、取消、内部错误）时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 运行用时
     * 单位为毫秒
     */
    int64_t duration_ms = 0;

    /**
     * @brief 内存使用峰值
     * 单位为 MB
     */
    double memory_used_mb = 0;

    /**
     * @brief 内部错误的详细信息，只用于日志，不会返回给调用方
     */
    std::string internal_message;
};

/**
 * @brief 构造一个基础设施错误的结果
 * 选手看到的输出只有通用的提示，detail 只写进 internal_message
 */
execution_result infrastructure_failure(codebox::status stat, const std::string &detail);

/**
 * @brief 基础设施错误时展示给选手的通用提示
 */
extern const char *const SERVICE_UNAVAILABLE_MESSAGE;

}  // namespace codebox
