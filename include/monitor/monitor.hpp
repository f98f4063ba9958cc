#pragma once

#include <memory>
#include <string>
#include "sandbox/execution.hpp"
#include "sandbox/language.hpp"

namespace codebox {

/**
 * @brief 执行监控行为
 * 所有方法都可能在多个线程中同时被调用
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报内部错误，用于告警
     * @param message 错误的详细信息
     */
    virtual void report_error(const std::string &message);

    /**
     * @brief 监控上报容器引擎后端发生了切换
     * @param from 原来的后端名称，没有时为 "none"
     * @param to 新的后端名称，没有可用的后端时为 "none"
     */
    virtual void backend_changed(const std::string &from, const std::string &to);

    /**
     * @brief 监控上报一次运行已经结束
     */
    virtual void execution_finished(language lang, const execution_result &result);
};

/**
 * @brief 注册监控器
 * 必须在开始处理请求之前完成注册
 */
void register_monitor(std::unique_ptr<monitor> &&monitor);

/**
 * @brief 移除所有的监控器
 */
void clear_monitors();

/**
 * @brief 向所有的监控器报错
 */
void report_error(const std::string &message);

void report_backend_changed(const std::string &from, const std::string &to);

void report_execution(language lang, const execution_result &result);

}  // namespace codebox
