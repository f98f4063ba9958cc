#pragma once

#include <nlohmann/json.hpp>
#include "judge/test_runner.hpp"

/**
 * 这个头文件包含运行请求和报告的 json 编解码
 */
namespace codebox {

/**
 * @brief 解析运行请求
 * 缺少的 tests、timeout_seconds、memory_limit_mb 使用配置的默认值
 * @throw std::invalid_argument 请求格式错误或者语言不受支持
 */
run_request parse_run_request(const nlohmann::json &j);

void from_json(const nlohmann::json &j, test_case &value);

/**
 * @brief 序列化执行结果，不包含 internal_message
 */
void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 序列化可见测试点的结果
 */
void to_json(nlohmann::json &j, const test_case_result &result);

/**
 * @brief 序列化隐藏测试点，只有 id、status、execution_time_ms
 */
void to_json(nlohmann::json &j, const hidden_test_view &view);

/**
 * @brief 序列化返回给选手的报告
 */
void to_json(nlohmann::json &j, const aggregate_report &report);

}  // namespace codebox
