#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace codebox {

/**
 * @brief 运行包装脚本在执行上下文内写出的运行信息
 * 文件格式为每行一个 "key: value"，比如
 *
 *     exitcode: 0
 *     wall-time-ms: 12
 *     memory-bytes: 4476928
 *     memory-result:
 */
struct run_metadata {
    /**
     * @brief 文件是否存在
     * 被强制终止的运行不会写出运行信息
     */
    bool present = false;

    int exitcode = -1;

    /**
     * @brief 包装脚本测得的运行时间
     * 单位为毫秒，小于 0 表示没有测量
     */
    int64_t wall_time_ms = -1;

    /**
     * @brief 本次运行的内存使用峰值
     * 运行期间每 10ms 采样一次 cgroup 的内存用量，减去运行开始时的用量。
     * 单位为字节，小于 0 表示无法读取。
     */
    int64_t memory = -1;

    /**
     * @brief 若运行期间 cgroup 的 oom_kill 计数增加，为 "oom"
     */
    std::string memory_result;
};

run_metadata read_run_metadata(const std::filesystem::path &metafile);

}  // namespace codebox
