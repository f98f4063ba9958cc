#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "sandbox/execution.hpp"
#include "sandbox/run_meta.hpp"
#include "sandbox/supervisor.hpp"

namespace codebox {

/**
 * @brief 执行上下文的文件系统范围
 * 目前只支持临时文件系统：上下文被销毁时所有文件都会被删除
 */
enum class filesystem_scope {
    EPHEMERAL
};

/**
 * @brief 一次运行的资源限制
 * 每个执行请求都必须携带资源限制，不存在不受限制的运行
 */
struct resource_limits {
    /**
     * @brief 时钟时间限制
     */
    std::chrono::milliseconds wall_timeout;

    /**
     * @brief 内存限制（内存和内存+交换区限制相同，禁止交换）
     * 单位为字节
     */
    int64_t memory_limit;

    /**
     * @brief 能使用的 CPU 核心数，比如 1.0 表示一个核心
     */
    double cpu_share;

    /**
     * @brief 是否禁止网络，请求无法关闭
     */
    bool network_disabled = true;

    filesystem_scope fs_scope = filesystem_scope::EPHEMERAL;

    /**
     * @brief stdout、stderr 各自最多保存多少字节
     */
    std::size_t stream_size;

    /**
     * @brief 执行上下文内的进程数限制
     */
    int proc_limit;

    /**
     * @brief 使用 config.hpp 中的默认配置
     */
    static resource_limits defaults();

    /**
     * @brief 根据请求中的时间限制和内存限制构造，其余项使用默认配置
     * @param timeout_seconds 时间限制，单位为秒
     * @param memory_limit_mb 内存限制，单位为 MB
     */
    static resource_limits from_request(double timeout_seconds, int memory_limit_mb);

    /**
     * @brief 检查限制是否有效，非正数的时间、内存、CPU 限制抛出 std::invalid_argument
     */
    void validate() const;

    /**
     * @brief 编译时使用的限制：时间限制为编译时间限制，其余不变
     */
    resource_limits for_compile() const;

    /**
     * @brief 两个限制是否可以共用同一个容器
     * 内存、CPU、进程数限制在创建容器时确定，时间限制和输出限制在每次运行时确定
     */
    bool same_container_limits(const resource_limits &other) const;
};

/**
 * @brief 容器内工作目录
 */
extern const char *const CONTEXT_WORKDIR;

/**
 * @brief 工作目录中沙箱自己使用的子目录名，运行之间清理工作目录时会保留
 */
extern const char *const CONTEXT_PRIVATE_DIR;

/**
 * @brief 容器内运行进程的用户，格式为 "uid:gid"，与宿主机当前用户一致
 */
std::string container_user();

/**
 * @brief 生成 Docker Engine API 创建容器时的 HostConfig
 * @param scratch_dir 宿主机上的工作目录，挂载到容器内的 /code
 */
nlohmann::json host_config(const resource_limits &limits, const std::filesystem::path &scratch_dir);

/**
 * @brief 生成 docker run 的限制参数
 */
std::vector<std::string> docker_run_flags(const resource_limits &limits, const std::filesystem::path &scratch_dir);

/**
 * @brief 运行包装脚本的内容
 * 脚本以 `run.sh <meta 文件> <stdin 文件> <命令...>` 的方式调用，
 * 运行命令并把退出码、运行时间、内存峰值、是否 OOM 写入 meta 文件。
 */
const std::string &run_wrapper_script();

/**
 * @brief 把命令包装为通过运行包装脚本执行的命令（容器内路径）
 */
std::vector<std::string> wrap_command(const std::vector<std::string> &command);

/**
 * @brief 在执行上下文的工作目录中写入运行包装脚本
 */
void install_run_wrapper(const std::filesystem::path &scratch_dir);

/**
 * @brief 容器引擎返回的原始运行结果
 */
struct raw_run {
    /**
     * @brief 容器引擎报告的退出码
     */
    int exitcode = -1;

    /**
     * @brief 宿主机测得的时钟时间，单位为秒
     */
    double wall_time = 0;

    bool time_limit_exceeded = false;

    bool cancelled = false;

    captured_stream out, err;
};

/**
 * @brief 根据原始运行结果和运行信息判断运行结果
 * 取消优先于超时，超时优先于内存超限
 */
execution_result classify_run(const raw_run &run, const run_metadata &meta);

}  // namespace codebox
