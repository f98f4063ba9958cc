#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace codebox {

/**
 * @brief 请求没有指定时间限制时使用的时钟时间限制
 * 单位为秒
 */
extern double DEFAULT_TIME_LIMIT;

/**
 * @brief 请求没有指定内存限制时使用的内存限制
 * 单位为 MB
 */
extern int DEFAULT_MEMORY_LIMIT;

/**
 * @brief 每个执行上下文能使用的 CPU 核心数，可以是小数，比如 0.8 表示 80% 的单核时间
 */
extern double CPU_SHARE;

/**
 * @brief 编译选手程序的时钟时间限制
 * 单位为秒
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief 每个输出流（stdout、stderr）最多保留多少字节
 * 超出的部分会被读取并丢弃，结果中标记为截断
 */
extern std::size_t STREAM_SIZE;

/**
 * @brief 执行上下文内的进程数限制
 */
extern int PROC_LIMIT;

/**
 * @brief 首选的容器引擎后端
 * "api" 表示直接通过 unix socket 访问 Docker Engine API，"cli" 表示调用 docker 命令行
 */
extern std::string PRIMARY_BACKEND;

/**
 * @brief Docker 守护进程的地址，和 DOCKER_HOST 环境变量格式一致
 * 非 unix:// 的地址会被规范化为 unix:///var/run/docker.sock
 */
extern std::string DOCKER_ENDPOINT;

/**
 * @brief docker 命令行客户端，找不到时不启用命令行后端
 */
extern std::string DOCKER_EXECUTABLE;

/**
 * @brief 创建容器（包括拉取镜像）的时间限制
 * 单位为秒
 */
extern int PROVISION_TIME_LIMIT;

extern std::string PYTHON_IMAGE;

extern std::string JAVASCRIPT_IMAGE;

extern std::string CPP_IMAGE;

/**
 * @brief C++ 的编译选项，以空格分隔
 */
extern std::string CPP_COMPILE_FLAGS;

/**
 * @brief 容器池的槽位数量，为 0 表示不复用容器，每次运行都创建并销毁容器
 */
extern std::size_t POOL_CAPACITY;

/**
 * @brief 空闲容器的存活时间，超出后会被回收
 * 单位为秒
 */
extern int POOL_IDLE_TTL;

/**
 * @brief 从容器池获取容器的最长等待时间
 * 单位为秒
 */
extern int POOL_ACQUIRE_TIMEOUT;

/**
 * @brief 探测一个容器引擎后端是否可用的时间限制
 * 单位为毫秒
 */
extern int PROBE_TIMEOUT;

/**
 * @brief 探测结果的缓存时间
 * 单位为秒
 */
extern int PROBE_TTL;

/**
 * @brief 连续多少次内部错误后放弃当前后端并重新探测
 */
extern std::size_t FAILURE_THRESHOLD;

/**
 * @brief 一个提交内最多同时运行多少个测试点
 */
extern std::size_t FAN_OUT;

/**
 * @brief 提交的总时间预算 = 编译时间限制 + 所有测试点的时间限制之和 + SUBMISSION_MARGIN
 * 单位为秒
 */
extern double SUBMISSION_MARGIN;

/**
 * @brief 执行上下文工作目录和编译产物的根目录
 *
 * RUN_DIR
 * ├── contexts // 执行上下文的工作目录，挂载到容器内的 /code
 * │   └── 5b4c...e1 // 执行上下文的 id
 * │       ├── .codebox // 沙箱自己的文件，选手程序运行前会被清理干净的除外
 * │       │   ├── run.sh // 运行包装脚本，统计内存并写入 run.meta
 * │       │   ├── run.meta // 上一次运行的退出码、内存使用
 * │       │   └── stdin // 选手程序的标准输入
 * │       ├── solution.cpp // 选手代码
 * │       └── solution // 编译产物
 * └── artifacts // 编译好的程序，在同一个提交的测试点之间共享
 *     └── 9a0f...77 // 随机生成的 uuid
 *         └── solution
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，执行上下文销毁后不会删除工作目录，以便手动检查产生的文件
 */
extern bool DEBUG;

}  // namespace codebox
