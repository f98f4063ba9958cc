#pragma once

#include <sys/types.h>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "common/cancellation.hpp"

namespace codebox {

/**
 * @brief 有长度上限的输出缓冲区
 * 超过上限的数据仍然会被读取和计数，但不会被保存
 */
struct captured_stream {
    /**
     * @brief 保存下来的数据，最多为上限长度
     */
    std::string data;

    /**
     * @brief 一共读到了多少字节，包括被丢弃的部分
     */
    std::size_t total = 0;

    void append(const char *buf, std::size_t n, std::size_t limit);

    bool truncated() const { return total > data.size(); }
};

struct supervisor_options {
    /**
     * @brief 要执行的命令，command[0] 会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 标准输入文件，为空时使用 /dev/null
     */
    std::string stdin_filename;

    /**
     * @brief 时钟时间限制，超时后按 SIGTERM、SIGKILL 的顺序杀死整个进程组
     */
    std::chrono::milliseconds wall_limit{0};

    /**
     * @brief stdout 和 stderr 各自最多保存多少字节
     */
    std::size_t stream_size = 1 << 20;

    const cancellation_token *cancel = nullptr;
};

struct supervisor_result {
    /**
     * @brief 退出码，被信号杀死时为 128 + 信号编号
     */
    int exitcode = -1;

    /**
     * @brief 杀死进程的信号，没有被信号杀死时为 -1
     */
    int signal = -1;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    bool time_limit_exceeded = false;

    bool cancelled = false;

    captured_stream out, err;
};

/**
 * @brief 在新的进程组中运行命令并监督它
 * 子进程的 stdout、stderr 通过管道读回，达到时间限制或者被取消时杀死整个进程组。
 * 子进程退出后，进程组内残留的进程也会被杀死。
 * 这个函数可以在多个线程中同时调用。
 *
 * @throw std::system_error 无法创建管道或者 fork 失败
 * @throw context_fault 进程组在 SIGKILL 之后仍然没有退出
 */
supervisor_result supervise(const supervisor_options &opt);

/**
 * @brief 杀死进程组 pid 并在有限时间内回收组长进程 pid，不抛出异常
 * 用于出错时的清理，回收失败只记录日志
 */
void kill_and_reap(pid_t pid);

}  // namespace codebox
