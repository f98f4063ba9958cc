#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>
#include "sandbox/context.hpp"

namespace codebox {

struct pool_options {
    /**
     * @brief 槽位数量，为 0 时不复用执行上下文
     */
    std::size_t capacity;

    /**
     * @brief 空闲的执行上下文超过这个时间后被回收
     */
    std::chrono::milliseconds idle_ttl;

    /**
     * @brief 所有槽位都被占用时最长的等待时间
     */
    std::chrono::milliseconds acquire_timeout;

    /**
     * @brief 使用 config.hpp 中的配置
     */
    static pool_options defaults();
};

/**
 * @brief 执行上下文池
 * 固定数量的槽位，每个槽位有自己的互斥锁保护借出标记，借出时只对单个槽位 try-claim，
 * 因此同一个执行上下文同一时刻只会被一个请求使用，也不存在全局的池锁。
 *
 * 池只负责保存和借出，执行上下文的创建和销毁由执行引擎完成：
 * 被池淘汰的执行上下文通过返回值交给调用方销毁。
 */
struct context_pool {
    explicit context_pool(pool_options opts);

    std::size_t capacity() const;

    bool enabled() const;

    /**
     * @brief 借出一个槽位
     * 依次尝试：复用同语言、同后端、同容器限制的空闲上下文；借出空槽位；
     * 淘汰最久未使用的空闲上下文；每 10ms 重试一次直到超时。
     * 借出的槽位要么是空的（调用方创建上下文后调用 install），要么已有可以复用的上下文。
     *
     * @param evicted 被淘汰的上下文（过期的、为腾出槽位而淘汰的），调用方负责销毁，超时时也可能非空
     * @return 借出的槽位编号
     * @throw internal_error 超过 acquire_timeout 仍然没有可用的槽位
     */
    std::size_t acquire(language lang, const engine_backend &backend, const resource_limits &limits,
                        std::vector<std::unique_ptr<execution_context>> &evicted);

    /**
     * @brief 借出的槽位中的执行上下文，空槽位返回 nullptr
     * 只有借出该槽位的调用方可以调用
     */
    execution_context *get(std::size_t index);

    /**
     * @brief 把新创建的执行上下文放进借出的槽位
     */
    void install(std::size_t index, std::unique_ptr<execution_context> ctx);

    /**
     * @brief 把执行上下文从借出的槽位中取出，槽位变为空槽位
     */
    std::unique_ptr<execution_context> take(std::size_t index);

    /**
     * @brief 归还借出的槽位
     * 槽位中的执行上下文（如果有）必须处于 READY 状态
     */
    void release(std::size_t index);

    /**
     * @brief 取出所有空闲超过 idle_ttl 的执行上下文
     */
    std::vector<std::unique_ptr<execution_context>> collect_expired();

    /**
     * @brief 取出所有的执行上下文，用于关闭
     * @param wait 等待被借出的槽位归还的最长时间
     */
    std::vector<std::unique_ptr<execution_context>> drain(std::chrono::milliseconds wait);

    /**
     * @brief 空闲的某种语言的执行上下文数量
     */
    std::size_t idle_count(language lang);

    /**
     * @brief 当前没有被借出且持有执行上下文的槽位数量
     */
    std::size_t idle_count();

private:
    struct slot {
        std::mutex mut;
        bool borrowed = false;
        std::unique_ptr<execution_context> context;
    };

    /**
     * @brief 尝试借出槽位，槽位已经被借出时立即返回 false
     */
    bool try_claim(slot &s);

    void unclaim(slot &s);

    bool expired(const execution_context &ctx, std::chrono::steady_clock::time_point now) const;

    pool_options opts;
    std::unique_ptr<slot[]> slots;
};

}  // namespace codebox
