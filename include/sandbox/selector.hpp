#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>
#include "sandbox/backend.hpp"

namespace codebox {

struct selector_options {
    /**
     * @brief 单次探测的时间限制（所有后端共享）
     */
    std::chrono::milliseconds probe_timeout;

    /**
     * @brief 探测结果的缓存时间
     */
    std::chrono::milliseconds probe_ttl;

    /**
     * @brief 连续多少次内部错误后重新探测
     */
    std::size_t failure_threshold;

    /**
     * @brief 使用 config.hpp 中的配置
     */
    static selector_options defaults();
};

/**
 * @brief 容器引擎选择器
 * 按顺序探测后端（首选在前、备用在后），缓存第一个可用的后端。
 * 缓存通过原子替换 shared_ptr 发布，读取不需要加锁；同一时刻只有一个线程在探测。
 * 切换后端不会中断正在使用旧后端的请求。
 */
struct engine_selector {
    engine_selector(std::vector<std::unique_ptr<engine_backend>> backends, selector_options opts);

    /**
     * @brief 获取当前可用的后端
     * 缓存有效时直接返回，否则重新探测
     * @throw engine_unavailable 所有后端均不可用，失败结果会缓存 probe_timeout 的时间
     */
    engine_backend &probe();

    /**
     * @brief 报告一次成功的运行，清零连续失败计数
     */
    void report_success(const engine_backend &backend);

    /**
     * @brief 报告一次内部错误，连续失败达到阈值后缓存失效
     */
    void report_failure(const engine_backend &backend);

    /**
     * @brief 报告后端无法连接，缓存立即失效
     */
    void report_unreachable(const engine_backend &backend);

    /**
     * @brief 使缓存失效，下次 probe 时重新探测
     */
    void invalidate();

    /**
     * @brief 当前缓存的后端，没有缓存时返回 nullptr
     */
    engine_backend *current() const;

    std::size_t consecutive_failures() const;

    const std::vector<std::unique_ptr<engine_backend>> &get_backends() const;

private:
    struct selection {
        engine_backend *backend;
        std::chrono::steady_clock::time_point probed_at;
        std::string error;
    };

    std::shared_ptr<const selection> load() const;

    bool fresh(const selection &sel, std::chrono::steady_clock::time_point now) const;

    std::vector<std::unique_ptr<engine_backend>> backends;
    selector_options opts;
    std::shared_ptr<const selection> state;
    std::atomic<std::size_t> failures{0};
    std::mutex probe_mutex;
    engine_backend *last_selected = nullptr;
};

}  // namespace codebox
