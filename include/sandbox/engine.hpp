#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "sandbox/execution.hpp"
#include "sandbox/language.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/pool.hpp"
#include "sandbox/selector.hpp"

namespace codebox {

/**
 * @brief 一次执行请求
 */
struct execution_request {
    language lang;

    std::string source_code;

    /**
     * @brief 程序的标准输入，为空时标准输入为空文件
     */
    std::optional<std::string> input;

    resource_limits limits;
};

/**
 * @brief 准备好的程序
 * 解释型语言保存源代码，编译型语言保存编译产物。
 * 同一个提交的所有测试点共享同一个 prepared_program，析构时删除产物目录。
 */
struct prepared_program {
    prepared_program(language lang, std::filesystem::path dir);
    ~prepared_program();

    prepared_program(const prepared_program &) = delete;
    prepared_program &operator=(const prepared_program &) = delete;

    language lang;

    /**
     * @brief 宿主机上保存产物的目录，可以为空
     */
    std::filesystem::path dir;

    /**
     * @brief 运行时需要复制进执行上下文的文件，相对于 dir
     */
    std::vector<std::string> files;

    /**
     * @brief 准备阶段的结果
     * SUCCESS 表示可以运行，COMPILE_ERROR 时 stderr_data 为编译器的输出
     */
    execution_result compile_result;

    bool ok() const;
};

typedef std::shared_ptr<const prepared_program> prepared_ptr;

/**
 * @brief 执行服务，测试运行器通过它准备和运行程序
 */
struct execution_service {
    virtual ~execution_service();

    /**
     * @brief 准备程序：保存源代码，编译型语言编译一次
     * 返回的 prepared_program 总是非空，失败原因记录在 compile_result 中
     * @throw std::invalid_argument 资源限制无效
     */
    virtual prepared_ptr prepare(language lang, const std::string &source, const resource_limits &limits,
                                 const cancellation_token *cancel) = 0;

    /**
     * @brief 在一个干净的执行上下文中运行准备好的程序
     * @param input 程序的标准输入
     * @throw std::invalid_argument 资源限制无效
     */
    virtual execution_result invoke(const prepared_program &program, const std::string &input,
                                    const resource_limits &limits, const cancellation_token *cancel) = 0;

    /**
     * @brief 准备并运行一次
     */
    execution_result execute(const execution_request &request, const cancellation_token *cancel = nullptr);
};

/**
 * @brief 执行引擎
 * 管理执行上下文的生命周期：从上下文池借出或者创建上下文，运行结束后统一在 release 中
 * 清理上下文（杀死残留进程、清空工作目录），或者交给 teardown 销毁。
 * 多个线程可以同时调用 prepare、invoke，不同的运行使用不同的上下文。
 */
struct execution_engine : public execution_service {
    execution_engine(engine_selector &selector, pool_options pool_opts, std::filesystem::path run_dir);
    ~execution_engine() override;

    prepared_ptr prepare(language lang, const std::string &source, const resource_limits &limits,
                         const cancellation_token *cancel) override;

    execution_result invoke(const prepared_program &program, const std::string &input,
                            const resource_limits &limits, const cancellation_token *cancel) override;

    /**
     * @brief 预先创建 count 个某种语言的执行上下文放进池中
     * @throw engine_unavailable 没有可用的容器引擎
     */
    void warm_up(language lang, const resource_limits &limits, std::size_t count);

    /**
     * @brief 销毁所有空闲时间过长的执行上下文
     */
    void evict_expired();

    /**
     * @brief 销毁池中所有的执行上下文
     */
    void shutdown();

    context_pool &get_pool();

private:
    struct lease;

    template <typename Fn>
    execution_result with_backend(const char *operation, Fn &&fn);

    execution_result compile_on(engine_backend &backend, prepared_program &program, const std::string &source,
                                const resource_limits &limits, const cancellation_token *cancel);

    execution_result invoke_on(engine_backend &backend, const prepared_program &program, const std::string &input,
                               const resource_limits &limits, const cancellation_token *cancel);

    std::unique_ptr<execution_context> provision(engine_backend &backend, language lang, const resource_limits &limits);

    void borrow(lease &l, engine_backend &backend, language lang, const resource_limits &limits);

    /**
     * @brief 运行结束后唯一的清理入口
     * @param keep 为真时清理上下文并放回池中，清理失败或者为假时销毁上下文
     * @return 上下文中的进程是否确定已经全部终止
     */
    bool release(lease &l, bool keep);

    /**
     * @brief 销毁执行上下文：删除容器和工作目录
     * @return 是否成功删除了容器
     */
    bool teardown(std::unique_ptr<execution_context> ctx);

    engine_selector &selector;
    context_pool pool;
    std::filesystem::path run_dir;
};

}  // namespace codebox
