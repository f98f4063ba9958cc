#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace codebox {

struct sandbox_exception : std::exception {
    sandbox_exception();
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示沙箱系统的内部错误
 * 比如容器引擎返回了无法解析的响应、文件系统操作失败
 */
struct internal_error : public sandbox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示当前容器引擎无法连接
 * 抛出该异常后，引擎选择器会重新探测后端，执行引擎会重试一次
 */
struct engine_unreachable : public sandbox_exception {
    engine_unreachable();
    explicit engine_unreachable(const std::string &message);
};

/**
 * @brief 表示所有的容器引擎后端均不可用
 */
struct engine_unavailable : public sandbox_exception {
    engine_unavailable();
    explicit engine_unavailable(const std::string &message);
};

/**
 * @brief 表示执行上下文已经损坏，必须销毁
 * 比如无法杀死上下文内的进程、无法清理工作目录
 */
struct context_fault : public sandbox_exception {
    context_fault();
    explicit context_fault(const std::string &message);
};

}  // namespace codebox
