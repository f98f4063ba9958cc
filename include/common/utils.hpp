#pragma once

#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace codebox {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为 vector，则将各个元素依次加入结果容器中）
 * @code{.cpp}
 *     std::vector<std::string> argv;
 *     // argv = {"docker", "exec", "-i", "abcdef", "sh", "-c", "exit 0"}
 *     to_string_list(argv, "docker", "exec", "-i", container_id, std::vector<std::string>{"sh", "-c", "exit 0"});
 * @endcode
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    if constexpr (std::is_array_v<Head>)
        cont.push_back(std::string(head));
    else
        to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 构造命令行参数列表
 */
template <typename... Args>
std::vector<std::string> make_command(const Args &... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return list;
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 在 PATH 中查找可执行文件
 * @param name 可执行文件名，若包含 '/' 则直接检查该路径
 * @return 可执行文件的路径，找不到时返回空
 */
std::optional<std::filesystem::path> find_executable(const std::string &name);

/**
 * @brief 生成随机的 uuid，用于命名执行上下文和临时文件夹
 */
std::string generate_uuid();

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace codebox
