#pragma once

#include <string>
#include <variant>
#include <vector>
#include "common/status.hpp"

namespace codebox {

/**
 * @brief 沙箱支持的语言，这是一个封闭的集合
 */
enum class language {
    PYTHON,
    JAVASCRIPT,
    CPP
};

/**
 * @brief 语言在对外接口中的名称，如 "python"
 */
const char *get_language_name(language lang);

/**
 * @brief 根据对外接口中的名称查找语言，不支持的语言抛出 std::invalid_argument
 */
language parse_language(const std::string &name);

/**
 * @brief 解释执行的语言，prepare 阶段什么也不做
 */
struct interpreted_runner {
    std::string image;
    std::string interpreter;
    std::string source;
};

/**
 * @brief 运行在虚拟机上的语言（Node.js），prepare 阶段什么也不做
 */
struct vm_runner {
    std::string image;
    std::string runtime;
    std::string source;
};

/**
 * @brief 编译型语言，prepare 阶段在执行上下文中编译一次，之后所有测试点复用编译产物
 */
struct compiled_runner {
    std::string image;
    std::string compiler;
    std::vector<std::string> flags;
    std::string source;
    std::string binary;
};

/**
 * @brief 语言运行器
 * 描述一个语言在执行上下文中怎么准备、怎么运行。所有命令都在上下文的工作目录 /code 下执行。
 */
struct language_runner {
    language lang;
    std::variant<interpreted_runner, vm_runner, compiled_runner> runner;

    /**
     * @brief 执行上下文使用的镜像
     */
    const std::string &image() const;

    /**
     * @brief 选手代码保存的文件名
     */
    const std::string &source_name() const;

    /**
     * @brief 编译命令，为空表示 prepare 是空操作
     */
    std::vector<std::string> prepare_command() const;

    /**
     * @brief 运行命令
     */
    std::vector<std::string> run_command() const;

    /**
     * @brief prepare 之后，运行时需要复制进执行上下文的文件
     */
    std::vector<std::string> artifact_files() const;

    /**
     * @brief 代码为空时直接返回的结果，不会调用编译器或解释器
     * 编译型语言为 COMPILE_ERROR，其他语言为 RUNTIME_ERROR
     */
    status empty_source_status() const;
};

/**
 * @brief 根据配置构造语言运行器
 * 镜像和编译选项来自 config.hpp 中的全局配置
 */
language_runner make_runner(language lang);

}  // namespace codebox
