#pragma once

#include <filesystem>
#include <string>

namespace codebox {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(按字节读取，没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 * @return 文件的内容(按字节读取，没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 按字节写入文件，覆盖原有内容
 * 写入失败时抛出 std::system_error
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将任意字节串编码为 base64
 * 用于在 JSON 中保存不是合法 UTF-8 的程序输出
 */
std::string base64_encode(const std::string &bytes);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 执行上下文的工作目录会被挂载进容器，文件名包含 "../"
 * 时可能会把宿主机上的文件复制进容器或者覆盖掉。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 删除文件夹内的所有文件和子文件夹，保留文件夹本身
 * @param dir 要被清空的文件夹
 */
void clear_directory(const std::filesystem::path &dir);

}  // namespace codebox
