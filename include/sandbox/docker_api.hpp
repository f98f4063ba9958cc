#pragma once

#include <nlohmann/json.hpp>
#include "sandbox/backend.hpp"

namespace codebox {

/**
 * @brief 将 DOCKER_HOST 格式的地址转换为 unix socket 路径
 * unix:// 地址直接使用其路径，http+docker://、npipe://、http://、https://
 * 以及其他无法通过 unix socket 访问的地址统一使用 /var/run/docker.sock
 */
std::string normalize_docker_endpoint(const std::string &endpoint);

/**
 * @brief 解析 Docker 多路复用的输出流
 * 每一帧以 8 字节的帧头开始：第 1 字节为流类型（1 为 stdout，2 为 stderr），
 * 第 5~8 字节为大端序的帧长度，之后是帧内容。帧可以在任意位置被切断。
 */
struct stream_demuxer {
    stream_demuxer(captured_stream &out, captured_stream &err, std::size_t limit);

    void feed(const char *data, std::size_t n);

    /**
     * @brief 是否停在帧的边界上
     */
    bool at_frame_boundary() const;

private:
    captured_stream &out, &err;
    std::size_t limit;
    unsigned char header[8];
    std::size_t header_read = 0;
    std::size_t remaining = 0;
    int stream_type = 0;
};

/**
 * @brief 通过 unix socket 直接访问 Docker Engine API 的后端
 * 所有请求使用 /v1.41 前缀，要求守护进程支持的 API 版本不低于 1.41
 */
struct docker_api_backend : public engine_backend {
    explicit docker_api_backend(const std::string &endpoint);

    std::string name() const override;

    void ping(std::chrono::milliseconds timeout) override;

    void provision(execution_context &ctx, const std::string &image) override;

    raw_run exec(execution_context &ctx, const std::vector<std::string> &command,
                 const resource_limits &limits, const cancellation_token *cancel) override;

    void reset(execution_context &ctx) override;

    void destroy(execution_context &ctx) override;

    const std::string &socket() const;

private:
    struct http_response {
        long code = 0;
        std::string body;
    };

    http_response request(const std::string &method, const std::string &path,
                          const nlohmann::json *body, std::chrono::milliseconds timeout);

    void pull_image(const std::string &image);

    std::string create_exec(execution_context &ctx, const std::vector<std::string> &command);

    int inspect_exit_code(const std::string &exec_id);

    std::string socket_path;
};

}  // namespace codebox
