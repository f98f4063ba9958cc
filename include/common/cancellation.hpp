#pragma once

#include <atomic>

namespace codebox {

/**
 * @brief 取消标记，由调用方设置，执行过程中轮询检查
 * 可以挂在父标记下：父标记被取消时，子标记也视为已取消
 */
struct cancellation_token {
    cancellation_token() = default;
    explicit cancellation_token(const cancellation_token *parent) : parent(parent) {}

    cancellation_token(const cancellation_token &) = delete;
    cancellation_token &operator=(const cancellation_token &) = delete;

    void cancel() { flag.store(true, std::memory_order_release); }

    bool cancelled() const {
        return flag.load(std::memory_order_acquire) || (parent && parent->cancelled());
    }

private:
    std::atomic<bool> flag{false};
    const cancellation_token *parent = nullptr;
};

inline bool is_cancelled(const cancellation_token *token) {
    return token && token->cancelled();
}

}  // namespace codebox
