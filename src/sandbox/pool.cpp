#include "sandbox/pool.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <optional>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace codebox {
using namespace std;

pool_options pool_options::defaults() {
    return {POOL_CAPACITY, chrono::seconds(POOL_IDLE_TTL), chrono::seconds(POOL_ACQUIRE_TIMEOUT)};
}

context_pool::context_pool(pool_options opts)
    : opts(opts), slots(new slot[opts.capacity]) {}

size_t context_pool::capacity() const {
    return opts.capacity;
}

bool context_pool::enabled() const {
    return opts.capacity > 0;
}

bool context_pool::expired(const execution_context &ctx, chrono::steady_clock::time_point now) const {
    return now - ctx.last_used_at >= opts.idle_ttl;
}

bool context_pool::try_claim(slot &s) {
    unique_lock<mutex> guard(s.mut, try_to_lock);
    if (!guard.owns_lock() || s.borrowed) return false;
    s.borrowed = true;
    return true;
}

void context_pool::unclaim(slot &s) {
    scoped_lock guard(s.mut);
    s.borrowed = false;
}

size_t context_pool::acquire(language lang, const engine_backend &backend, const resource_limits &limits,
                             vector<unique_ptr<execution_context>> &evicted) {
    if (!enabled()) throw internal_error("context pool is disabled");

    auto deadline = chrono::steady_clock::now() + opts.acquire_timeout;
    while (true) {
        auto now = chrono::steady_clock::now();

        // 复用空闲的同类上下文，顺便取出过期的上下文
        for (size_t i = 0; i < opts.capacity; ++i) {
            slot &s = slots[i];
            if (!try_claim(s)) continue;
            if (s.context && expired(*s.context, now)) {
                DLOG(INFO) << "context " << s.context->id << " expired";
                evicted.push_back(move(s.context));
            }
            if (s.context && s.context->state() == context_state::READY && s.context->lang == lang &&
                s.context->backend == &backend && s.context->limits.same_container_limits(limits))
                return i;
            unclaim(s);
        }

        // 空槽位
        for (size_t i = 0; i < opts.capacity; ++i) {
            slot &s = slots[i];
            if (!try_claim(s)) continue;
            if (!s.context) return i;
            unclaim(s);
        }

        // 淘汰最久未使用的空闲上下文
        optional<size_t> lru;
        chrono::steady_clock::time_point oldest;
        for (size_t i = 0; i < opts.capacity; ++i) {
            slot &s = slots[i];
            scoped_lock guard(s.mut);
            if (!s.borrowed && s.context && (!lru || s.context->last_used_at < oldest)) {
                lru = i;
                oldest = s.context->last_used_at;
            }
        }
        if (lru && try_claim(slots[*lru])) {
            slot &s = slots[*lru];
            if (s.context) {
                DLOG(INFO) << "evicting least recently used context " << s.context->id;
                evicted.push_back(move(s.context));
            }
            return *lru;
        }

        if (chrono::steady_clock::now() >= deadline)
            throw internal_error(fmt::format("no execution context became available within {}ms", opts.acquire_timeout.count()));
        usleep(10 * 1000);  // 10ms
    }
}

execution_context *context_pool::get(size_t index) {
    return slots[index].context.get();
}

void context_pool::install(size_t index, unique_ptr<execution_context> ctx) {
    slots[index].context = move(ctx);
}

unique_ptr<execution_context> context_pool::take(size_t index) {
    return move(slots[index].context);
}

void context_pool::release(size_t index) {
    slot &s = slots[index];
    if (s.context && s.context->state() != context_state::READY) {
        LOG(ERROR) << "context " << s.context->id << " returned to pool in state " << get_state_name(s.context->state());
    }
    unclaim(s);
}

vector<unique_ptr<execution_context>> context_pool::collect_expired() {
    vector<unique_ptr<execution_context>> result;
    auto now = chrono::steady_clock::now();
    for (size_t i = 0; i < opts.capacity; ++i) {
        slot &s = slots[i];
        scoped_lock guard(s.mut);
        if (!s.borrowed && s.context && expired(*s.context, now))
            result.push_back(move(s.context));
    }
    return result;
}

vector<unique_ptr<execution_context>> context_pool::drain(chrono::milliseconds wait) {
    vector<unique_ptr<execution_context>> result;
    auto deadline = chrono::steady_clock::now() + wait;
    for (size_t i = 0; i < opts.capacity; ++i) {
        slot &s = slots[i];
        bool claimed = try_claim(s);
        while (!claimed && chrono::steady_clock::now() < deadline) {
            usleep(10 * 1000);
            claimed = try_claim(s);
        }
        if (!claimed) {
            LOG(WARNING) << "slot " << i << " is still borrowed while draining the context pool";
            continue;
        }
        if (s.context) result.push_back(move(s.context));
        unclaim(s);
    }
    return result;
}

size_t context_pool::idle_count(language lang) {
    size_t count = 0;
    for (size_t i = 0; i < opts.capacity; ++i) {
        slot &s = slots[i];
        scoped_lock guard(s.mut);
        if (!s.borrowed && s.context && s.context->lang == lang) ++count;
    }
    return count;
}

size_t context_pool::idle_count() {
    size_t count = 0;
    for (size_t i = 0; i < opts.capacity; ++i) {
        slot &s = slots[i];
        scoped_lock guard(s.mut);
        if (!s.borrowed && s.context) ++count;
    }
    return count;
}

}  // namespace codebox
