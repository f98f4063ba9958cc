#include <unistd.h>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/context.hpp"

using namespace std;
using namespace codebox;

static execution_context make_context() {
    return execution_context("ctx", language::PYTHON, resource_limits::defaults(), "/tmp/codebox-ctx");
}

TEST(ContextTest, Lifecycle) {
    auto ctx = make_context();
    EXPECT_EQ(ctx.state(), context_state::PROVISIONING);
    ctx.transition(context_state::READY);
    ctx.transition(context_state::RUNNING);
    ctx.transition(context_state::READY);
    ctx.transition(context_state::RUNNING);
    ctx.transition(context_state::FAULTED);
    ctx.transition(context_state::TERMINATED);
    EXPECT_EQ(ctx.state(), context_state::TERMINATED);
}

TEST(ContextTest, IdleContextCanBeTerminated) {
    auto ctx = make_context();
    ctx.transition(context_state::READY);
    ctx.transition(context_state::TERMINATED);
    EXPECT_EQ(ctx.state(), context_state::TERMINATED);
}

TEST(ContextTest, RejectsIllegalTransitions) {
    auto ctx = make_context();
    EXPECT_FALSE(ctx.can_transition(context_state::RUNNING));
    EXPECT_THROW(ctx.transition(context_state::RUNNING), internal_error);
    EXPECT_THROW(ctx.transition(context_state::TERMINATED), internal_error);

    ctx.transition(context_state::READY);
    ctx.transition(context_state::RUNNING);
    // 运行中的上下文必须先进入 FAULTED 才能销毁
    EXPECT_THROW(ctx.transition(context_state::TERMINATED), internal_error);

    ctx.transition(context_state::FAULTED);
    EXPECT_THROW(ctx.transition(context_state::READY), internal_error);
    ctx.transition(context_state::TERMINATED);
    for (auto next : {context_state::PROVISIONING, context_state::READY, context_state::RUNNING,
                      context_state::FAULTED, context_state::TERMINATED})
        EXPECT_FALSE(ctx.can_transition(next));
}

TEST(ContextTest, Touch) {
    auto ctx = make_context();
    auto before = ctx.last_used_at;
    usleep(2000);
    ctx.touch();
    EXPECT_GT(ctx.last_used_at, before);
    EXPECT_EQ(ctx.created_at, before);
}
