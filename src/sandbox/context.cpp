#include "sandbox/context.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"

namespace codebox {
using namespace std;

// clang-format off
static const unordered_map<context_state, const char *> state_name = boost::assign::map_list_of
    (context_state::PROVISIONING, "provisioning")
    (context_state::READY, "ready")
    (context_state::RUNNING, "running")
    (context_state::FAULTED, "faulted")
    (context_state::TERMINATED, "terminated");
// clang-format on

const char *get_state_name(context_state state) {
    return state_name.at(state);
}

execution_context::execution_context(string id, language lang, resource_limits limits, filesystem::path scratch_dir)
    : id(move(id)), lang(lang), limits(limits), scratch_dir(move(scratch_dir)) {
    created_at = last_used_at = chrono::steady_clock::now();
}

context_state execution_context::state() const {
    return current;
}

bool execution_context::can_transition(context_state next) const {
    switch (current) {
        case context_state::PROVISIONING:
            return next == context_state::READY || next == context_state::FAULTED;
        case context_state::READY:
            return next == context_state::RUNNING || next == context_state::TERMINATED;
        case context_state::RUNNING:
            return next == context_state::READY || next == context_state::FAULTED;
        case context_state::FAULTED:
            return next == context_state::TERMINATED;
        case context_state::TERMINATED:
            return false;
    }
    return false;
}

void execution_context::transition(context_state next) {
    if (!can_transition(next))
        throw internal_error(fmt::format("illegal transition of context {} from {} to {}",
                                         id, get_state_name(current), get_state_name(next)));
    DLOG(INFO) << "context " << id << ": " << get_state_name(current) << " -> " << get_state_name(next);
    current = next;
}

void execution_context::touch() {
    last_used_at = chrono::steady_clock::now();
}

}  // namespace codebox
