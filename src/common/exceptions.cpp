#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codebox {
using namespace std;

sandbox_exception::sandbox_exception()
    : sandbox_exception("") {}

sandbox_exception::sandbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *sandbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : sandbox_exception() {}

internal_error::internal_error(const string &message)
    : sandbox_exception(message) {}

engine_unreachable::engine_unreachable()
    : sandbox_exception() {}

engine_unreachable::engine_unreachable(const string &message)
    : sandbox_exception(message) {}

engine_unavailable::engine_unavailable()
    : sandbox_exception() {}

engine_unavailable::engine_unavailable(const string &message)
    : sandbox_exception(message) {}

context_fault::context_fault()
    : sandbox_exception() {}

context_fault::context_fault(const string &message)
    : sandbox_exception(message) {}

}  // namespace codebox
