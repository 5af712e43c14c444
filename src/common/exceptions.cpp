#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace scorer {
using namespace std;

scorer_exception::scorer_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *scorer_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const scorer_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : scorer_exception(message) {}

launch_error::launch_error(const string &message)
    : scorer_exception(message) {}

}  // namespace scorer
