#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codebox {
using namespace std;

codebox_exception::codebox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *codebox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const codebox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

unsupported_language::unsupported_language(const string &language)
    : codebox_exception("Unsupported language: " + language), language(language) {}

invalid_request::invalid_request(const string &message)
    : codebox_exception(message) {}

not_found_error::not_found_error(const string &message)
    : codebox_exception(message) {}

internal_error::internal_error(const string &message)
    : codebox_exception(message) {}

network_error::network_error(const string &message)
    : codebox_exception(message) {}

store_error::store_error(const string &message)
    : codebox_exception(message) {}

service_unavailable::service_unavailable(const string &message)
    : codebox_exception(message) {}

}  // namespace codebox
