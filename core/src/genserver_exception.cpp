#include <sstream>

#include "genserver/genserver_exception.hpp"

namespace genserver {
GenServerError::GenServerError(const std::string& msg):
  msg(msg) {
}

GenServerError::GenServerError(std::string&& msg):
  msg(std::move(msg)) {
}

const char* GenServerError::what() const noexcept {
  return msg.c_str();
}

std::exception_ptr CallbackError::cause() const noexcept {
  auto nested = dynamic_cast<const std::nested_exception*>(this);
  return nested ? nested->nested_ptr() : nullptr;
}

void print_exception(std::ostream& o, const std::exception& e, int level) {
  o << std::string(level, ' ') << "exception: " << e.what() << std::endl;
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& e) {
    print_exception(o, e, level + 1);
  } catch (...) {
    o << std::string(level + 1, ' ') << "exception: unknown" << std::endl;
  }
}

std::string describe_exception(const std::exception_ptr& e) {
  if (!e) {
    return "exception: none\n";
  }
  std::ostringstream oss;
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& x) {
    print_exception(oss, x);
  } catch (...) {
    oss << "exception: unknown" << std::endl;
  }
  return oss.str();
}
} // namespace genserver
