#include "http-method-parse.hpp"

#include <optional>
#include <string_view>

#include "canonurl/http-method.hpp"
#include "canonurl/string-equal-ignore-case.hpp"
#include "canonurl/toupperlower.hpp"

namespace canonurl::http {

namespace {

std::optional<Method> IfEqual(std::string_view str, Method method) {
  return CaseInsensitiveEqual(str, MethodToStr(method)) ? std::optional<Method>(method) : std::nullopt;
}

}  // namespace

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  switch (str.size()) {
    case 3:  // GET, PUT
      switch (tolower(str[0])) {
        case 'g':
          return IfEqual(str, Method::GET);
        case 'p':
          return IfEqual(str, Method::PUT);
        default:
          return std::nullopt;
      }
    case 4:  // HEAD, POST
      switch (tolower(str[0])) {
        case 'h':
          return IfEqual(str, Method::HEAD);
        case 'p':
          return IfEqual(str, Method::POST);
        default:
          return std::nullopt;
      }
    case 5:  // TRACE, PATCH
      switch (tolower(str[0])) {
        case 't':
          return IfEqual(str, Method::TRACE);
        case 'p':
          return IfEqual(str, Method::PATCH);
        default:
          return std::nullopt;
      }
    case 6:
      return IfEqual(str, Method::DELETE);
    case 7:  // CONNECT, OPTIONS
      switch (tolower(str[0])) {
        case 'c':
          return IfEqual(str, Method::CONNECT);
        case 'o':
          return IfEqual(str, Method::OPTIONS);
        default:
          return std::nullopt;
      }
    default:
      return std::nullopt;
  }
}

}  // namespace canonurl::http
