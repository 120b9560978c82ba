#include "canonurl/request-view.hpp"

#include <string_view>

#include "canonurl/http-method.hpp"
#include "http-method-parse.hpp"

namespace canonurl {

RequestView RequestView::Parse(std::string_view method, std::string_view scheme, std::string_view host,
                               std::string_view target, std::string_view pathBase) noexcept {
  RequestView view{.method = method, .scheme = scheme, .host = host, .pathBase = pathBase, .path = target};
  const auto queryPos = target.find('?');
  if (queryPos != std::string_view::npos) {
    view.path = target.substr(0, queryPos);
    view.queryString = target.substr(queryPos);
  }
  return view;
}

bool RequestView::isGet() const noexcept { return http::MethodStrToOptEnum(method) == http::Method::GET; }

}  // namespace canonurl
