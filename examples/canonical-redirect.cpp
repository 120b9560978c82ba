#include <canonurl/canonurl.hpp>
#include <canonurl/log.hpp>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <utility>

// Evaluates request targets given on the command line and logs the decision of the canonical URL middleware.
// Usage: canonical-redirect [--append-slash] [--lowercase] [--308] [--exempt <route>]... <target>...
// Example: canonical-redirect --append-slash --lowercase --exempt /sitemap.xml /About "/Search?Q=Shoes" /sitemap.xml
int main(int argc, char** argv) {
  using namespace canonurl;

  CanonicalizationOptions options;
  CanonicalUrlMiddlewareConfig config;
  ExemptionRegistry registry;

  int argPos = 1;
  try {
    for (; argPos < argc; ++argPos) {
      const std::string_view arg(argv[argPos]);
      if (arg == "--append-slash") {
        options.withAppendTrailingSlash();
      } else if (arg == "--lowercase") {
        options.withLowercaseUrls();
      } else if (arg == "--308") {
        config.withRedirectStatusCode(http::StatusCodePermanentRedirect);
      } else if (arg == "--exempt") {
        if (argPos + 1 == argc) {
          log::error("Missing route after --exempt");
          return EXIT_FAILURE;
        }
        registry.add(argv[++argPos], kNoTrailingSlashRule);
      } else {
        break;
      }
    }
  } catch (const std::exception& ex) {
    log::error("Invalid exemption route: {}", ex.what());
    return EXIT_FAILURE;
  }

  if (argPos == argc) {
    log::error("No request target given");
    return EXIT_FAILURE;
  }

  const CanonicalUrlMiddleware middleware(options, std::move(registry), config);

  for (; argPos < argc; ++argPos) {
    const auto request = RequestView::Parse(http::MethodToStr(http::Method::GET), "https", "example.com", argv[argPos]);
    auto result = middleware(request);
    if (result.shouldContinue()) {
      log::info("{} is canonical", argv[argPos]);
    } else {
      const HttpResponse resp = std::move(result).takeResponse();
      log::info("{} -> {} {} Location: {}", argv[argPos], resp.status(), resp.reason(),
                resp.headerValueOrEmpty(http::Location));
    }
  }

  return EXIT_SUCCESS;
}
