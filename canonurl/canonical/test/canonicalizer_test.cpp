#include "canonurl/canonicalizer.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <string_view>

#include "canonurl/canonical-decision.hpp"
#include "canonurl/canonicalization-options.hpp"
#include "canonurl/exemptions.hpp"
#include "canonurl/request-view.hpp"

namespace canonurl {

namespace {

constexpr std::array kLowercasePaths = {"/a", "/about", "/products/item-42", "/blog/2024/01/hello-world",
                                        "/caf%c3%a9", "/a//b"};

constexpr std::array kMixedCasePaths = {"/About", "/PRODUCTS/Item-42", "/blog/2024/01/Hello-World", "/Caf%C3%A9",
                                        "/aBc/"};

RequestView Request(std::string_view path, std::string_view queryString = {}) {
  return RequestView{.method = "GET", .scheme = "https", .host = "example.com", .path = path, .queryString = queryString};
}

}  // namespace

class CanonicalizerTest : public ::testing::Test {
 protected:
  CanonicalDecision eval(std::string_view path, std::string_view queryString = {}) const {
    return EvaluateCanonicalUrl(Request(path, queryString), options, exemptions);
  }

  // Re-evaluates the canonical form computed by a previous Redirect decision.
  CanonicalDecision reeval(const CanonicalDecision& decision) const {
    return EvaluateCanonicalUrl(Request(decision.path(), decision.queryString()), options, exemptions);
  }

  CanonicalizationOptions options;
  Exemptions exemptions;
};

TEST_F(CanonicalizerTest, AppendTrailingSlash) {
  options.withAppendTrailingSlash();
  for (std::string_view path : kLowercasePaths) {
    const auto decision = eval(path);
    ASSERT_TRUE(decision.isRedirect()) << path;
    EXPECT_EQ(decision.canonicalUrl(), "https://example.com" + std::string(path) + '/');
    EXPECT_EQ(decision.path(), std::string(path) + '/');
    EXPECT_EQ(decision.fixes(), static_cast<CanonicalFixBmp>(CanonicalFix::AppendTrailingSlash));

    EXPECT_TRUE(eval(std::string(path) + '/').isCanonical()) << path;
  }
}

TEST_F(CanonicalizerTest, StripTrailingSlash) {
  options.withAppendTrailingSlash(false);
  for (std::string_view path : kLowercasePaths) {
    const auto slashed = std::string(path) + '/';
    const auto decision = eval(slashed);
    ASSERT_TRUE(decision.isRedirect()) << slashed;
    EXPECT_EQ(decision.canonicalUrl(), "https://example.com" + std::string(path));
    EXPECT_TRUE(decision.hasFix(CanonicalFix::StripTrailingSlash));

    EXPECT_TRUE(eval(path).isCanonical()) << path;
  }
}

TEST_F(CanonicalizerTest, StripAllTrailingSlashes) {
  const auto decision = eval("/contact///");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/contact");
}

TEST_F(CanonicalizerTest, StrippingOnlySlashesGivesRoot) {
  const auto decision = eval("//");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.path(), "/");
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/");
  EXPECT_TRUE(reeval(decision).isCanonical());
}

TEST_F(CanonicalizerTest, RootIsAlwaysCanonical) {
  for (bool appendTrailingSlash : {false, true}) {
    for (bool lowercaseUrls : {false, true}) {
      options.withAppendTrailingSlash(appendTrailingSlash).withLowercaseUrls(lowercaseUrls);
      EXPECT_TRUE(eval("/").isCanonical());
      EXPECT_TRUE(eval("").isCanonical());
    }
  }
}

TEST_F(CanonicalizerTest, LowercasePath) {
  options.withLowercaseUrls();
  for (std::string_view path : kMixedCasePaths) {
    std::string expected(path);
    for (char& ch : expected) {
      if (ch >= 'A' && ch <= 'Z') {
        ch = static_cast<char>(ch - 'A' + 'a');
      }
    }
    if (expected.size() > 1 && expected.back() == '/') {
      expected.pop_back();
    }
    const auto decision = eval(path);
    ASSERT_TRUE(decision.isRedirect()) << path;
    EXPECT_TRUE(decision.hasFix(CanonicalFix::LowercasePath));
    EXPECT_EQ(decision.path(), expected);
  }
  for (std::string_view path : kLowercasePaths) {
    EXPECT_TRUE(eval(path).isCanonical()) << path;
  }
}

TEST_F(CanonicalizerTest, NoLowercaseWhenDisabled) {
  EXPECT_TRUE(eval("/About", "?Q=X").isCanonical());
}

TEST_F(CanonicalizerTest, LowercaseQueryString) {
  options.withLowercaseUrls();
  auto decision = eval("/search", "?Q=Shoes&Page=2");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.fixes(), static_cast<CanonicalFixBmp>(CanonicalFix::LowercaseQueryString));
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/search?q=shoes&page=2");
  EXPECT_EQ(decision.queryString(), "?q=shoes&page=2");

  EXPECT_TRUE(eval("/search", "?q=shoes").isCanonical());
}

TEST_F(CanonicalizerTest, LowercaseQueryStringOnRoot) {
  options.withLowercaseUrls();
  auto decision = eval("/", "?Ref=Home");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/?ref=home");
  EXPECT_TRUE(reeval(decision).isCanonical());

  decision = eval("", "?Ref=Home");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/?ref=home");
  EXPECT_TRUE(reeval(decision).isCanonical());
}

TEST_F(CanonicalizerTest, NoLowercaseQueryStringExemption) {
  options.withLowercaseUrls();
  exemptions = kNoLowercaseQueryStringRule;
  EXPECT_TRUE(eval("/search", "?Q=Shoes").isCanonical());

  const auto decision = eval("/Search", "?Q=Shoes");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.fixes(), static_cast<CanonicalFixBmp>(CanonicalFix::LowercasePath));
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/search?Q=Shoes");
}

TEST_F(CanonicalizerTest, NoTrailingSlashExemptionSuppressesAppend) {
  options.withAppendTrailingSlash();
  exemptions = kNoTrailingSlashRule;
  EXPECT_TRUE(eval("/sitemap.xml").isCanonical());
  EXPECT_TRUE(eval("/sitemap.xml/").isCanonical());
}

TEST_F(CanonicalizerTest, NoTrailingSlashExemptionDoesNotSuppressStrip) {
  options.withAppendTrailingSlash(false);
  exemptions = kNoTrailingSlashRule;
  const auto decision = eval("/feed/");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/feed");
}

TEST_F(CanonicalizerTest, NoTrailingSlashExemptionSuppressesLowercasing) {
  options.withLowercaseUrls();
  exemptions = kNoTrailingSlashRule;
  EXPECT_TRUE(eval("/Files/Report.PDF", "?Token=AbC").isCanonical());

  options.withAppendTrailingSlash(false);
  const auto decision = eval("/Files/");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.fixes(), static_cast<CanonicalFixBmp>(CanonicalFix::StripTrailingSlash));
  EXPECT_EQ(decision.path(), "/Files");
}

TEST_F(CanonicalizerTest, MultipleFixesGiveSingleRedirect) {
  options.withAppendTrailingSlash().withLowercaseUrls();
  const auto decision = eval("/Products/Item", "?Color=Red");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.fixes(), CanonicalFix::AppendTrailingSlash | CanonicalFix::LowercasePath |
                                  CanonicalFix::LowercaseQueryString);
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/products/item/?color=red");
}

TEST_F(CanonicalizerTest, StripAndLowercase) {
  options.withLowercaseUrls();
  const auto decision = eval("/Contact/");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.fixes(), CanonicalFix::StripTrailingSlash | CanonicalFix::LowercasePath);
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/contact");
}

TEST_F(CanonicalizerTest, AboutScenario) {
  options.withAppendTrailingSlash().withLowercaseUrls();
  const auto decision = eval("/About");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.path(), "/about/");
  EXPECT_EQ(decision.queryString(), "");
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/about/");
}

TEST_F(CanonicalizerTest, ContactScenario) {
  options.withAppendTrailingSlash(false);
  const auto decision = eval("/contact/");
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.path(), "/contact");
  EXPECT_EQ(decision.canonicalUrl(), "https://example.com/contact");
}

TEST_F(CanonicalizerTest, Idempotence) {
  static constexpr std::array<std::string_view, 8> kPaths = {"/About", "/about/", "/Contact///", "//",
                                                             "/A/B/C",  "/x",      "/Caf%C3%A9/", "/"};
  static constexpr std::array<std::string_view, 3> kQueries = {"", "?Q=1", "?q=a&B=c"};
  static constexpr std::array<Exemptions, 4> kExemptions = {Exemptions{}, kNoTrailingSlashRule,
                                                            kNoLowercaseQueryStringRule,
                                                            kNoTrailingSlashRule | kNoLowercaseQueryStringRule};
  for (bool appendTrailingSlash : {false, true}) {
    for (bool lowercaseUrls : {false, true}) {
      options.withAppendTrailingSlash(appendTrailingSlash).withLowercaseUrls(lowercaseUrls);
      for (const Exemptions& exemptionsCase : kExemptions) {
        exemptions = exemptionsCase;
        for (std::string_view path : kPaths) {
          for (std::string_view query : kQueries) {
            const auto decision = eval(path, query);
            if (decision.isRedirect()) {
              EXPECT_TRUE(reeval(decision).isCanonical())
                  << "path=" << path << " query=" << query << " canonical=" << decision.canonicalUrl();
            }
          }
        }
      }
    }
  }
}

TEST_F(CanonicalizerTest, CanonicalUrlKeepsHostPortAndPathBase) {
  options.withAppendTrailingSlash();
  const auto request = RequestView::Parse("GET", "http", "localhost:8080", "/Docs?Page=1", "/app");
  const auto decision = EvaluateCanonicalUrl(request, options, exemptions);
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.canonicalUrl(), "http://localhost:8080/app/Docs/?Page=1");
  EXPECT_EQ(decision.path(), "/Docs/");
  EXPECT_EQ(decision.queryString(), "?Page=1");
}

TEST_F(CanonicalizerTest, OffsetsHoldForLongPathBase) {
  options.withLowercaseUrls();
  const std::string pathBase = "/" + std::string(70000, 'b');
  const std::string path = "/" + std::string(70000, 'P');
  const auto request = RequestView::Parse("GET", "https", "example.com", path + "?Q=1", pathBase);
  const auto decision = EvaluateCanonicalUrl(request, options, exemptions);
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.canonicalUrl().size(), std::string_view("https://example.com").size() + pathBase.size() +
                                                path.size() + std::string_view("?q=1").size());
  EXPECT_EQ(decision.path(), "/" + std::string(70000, 'p'));
  EXPECT_EQ(decision.queryString(), "?q=1");
}

TEST_F(CanonicalizerTest, OriginRelativeUrlWithoutHost) {
  options.withLowercaseUrls();
  const auto decision = EvaluateCanonicalUrl(RequestView{.method = "GET", .path = "/News"}, options, exemptions);
  ASSERT_TRUE(decision.isRedirect());
  EXPECT_EQ(decision.canonicalUrl(), "/news");
  EXPECT_EQ(decision.path(), "/news");
}

TEST_F(CanonicalizerTest, NonAsciiBytesAreNotLowercased) {
  options.withLowercaseUrls();
  EXPECT_TRUE(eval("/\xC3\x89t\xC3\xA9").isCanonical());
}

TEST(CanonicalizerClassTest, ForwardsToEvaluate) {
  Canonicalizer canonicalizer(CanonicalizationOptions{}.withAppendTrailingSlash().withLowercaseUrls());
  EXPECT_TRUE(canonicalizer.options().appendTrailingSlash);
  EXPECT_TRUE(canonicalizer.options().lowercaseUrls);

  const auto request = Request("/About");
  EXPECT_EQ(canonicalizer.evaluate(request).canonicalUrl(), "https://example.com/about/");
  EXPECT_TRUE(canonicalizer.evaluate(request, kNoTrailingSlashRule).isCanonical());

  EXPECT_TRUE(Canonicalizer().evaluate(request).isCanonical());
}

TEST(CanonicalDecisionTest, DefaultIsCanonical) {
  const CanonicalDecision decision;
  EXPECT_TRUE(decision.isCanonical());
  EXPECT_FALSE(decision.isRedirect());
  EXPECT_TRUE(decision.canonicalUrl().empty());
  EXPECT_TRUE(decision.path().empty());
  EXPECT_TRUE(decision.queryString().empty());
  EXPECT_EQ(decision.fixes(), 0);
}

}  // namespace canonurl
