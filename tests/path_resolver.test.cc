#include "distill/loader.hh"
#include "distill/path_resolver.hh"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using distill::lookup;
using distill::LookupFailure;
using distill::ordered_node;
using distill::internal::to_string_any;

namespace {

  const ordered_node& sample() {
    static const ordered_node doc = distill::parse_yaml(
      "build:\n"
      "  type:\n"
      "    container:\n"
      "      image_basename: builda-bar\n"
      "mirrors:\n"
      "  - name: first\n"
      "  - name: second\n"
      "count: 3\n" );
    return doc;
  }

} // namespace

TEST_CASE("lookup: nested mapping path") {
  const ordered_node* v = lookup( "build.type.container.image_basename",
    sample() );
  REQUIRE(v != nullptr);
  CHECK(to_string_any(*v) == "builda-bar");
}

TEST_CASE("lookup: numeric segment indexes a sequence") {
  const ordered_node* v = lookup( "mirrors.1.name", sample() );
  REQUIRE(v != nullptr);
  CHECK(to_string_any(*v) == "second");
}

TEST_CASE("lookup: pre-split segments") {
  const std::vector< std::string > segs{ "mirrors", "0", "name" };
  const ordered_node* v = lookup( segs, sample() );
  REQUIRE(v != nullptr);
  CHECK(to_string_any(*v) == "first");
}

TEST_CASE("lookup: missing key reports the failing segment") {
  LookupFailure failure;
  CHECK(lookup("build.kind.container", sample(), &failure) == nullptr);
  CHECK(failure.path == "build.kind.container");
  CHECK(failure.segment == "kind");
  CHECK(failure.reason == "no such key");
  CHECK(failure.describe().find("'build.kind.container'")
    != std::string::npos);
}

TEST_CASE("lookup: sequence index errors") {
  LookupFailure failure;
  CHECK(lookup("mirrors.2", sample(), &failure) == nullptr);
  CHECK(failure.segment == "2");
  CHECK(failure.reason.find("out of range") != std::string::npos);

  CHECK(lookup("mirrors.name", sample(), &failure) == nullptr);
  CHECK(failure.reason.find("non-negative integer") != std::string::npos);
}

TEST_CASE("lookup: cannot descend into a scalar") {
  LookupFailure failure;
  CHECK(lookup("count.value", sample(), &failure) == nullptr);
  CHECK(failure.segment == "value");
  CHECK(failure.reason == "cannot index into a scalar value");
}

TEST_CASE("lookup: empty segments never match") {
  LookupFailure failure;
  CHECK(lookup("build..type", sample(), &failure) == nullptr);
  CHECK(failure.reason == "empty path segment");
  CHECK(lookup("", sample()) == nullptr);
}

TEST_CASE("lookup: failure_out is optional") {
  CHECK(lookup("nothing.here", sample()) == nullptr);
}
