#include <doctest/doctest.h>
#include <string_view>
#include <lazyext_contracts/contracts.h>

static unsigned violation_counts = 0;
static lazyext::contracts::Kind last_kind = lazyext::contracts::Kind::Assert;

static void counting_handler(
    const char*, const char*, lazyext::contracts::Kind kind,
    const std::optional<std::source_location>&) noexcept
{
  ++violation_counts;
  last_kind = kind;
}

static constexpr int checked_half(int value) noexcept
{
  LAZYEXT_pre(value % 2 == 0, "Value must be even!");
  const int half = value / 2;
  LAZYEXT_assert(half * 2 <= value, "");
  LAZYEXT_post(half <= value || value < 0, "");
  return half;
}

TEST_CASE("lazyext/contracts: constant evaluation")
{
  // satisfied contracts do not prevent constant evaluation
  static_assert(checked_half(10) == 5);
  constexpr int half = checked_half(-4);
  CHECK(half == -2);

  auto previous = lazyext::contracts::register_violation_handler(&counting_handler);
  violation_counts = 0;
  volatile int odd = 7;
  CHECK(checked_half(odd) == 3);
  CHECK(violation_counts == 1);
  CHECK(last_kind == lazyext::contracts::Kind::Pre);
  lazyext::contracts::register_violation_handler(previous);
}

TEST_CASE("lazyext/contracts")
{
  using namespace lazyext::contracts;

  // cheat a bit: rather than aborting, count the violations.
  auto previous = register_violation_handler(&counting_handler);
  CHECK(previous == nullptr);

  SUBCASE("satisfied contracts are silent")
  {
    violation_counts = 0;
    LAZYEXT_pre("evaluates to true", "");
    LAZYEXT_post(10, "");
    LAZYEXT_assert(1.0f, "");
    CHECK(violation_counts == 0);
  }
  SUBCASE("violations report their kind")
  {
    violation_counts = 0;
    LAZYEXT_pre(nullptr, "");
    CHECK(last_kind == Kind::Pre);
    LAZYEXT_post(false, "");
    CHECK(last_kind == Kind::Post);
    LAZYEXT_assert(0, "");
    CHECK(last_kind == Kind::Assert);
    CHECK(violation_counts == 3);
  }
  SUBCASE("kind names")
  {
    CHECK(std::string_view{to_string(Kind::Pre)} == "precondition");
    CHECK(std::string_view{to_string(Kind::Post)} == "postcondition");
    CHECK(std::string_view{to_string(Kind::Assert)} == "assertion");
  }

  // restore the default handler
  CHECK(register_violation_handler(nullptr) == &counting_handler);
  CHECK(register_violation_handler(nullptr) == nullptr);
}
