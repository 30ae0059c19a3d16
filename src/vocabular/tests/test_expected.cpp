#include <doctest/doctest.h>

#include <string>
#include <utility>
#include <type_traits>

#include <lazyext_vocabular/expected.h>
#include <lazyext_vocabular/never.h>

using namespace lazyext;

// A move-only type to exercise move paths
struct MoveOnly
{
  int v{};
  MoveOnly() = default;
  explicit MoveOnly(int x)
      : v(x)
  {
  }
  MoveOnly(const MoveOnly&)            = delete;
  MoveOnly& operator=(const MoveOnly&) = delete;
  MoveOnly(MoveOnly&& o) noexcept
      : v(o.v)
  {
    o.v = -1;
  }
  MoveOnly& operator=(MoveOnly&& o) noexcept
  {
    v   = o.v;
    o.v = -1;
    return *this;
  }
};

struct Pair
{
  int a{};
  int b{};
  Pair() = default;
  Pair(int x, int y)
      : a(x)
      , b(y)
  {
  }
};


TEST_CASE("lazyext/vocabular/expected: constructors")
{
  Expected<int, std::string> a;
  CHECK(a.is_expect());
  CHECK(a);
  CHECK(*a == 0);

  Expected<int, std::string> b(12);
  CHECK(b.value() == 12);

  Expected<int, std::string> e0(unexpected);
  CHECK(e0.is_error());
  CHECK(!e0);
  CHECK(e0.error().empty());

  std::string msg = "nope";
  Expected<int, std::string> e1(unexpected, msg);
  CHECK(e1.error() == "nope");

  Expected<int, std::string> e2(unexpected, std::string("boom"));
  CHECK(e2.error() == "boom");

  Expected<int, std::string> e3(in_place, unexpected, 4, 'x');
  CHECK(e3.error() == "xxxx");

  Expected<Pair, std::string> p(in_place, 1, 2);
  CHECK(p->a == 1);
  CHECK((*p).b == 2);
}

TEST_CASE("lazyext/vocabular/expected: copy and move between states")
{
  Expected<int, std::string> v1(10);
  Expected<int, std::string> e1(unexpected, std::string("e"));

  Expected<int, std::string> x(1);
  x = e1;
  CHECK(x.is_error());
  CHECK(x.error() == "e");

  x = v1;
  CHECK(x.is_expect());
  CHECK(*x == 10);

  Expected<int, std::string> y(unexpected, std::string("z"));
  y = std::move(v1);
  CHECK(*y == 10);

  Expected<int, std::string> z(std::move(e1));
  CHECK(z.error() == "e");

  Expected<std::string, std::string> s("abc");
  std::string moved = *std::move(s);
  CHECK(moved == "abc");
}

TEST_CASE("lazyext/vocabular/expected: map")
{
  Expected<int, std::string> ok(8);
  Expected<int, std::string> err(unexpected, std::string("boom"));

  auto a = ok.map([](int x) { return x * 10; });
  CHECK(*a == 80);
  auto b = err.map([](int x) { return x * 10; });
  CHECK(b.error() == "boom");

  // pointers to the value, as returned by the plugin accessors
  auto ptr = ok.map([](const int& x) { return &x; });
  CHECK(*ptr == &*ok);
  auto moved_err = std::move(err).map([](int x) { return static_cast<long>(x); });
  CHECK(moved_err.error() == "boom");
}

TEST_CASE("lazyext/vocabular/expected: move-only values")
{
  Expected<MoveOnly, std::string> v(in_place, 9);
  CHECK(v->v == 9);
  MoveOnly m = std::move(v).value();
  CHECK(m.v == 9);

  Expected<MoveOnly, std::string> v2(in_place, 11);
  auto mapped = std::move(v2).map([](MoveOnly&& mo) { return mo.v + 1; });
  CHECK(*mapped == 12);
}

TEST_CASE("lazyext/vocabular/never")
{
  // No object of type Never can be created...
  static_assert(!std::is_default_constructible_v<Never>);
  static_assert(!std::is_constructible_v<Never, int>);
  static_assert(is_never_v<Never>);
  static_assert(is_never_v<const Never>);
  static_assert(!is_never_v<int>);

  // ...so an Expected over Never cannot be built in the error state.
  using Infallible = Expected<int, Never>;
  static_assert(!std::is_constructible_v<Infallible, unexpected_t>);
  static_assert(!std::is_constructible_v<Infallible, in_place_t, unexpected_t>);
  static_assert(std::is_constructible_v<Infallible, int>);
  static_assert(std::is_copy_constructible_v<Infallible>);

  Infallible value = 5;
  CHECK(value.is_expect());
  CHECK(into_value(value) == 5);
  into_value(value) = 6;
  CHECK(*value == 6);
  CHECK(into_value(Infallible(7)) == 7);

  Expected<std::string, Never> str(in_place, "abc");
  CHECK(into_value(std::move(str)) == "abc");
}
