#include <doctest/doctest.h>
#include <optional>
#include <string>
#include <lazyext_plugin/pluggable.h>

namespace
{
  struct Host
      : lazyext::Extensible
      , lazyext::Pluggable<Host>
  {
    std::string name = "lazyext";
    int field        = 7;
    bool ready       = true;
    int calls        = 0;
  };

  /// One plugin per value of N, each counting its evaluations.
  template<int N>
  struct Num
  {
    int value;

    static std::optional<Num> eval(Host& host)
    {
      ++host.calls;
      return Num{N};
    }
  };

  struct IntPlugin
  {
    using extension_type = int;

    static std::optional<int> eval(Host& host)
    {
      ++host.calls;
      return host.field;
    }
  };

  struct NotReady
  {
    int value;

    static std::optional<NotReady> eval(Host& host)
    {
      ++host.calls;
      if (!host.ready)
        return std::nullopt;
      return NotReady{host.field};
    }
  };

  struct Parsed
  {
    int value;

    static lazyext::Expected<Parsed, std::string> eval(Host& host)
    {
      ++host.calls;
      if (!host.ready)
        return {lazyext::unexpected, std::string("host not ready")};
      return Parsed{host.field * 2};
    }
  };

  struct Length
  {
    using extension_type = std::size_t;

    static lazyext::Expected<std::size_t, lazyext::Never> eval(const Host& host)
    {
      return host.name.size();
    }
  };

  struct Upper
  {
    std::string value;

    static std::optional<Upper> eval(const Host& host)
    {
      std::string upper = host.name;
      for (auto& c : upper)
        c = static_cast<char>(c - 'a' + 'A');
      return Upper{std::move(upper)};
    }
  };

  /// Key that cannot declare an `eval`: found through `Phantom<long>`
  std::optional<long> eval(Host& host, lazyext::Phantom<long>)
  {
    ++host.calls;
    return static_cast<long>(host.field) * 100;
  }

  /// Host that owns its store without deriving from `Extensible`
  struct Document
  {
    lazyext::KeyedStore store;
    int words = 3;

    lazyext::KeyedStore& extensions() noexcept { return store; }
    const lazyext::KeyedStore& extensions() const noexcept { return store; }
  };

  struct WordCount
  {
    using extension_type = int;

    static std::optional<int> eval(const Document& doc) { return doc.words; }
  };

  /// Host that cannot store extensions
  struct Plain
  {
    int field = 3;
  };

  struct Squared
  {
    using extension_type = int;

    static std::optional<int> eval(const Plain& plain)
    {
      return plain.field * plain.field;
    }
  };
} // namespace

TEST_CASE("lazyext/plugin/concepts")
{
  using namespace lazyext;

  static_assert(IsExtensible<Host>);
  static_assert(IsExtensible<Document>);
  static_assert(!IsExtensible<Plain>);

  static_assert(IsOptionalPlugin<IntPlugin, Host>);
  static_assert(IsOptionalPlugin<long, Host>);
  static_assert(IsFalliblePlugin<Parsed, Host>);
  static_assert(IsPlugin<Length, Host>);
  static_assert(!IsPlugin<Length, Plain>);
  static_assert(!IsPlugin<std::string, Host>);

  static_assert(std::is_same_v<plugin_error_t<Parsed, Host>, std::string>);
  static_assert(is_infallible_v<Length, Host>);
  static_assert(!is_infallible_v<Parsed, Host>);
  static_assert(!is_infallible_v<IntPlugin, Host>);
  static_assert(!plugin_outcome_t<Length, Host>::can_fail);
  static_assert(plugin_outcome_t<Parsed, Host>::can_fail);
}

TEST_CASE("lazyext/plugin/get")
{
  Host host;

  SUBCASE("values are computed once")
  {
    auto first = host.get<IntPlugin>();
    REQUIRE(first.has_value());
    CHECK(*first == 7);
    CHECK(host.calls == 1);

    auto second = host.get<IntPlugin>();
    REQUIRE(second.has_value());
    CHECK(*second == 7);
    CHECK(host.calls == 1);
  }
  SUBCASE("a custom return type is stored under its key")
  {
    CHECK(*host.get_ref<IntPlugin>() == 7);
    CHECK(host.extensions().contains<IntPlugin>());
    CHECK_FALSE(host.extensions().contains<int>());
  }
  SUBCASE("ten plugins requested in reverse order")
  {
    CHECK(host.get<Num<10>>()->value == 10);
    CHECK(host.get<Num<9>>()->value == 9);
    CHECK(host.get<Num<8>>()->value == 8);
    CHECK(host.get<Num<7>>()->value == 7);
    CHECK(host.get<Num<6>>()->value == 6);
    CHECK(host.get<Num<5>>()->value == 5);
    CHECK(host.get<Num<4>>()->value == 4);
    CHECK(host.get<Num<3>>()->value == 3);
    CHECK(host.get<Num<2>>()->value == 2);
    CHECK(host.get<Num<1>>()->value == 1);
    CHECK(host.calls == 10);
    CHECK(host.extensions().size() == 10);

    CHECK(host.get<Num<1>>()->value == 1);
    CHECK(host.get<Num<10>>()->value == 10);
    CHECK(host.calls == 10);
  }
  SUBCASE("the requests order does not change the values")
  {
    Host other;
    CHECK(other.get<Num<2>>()->value == host.get<Num<1>>()->value + 1);
    CHECK(other.get<Num<1>>()->value == host.get<Num<2>>()->value - 1);
    CHECK(host.calls == 2);
    CHECK(other.calls == 2);
  }
  SUBCASE("references stay stable and mutations are observed")
  {
    int* value = host.get_mut<IntPlugin>();
    REQUIRE(value != nullptr);
    CHECK(host.get_ref<IntPlugin>() == value);

    *value = 42;
    CHECK(*host.get<IntPlugin>() == 42);
    CHECK(host.calls == 1);
  }
  SUBCASE("hosts do not share their values")
  {
    Host other;
    other.field = 11;
    CHECK(*host.get<IntPlugin>() == 7);
    CHECK(*other.get<IntPlugin>() == 11);
  }
  SUBCASE("the free functions and the mixin share the cache")
  {
    CHECK(*lazyext::get_ref<IntPlugin>(host) == 7);
    CHECK(host.get_ref<IntPlugin>() == lazyext::get_ref<IntPlugin>(host));
    CHECK(host.calls == 1);
  }
  SUBCASE("values inserted directly are returned without evaluation")
  {
    host.extensions().insert<IntPlugin>(99);
    CHECK(*host.get<IntPlugin>() == 99);
    CHECK(host.calls == 0);
  }
  SUBCASE("removing the entry evaluates the plugin again")
  {
    CHECK(*host.get<IntPlugin>() == 7);
    host.field = 8;
    CHECK(*host.get<IntPlugin>() == 7);
    CHECK(host.extensions().remove<IntPlugin>());
    CHECK(*host.get<IntPlugin>() == 8);
    CHECK(host.calls == 2);
  }
  SUBCASE("keys without eval are found through Phantom")
  {
    CHECK(*host.get<long>() == 700);
    CHECK(*host.get_ref<long>() == 700);
    CHECK(host.calls == 1);
  }
  SUBCASE("hosts without the mixin")
  {
    Document doc;
    CHECK(*lazyext::get<WordCount>(doc) == 3);
    doc.words = 4;
    CHECK(*lazyext::get_ref<WordCount>(doc) == 3);
    CHECK(doc.store.contains<WordCount>());
  }
}

TEST_CASE("lazyext/plugin/failures")
{
  Host host;
  host.ready = false;

  SUBCASE("empty optionals are not stored")
  {
    CHECK(host.get_mut<NotReady>() == nullptr);
    CHECK(host.get_ref<NotReady>() == nullptr);
    CHECK_FALSE(host.get<NotReady>().has_value());
    CHECK_FALSE(host.extensions().contains<NotReady>());
    CHECK(host.calls == 3);

    host.ready = true;
    REQUIRE(host.get_ref<NotReady>() != nullptr);
    CHECK(host.get_ref<NotReady>()->value == 7);
    CHECK(host.extensions().contains<NotReady>());
    CHECK(host.calls == 4);
  }
  SUBCASE("errors are forwarded and not stored")
  {
    auto failed = host.get<Parsed>();
    REQUIRE(failed.is_error());
    CHECK(failed.error() == "host not ready");

    auto failed_ref = host.get_ref<Parsed>();
    REQUIRE(failed_ref.is_error());
    CHECK(failed_ref.error() == "host not ready");
    CHECK_FALSE(host.extensions().contains<Parsed>());
    CHECK(host.calls == 2);

    host.ready = true;
    auto parsed = host.get_mut<Parsed>();
    REQUIRE(parsed.is_expect());
    CHECK((*parsed)->value == 14);

    auto again = host.get_ref<Parsed>();
    REQUIRE(again.is_expect());
    CHECK(*again == *parsed);
    CHECK(host.calls == 3);
  }
}

TEST_CASE("lazyext/plugin/infallible")
{
  Host host;

  std::size_t* length = lazyext::into_value(host.get_mut<Length>());
  REQUIRE(length != nullptr);
  CHECK(*length == 7u);

  const std::size_t* again = lazyext::into_value(host.get_ref<Length>());
  CHECK(again == length);
  CHECK(lazyext::into_value(host.get<Length>()) == 7u);

  auto computed = host.compute<Length>();
  CHECK(lazyext::into_value(computed) == 7u);
}

TEST_CASE("lazyext/plugin/compute")
{
  SUBCASE("never reads nor writes the cache")
  {
    Host host;
    host.extensions().insert<IntPlugin>(99);

    auto computed = host.compute<IntPlugin>();
    REQUIRE(computed.has_value());
    CHECK(*computed == 7);
    CHECK(*host.compute<IntPlugin>() == 7);
    CHECK(host.calls == 2);
    CHECK(*host.extensions().retrieve_ref<IntPlugin>() == 99);

    host.extensions().clear();
    CHECK(*lazyext::compute<IntPlugin>(host) == 7);
    CHECK_FALSE(host.extensions().contains<IntPlugin>());
    CHECK(host.calls == 3);
  }
  SUBCASE("evaluates again after a value was cached by get")
  {
    Host host;
    CHECK(*host.get<IntPlugin>() == 7);
    CHECK(host.calls == 1);

    host.field = 8;
    CHECK(*host.compute<IntPlugin>() == 8);
    CHECK(*host.compute<IntPlugin>() == 8);
    CHECK(host.calls == 3);

    // the cached value is left untouched
    CHECK(*host.get<IntPlugin>() == 7);
    CHECK(host.calls == 3);
  }
  SUBCASE("const hosts")
  {
    Host mutable_host;
    const Host& host = mutable_host;
    auto upper = host.compute<Upper>();
    REQUIRE(upper.has_value());
    CHECK(upper->value == "LAZYEXT");
    CHECK(host.extensions().is_empty());
  }
  SUBCASE("hosts without extensions")
  {
    Plain plain;
    CHECK(*lazyext::compute<Squared>(plain) == 9);
  }
}
