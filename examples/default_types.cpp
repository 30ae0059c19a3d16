#include <cstdio>
#include <optional>
#include <lazyext_plugin/pluggable.h>
#include <lazyext_tracing/tracing.h>

/// Host owning its extensions
struct Struct : lazyext::Pluggable<Struct>
{
  lazyext::KeyedStore map;

  lazyext::KeyedStore& extensions() noexcept { return map; }
  const lazyext::KeyedStore& extensions() const noexcept { return map; }
};

/// Plugin whose key is also its value
struct IntPlugin
{
  int field;

  static std::optional<IntPlugin> eval(Struct&) { return IntPlugin{7}; }
};

int main()
{
  if constexpr (lazyext::is_tracing_enabled())
    std::printf("Tracy zones enabled\n");

  Struct x;
  if (const IntPlugin* plugin = x.get_ref<IntPlugin>())
    std::printf("IntPlugin { field: %d }\n", plugin->field);
  else
    std::printf("None\n");
}
