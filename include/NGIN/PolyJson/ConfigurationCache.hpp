// ConfigurationCache.hpp
// Thread-safe (base type, options identity) -> configuration cache
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/PolyJson/Config.hpp>
#include <NGIN/PolyJson/Options.hpp>

#include <expected>
#include <functional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace NGIN::PolyJson
{

  /**
   * Entries are keyed by the options object's address and keep that object alive,
   * so an address is never reused while its entry exists. Computation runs outside
   * the lock; when two callers race, the first published configuration wins and
   * both receive it. Entries are never evicted.
   */
  class NGIN_POLYJSON_API ConfigurationCache
  {
  public:
    template <class Fn>
    [[nodiscard]] std::expected<SharedConfig, Error> GetOrCompute(NGIN::UInt64 baseTypeId, const SharedOptions &options, Fn &&compute)
    {
      if (auto hit = Find(baseTypeId, options.get()))
        return hit;
      std::expected<SharedConfig, Error> built = std::forward<Fn>(compute)();
      if (!built)
        return std::unexpected(std::move(built.error()));
      return Publish(baseTypeId, options, std::move(*built));
    }

    [[nodiscard]] SharedConfig Find(NGIN::UInt64 baseTypeId, const SerializerOptions *options) const;
    [[nodiscard]] NGIN::UIntSize Size() const;

  private:
    struct Key
    {
      NGIN::UInt64 baseTypeId{0};
      const SerializerOptions *options{nullptr};
      bool operator==(const Key &) const = default;
    };

    struct KeyHash
    {
      std::size_t operator()(const Key &k) const noexcept
      {
        return std::hash<NGIN::UInt64>{}(k.baseTypeId) ^ (std::hash<const void *>{}(k.options) * 1099511628211ull);
      }
    };

    struct Entry
    {
      SharedOptions options;
      SharedConfig config;
    };

    SharedConfig Publish(NGIN::UInt64 baseTypeId, const SharedOptions &options, SharedConfig config);

    mutable std::shared_mutex m_mutex;
    std::unordered_map<Key, Entry, KeyHash> m_entries;
  };

} // namespace NGIN::PolyJson
