#include <NGIN/PolyJson/ConfigurationCache.hpp>

#include <mutex>

namespace NGIN::PolyJson
{

  SharedConfig ConfigurationCache::Find(NGIN::UInt64 baseTypeId, const SerializerOptions *options) const
  {
    std::shared_lock lock{m_mutex};
    if (auto it = m_entries.find(Key{baseTypeId, options}); it != m_entries.end())
      return it->second.config;
    return nullptr;
  }

  SharedConfig ConfigurationCache::Publish(NGIN::UInt64 baseTypeId, const SharedOptions &options, SharedConfig config)
  {
    std::unique_lock lock{m_mutex};
    auto it = m_entries.try_emplace(Key{baseTypeId, options.get()}, Entry{options, std::move(config)}).first;
    return it->second.config;
  }

  NGIN::UIntSize ConfigurationCache::Size() const
  {
    std::shared_lock lock{m_mutex};
    return m_entries.size();
  }

} // namespace NGIN::PolyJson
