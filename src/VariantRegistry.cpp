#include <NGIN/PolyJson/VariantRegistry.hpp>

#include <limits>
#include <string>

namespace NGIN::PolyJson
{

  std::expected<std::optional<Discriminator>, Error> ReadDiscriminator(Type type)
  {
    const auto attr = type.FindAttribute(kTypeIdAttribute);
    if (!attr)
      return std::optional<Discriminator>{};
    if (const auto *s = std::get_if<std::string_view>(&attr->value))
      return std::optional<Discriminator>{Discriminator{*s}};
    if (const auto *i = std::get_if<std::int64_t>(&attr->value))
    {
      if (*i < std::numeric_limits<std::int32_t>::min() || *i > std::numeric_limits<std::int32_t>::max())
        return std::unexpected(Error{ErrorCode::Configuration, "integer discriminator out of range",
                                     std::string{type.QualifiedName()}});
      return std::optional<Discriminator>{Discriminator{static_cast<std::int32_t>(*i)}};
    }
    return std::unexpected(Error{ErrorCode::Configuration, "discriminator must be a string or an integer",
                                 std::string{type.QualifiedName()}});
  }

  std::expected<NGIN::Containers::Vector<VariantEntry>, Error> ResolveVariants(Type base, const GroupList &groups)
  {
    if (!base.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid base type"});

    NGIN::Containers::Vector<VariantEntry> entries;
    for (NGIN::UIntSize g = 0; g < groups.Size(); ++g)
    {
      const auto &group = *groups[g];
      for (NGIN::UIntSize i = 0; i < group.DeclaredTypeCount(); ++i)
      {
        const Type t = group.DeclaredTypeAt(i);
        if (!t.IsAssignableTo(base))
          continue;
        auto discriminator = ReadDiscriminator(t);
        if (!discriminator)
          return std::unexpected(std::move(discriminator.error()));
        if (!*discriminator)
          continue;
        entries.PushBack(VariantEntry{t, std::move(**discriminator)});
      }
    }
    return entries;
  }

} // namespace NGIN::PolyJson
