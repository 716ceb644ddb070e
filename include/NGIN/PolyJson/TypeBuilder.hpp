// TypeBuilder.hpp
// Public TypeBuilder<T> used inside the ADL hook to describe members, bases and discriminators
#pragma once

#include <NGIN/PolyJson/Codec.hpp>
#include <NGIN/PolyJson/NameUtils.hpp>
#include <NGIN/PolyJson/Registry.hpp>

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::PolyJson
{

  template <class T>
  class TypeBuilder
  {
  public:
    // Note: constructed by the registry when invoking the reflect hook; binds to a specific type index.
    explicit TypeBuilder(NGIN::UInt32 typeIndex) : m_index(typeIndex) {}

    // Optional name override. If not set, defaults to Meta::TypeName<T>.
    TypeBuilder &set_name(std::string_view qualified)
    {
      auto &reg = detail::GetRegistry();
      auto id = detail::InternNameId(qualified);
      reg.types[m_index].qualifiedNameId = id;
      reg.types[m_index].qualifiedName = detail::NameFromId(id);
      reg.byName.Insert(id, m_index);
      return *this;
    }

    // Add a public data member; the JSON name defaults to the member identifier.
    template <auto MemberPtr>
    TypeBuilder &field(std::string_view name = {}, FieldFlags flags = FieldFlags::None)
    {
      using MemberT = detail::MemberTypeT<MemberPtr>;
      static_assert(std::is_base_of_v<detail::MemberClassT<MemberPtr>, T>, "member must belong to T or one of its bases");

      // May append to the type table, so no references into it are taken before this.
      ValueCodec<MemberT>::RegisterDependencies();

      auto &reg = detail::GetRegistry();
      detail::FieldRuntimeDesc f{};
      f.nameId = detail::InternNameId(name.empty() ? detail::MemberNameFromPretty<MemberPtr>() : name);
      f.name = detail::NameFromId(f.nameId);
      f.typeId = detail::TypeIdOf<MemberT>();
      f.referencedTypeId = ValueCodec<MemberT>::ReferencedTypeId();
      f.flags = flags;
      f.Encode = &detail::FieldEncode<T, MemberPtr>;
      f.Decode = &detail::FieldDecode<T, MemberPtr>;

      auto &rec = reg.types[m_index];
      if (auto *existing = rec.fieldIndex.GetPtr(f.nameId))
      {
        rec.fields[*existing] = std::move(f);
        return *this;
      }
      rec.fields.PushBack(std::move(f));
      const auto newIdx = static_cast<NGIN::UInt32>(rec.fields.Size() - 1);
      rec.fieldIndex.Insert(rec.fields[newIdx].nameId, newIdx);
      return *this;
    }

    template <auto MemberPtr>
    TypeBuilder &required_field(std::string_view name = {})
    {
      return field<MemberPtr>(name, FieldFlags::Required);
    }

    // Declare B as a base of T. Enables upcasts for assignability and checked
    // downcasts when encoding through a base pointer.
    template <class B>
    TypeBuilder &base()
    {
      static_assert(std::is_base_of_v<B, T> && !std::is_same_v<B, T>, "B must be a proper base of T");
      static_assert(std::has_virtual_destructor_v<B>, "bases need a virtual destructor to be owned through");

      const auto baseIdx = detail::EnsureRegistered<B>();
      auto &rec = detail::GetRegistry().types[m_index];
      const auto baseId = detail::TypeIdOf<B>();
      if (rec.baseIndex.GetPtr(baseId))
        return *this;

      detail::BaseRuntimeDesc d{};
      d.baseTypeIndex = baseIdx;
      d.baseTypeId = baseId;
      d.Upcast = &detail::UpcastThunk<T, B>;
      d.UpcastConst = &detail::UpcastConstThunk<T, B>;
      d.DowncastConst = &detail::DowncastConstThunk<T, B>;
      rec.bases.PushBack(std::move(d));
      rec.baseIndex.Insert(baseId, static_cast<NGIN::UInt32>(rec.bases.Size() - 1));
      return *this;
    }

    // Discriminators. Only the first one declared on a type is used.
    TypeBuilder &type_id(std::string_view discriminator)
    {
      return attribute(kTypeIdAttribute, AttrValue{discriminator});
    }

    TypeBuilder &type_id(std::int32_t discriminator)
    {
      return attribute(kTypeIdAttribute, AttrValue{static_cast<std::int64_t>(discriminator)});
    }

    // Attach a typed attribute (type-level). Keys and string values are interned.
    TypeBuilder &attribute(std::string_view key, const AttrValue &value)
    {
      auto &reg = detail::GetRegistry();
      reg.types[m_index].attributes.PushBack(AttributeDesc{detail::InternName(key), Interned(value)});
      return *this;
    }

    // Attach attribute to a specific field by member pointer.
    template <auto MemberPtr>
    TypeBuilder &field_attribute(std::string_view key, const AttrValue &value)
    {
      auto &fields = detail::GetRegistry().types[m_index].fields;
      const auto fn = &detail::FieldEncode<T, MemberPtr>;
      for (auto i = NGIN::UIntSize{0}; i < fields.Size(); ++i)
      {
        if (fields[i].Encode == fn)
        {
          fields[i].attributes.PushBack(AttributeDesc{detail::InternName(key), Interned(value)});
          break;
        }
      }
      return *this;
    }

  private:
    static AttrValue Interned(const AttrValue &value)
    {
      if (const auto *s = std::get_if<std::string_view>(&value))
        return AttrValue{detail::InternName(*s)};
      return value;
    }

    NGIN::UInt32 m_index{0};
  };

} // namespace NGIN::PolyJson
