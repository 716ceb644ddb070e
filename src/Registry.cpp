#include <NGIN/PolyJson/Registry.hpp>

#include <string>

namespace NGIN::PolyJson::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);
    constexpr std::string_view kUnregistered = "<unregistered>";
  }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

  std::string_view InternName(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.Intern(s);
  }

  std::string_view TypeNameOf(NGIN::UInt64 typeId) noexcept
  {
    const auto &reg = GetRegistry();
    if (auto *p = reg.byTypeId.GetPtr(typeId))
      return reg.types[*p].qualifiedName;
    return kUnregistered;
  }

  std::string_view TypeNameOf(const std::type_info &rtti) noexcept
  {
    const auto &reg = GetRegistry();
    for (NGIN::UIntSize i = 0; i < reg.types.Size(); ++i)
    {
      if (reg.types[i].rtti && *reg.types[i].rtti == rtti)
        return reg.types[i].qualifiedName;
    }
    return rtti.name();
  }

  namespace
  {
    // Steps are appended deepest-first as the search unwinds.
    bool SearchBases(NGIN::UInt32 fromIndex, NGIN::UInt64 toTypeId, BasePath &reversed)
    {
      const auto &reg = GetRegistry();
      const auto &tdesc = reg.types[fromIndex];
      if (tdesc.typeId == toTypeId)
        return true;
      for (NGIN::UIntSize i = 0; i < tdesc.bases.Size(); ++i)
      {
        if (SearchBases(tdesc.bases[i].baseTypeIndex, toTypeId, reversed))
        {
          reversed.PushBack(BaseStep{fromIndex, static_cast<NGIN::UInt32>(i)});
          return true;
        }
      }
      return false;
    }
  } // namespace

  bool FindBasePath(NGIN::UInt32 fromIndex, NGIN::UInt64 toTypeId, BasePath &out)
  {
    if (fromIndex >= GetRegistry().types.Size())
      return false;
    BasePath reversed;
    if (!SearchBases(fromIndex, toTypeId, reversed))
      return false;
    out.Reserve(out.Size() + reversed.Size());
    for (auto i = reversed.Size(); i > 0; --i)
      out.PushBack(reversed[i - 1]);
    return true;
  }

  void *UpcastAlong(const BasePath &path, void *object) noexcept
  {
    const auto &reg = GetRegistry();
    for (NGIN::UIntSize i = 0; i < path.Size() && object; ++i)
      object = reg.types[path[i].typeIndex].bases[path[i].baseIndex].Upcast(object);
    return object;
  }

  const void *UpcastAlong(const BasePath &path, const void *object) noexcept
  {
    const auto &reg = GetRegistry();
    for (NGIN::UIntSize i = 0; i < path.Size() && object; ++i)
      object = reg.types[path[i].typeIndex].bases[path[i].baseIndex].UpcastConst(object);
    return object;
  }

  const void *DowncastAlong(const BasePath &path, const void *object) noexcept
  {
    const auto &reg = GetRegistry();
    for (auto i = path.Size(); i > 0 && object; --i)
    {
      const auto &step = path[i - 1];
      object = reg.types[step.typeIndex].bases[step.baseIndex].DowncastConst(object);
    }
    return object;
  }

} // namespace NGIN::PolyJson::detail

namespace NGIN::PolyJson
{

  using detail::GetRegistry;
  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    bool IsTypeAlive(TypeHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().types.Size();
    }

    const detail::FieldRuntimeDesc *FieldDesc(FieldHandle h)
    {
      const auto &reg = GetRegistry();
      if (!h.IsValid() || h.typeIndex >= reg.types.Size())
        return nullptr;
      const auto &fields = reg.types[h.typeIndex].fields;
      return h.fieldIndex < fields.Size() ? &fields[h.fieldIndex] : nullptr;
    }

    std::optional<AttributeDesc> FindIn(const NGIN::Containers::Vector<AttributeDesc> &attrs, std::string_view key)
    {
      for (NGIN::UIntSize i = 0; i < attrs.Size(); ++i)
      {
        if (attrs[i].key == key)
          return attrs[i];
      }
      return std::nullopt;
    }
  } // namespace

  std::string_view ErrorCodeName(ErrorCode code) noexcept
  {
    switch (code)
    {
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::Configuration:
      return "Configuration";
    case ErrorCode::UnsupportedType:
      return "UnsupportedType";
    case ErrorCode::Format:
      return "Format";
    case ErrorCode::MissingMember:
      return "MissingMember";
    case ErrorCode::Cancelled:
      return "Cancelled";
    case ErrorCode::Io:
      return "Io";
    }
    return "Unknown";
  }

  std::string ToString(const Error &error)
  {
    std::string out{ErrorCodeName(error.code)};
    out += ": ";
    out += error.message;
    if (!error.detail.empty())
    {
      out += " (";
      out += error.detail;
      out += ')';
    }
    if (!error.path.empty())
    {
      out += " at ";
      out += error.path;
    }
    return out;
  }

  // Field
  std::string_view Field::Name() const
  {
    const auto *f = FieldDesc(m_h);
    return f ? f->name : std::string_view{};
  }

  NGIN::UInt64 Field::TypeId() const
  {
    const auto *f = FieldDesc(m_h);
    return f ? f->typeId : 0;
  }

  NGIN::UInt64 Field::ReferencedTypeId() const
  {
    const auto *f = FieldDesc(m_h);
    return f ? f->referencedTypeId : 0;
  }

  FieldFlags Field::Flags() const
  {
    const auto *f = FieldDesc(m_h);
    return f ? f->flags : FieldFlags::None;
  }

  NGIN::UIntSize Field::AttributeCount() const
  {
    const auto *f = FieldDesc(m_h);
    return f ? f->attributes.Size() : 0;
  }

  AttributeDesc Field::AttributeAt(NGIN::UIntSize i) const
  {
    const auto *f = FieldDesc(m_h);
    if (!f || i >= f->attributes.Size())
      return AttributeDesc{};
    return f->attributes[i];
  }

  std::optional<AttributeDesc> Field::FindAttribute(std::string_view key) const
  {
    const auto *f = FieldDesc(m_h);
    if (!f)
      return std::nullopt;
    return FindIn(f->attributes, key);
  }

  // Type
  std::string_view Type::QualifiedName() const
  {
    if (!IsTypeAlive(m_h))
      return {};
    return GetRegistry().types[m_h.index].qualifiedName;
  }

  NGIN::UInt64 Type::GetTypeId() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].typeId;
  }

  NGIN::UIntSize Type::Size() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].sizeBytes;
  }

  NGIN::UIntSize Type::Alignment() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].alignBytes;
  }

  bool Type::IsAbstract() const
  {
    return IsTypeAlive(m_h) && GetRegistry().types[m_h.index].isAbstract;
  }

  bool Type::IsPolymorphic() const
  {
    return IsTypeAlive(m_h) && GetRegistry().types[m_h.index].isPolymorphic;
  }

  bool Type::IsConstructible() const
  {
    return IsTypeAlive(m_h) && GetRegistry().types[m_h.index].Construct != nullptr;
  }

  NGIN::UIntSize Type::FieldCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].fields.Size();
  }

  Field Type::FieldAt(NGIN::UIntSize i) const
  {
    return Field{FieldHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedField Type::GetField(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &tdesc = GetRegistry().types[m_h.index];
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = tdesc.fieldIndex.GetPtr(nid))
        return Field{FieldHandle{m_h.index, *p}};
    }
    return std::unexpected(Error{ErrorCode::NotFound, "field not found", std::string{name}});
  }

  std::optional<Field> Type::FindField(std::string_view name) const
  {
    auto f = GetField(name);
    if (!f)
      return std::nullopt;
    return *f;
  }

  NGIN::UIntSize Type::BaseCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].bases.Size();
  }

  Type Type::BaseAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return Type{};
    const auto &bases = GetRegistry().types[m_h.index].bases;
    if (i >= bases.Size())
      return Type{};
    return Type{TypeHandle{bases[i].baseTypeIndex}};
  }

  bool Type::IsDerivedFrom(const Type &base) const
  {
    if (!IsTypeAlive(m_h))
      return false;
    return GetRegistry().types[m_h.index].baseIndex.GetPtr(base.GetTypeId()) != nullptr;
  }

  bool Type::IsAssignableTo(const Type &base) const
  {
    if (!IsTypeAlive(m_h) || !base.IsValid())
      return false;
    detail::BasePath path;
    return detail::FindBasePath(m_h.index, base.GetTypeId(), path);
  }

  NGIN::UIntSize Type::AttributeCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].attributes.Size();
  }

  AttributeDesc Type::AttributeAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return AttributeDesc{};
    const auto &attrs = GetRegistry().types[m_h.index].attributes;
    if (i >= attrs.Size())
      return AttributeDesc{};
    return attrs[i];
  }

  std::optional<AttributeDesc> Type::FindAttribute(std::string_view key) const
  {
    if (!IsTypeAlive(m_h))
      return std::nullopt;
    return FindIn(GetRegistry().types[m_h.index].attributes, key);
  }

  ExpectedType GetType(std::string_view name)
  {
    auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = reg.byName.GetPtr(nid))
        return Type{TypeHandle{*p}};
    }
    return std::unexpected(Error{ErrorCode::NotFound, "type not found", std::string{name}});
  }

  std::optional<Type> FindType(std::string_view name)
  {
    auto t = GetType(name);
    if (!t)
      return std::nullopt;
    return *t;
  }

  std::optional<Type> FindTypeById(NGIN::UInt64 typeId)
  {
    if (auto *p = detail::FindTypeIndex(typeId))
      return Type{TypeHandle{*p}};
    return std::nullopt;
  }

  NGIN::UIntSize TypeCount() noexcept
  {
    return GetRegistry().types.Size();
  }

} // namespace NGIN::PolyJson
