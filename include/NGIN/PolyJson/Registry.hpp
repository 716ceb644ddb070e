// Registry.hpp
// Process-wide type registry: records, names, bases, attributes and the query API
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <concepts>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>

#include <NGIN/PolyJson/Export.hpp>
#include <NGIN/PolyJson/Json.hpp>
#include <NGIN/PolyJson/Types.hpp>

namespace NGIN::PolyJson
{
  using NameId = NGIN::UInt32;

  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class TypeBuilder;

  // Optional external customization point for types you cannot modify
  // Specialize in namespace NGIN::PolyJson: template<> struct Describe<MyType> { static void Do(TypeBuilder<MyType>&); };
  template <class T>
  struct Describe;

  using AttrValue = std::variant<bool, std::int64_t, double, std::string_view, NGIN::UInt64>;

  struct AttributeDesc
  {
    std::string_view key;
    AttrValue value;
  };

  // Type-level attribute holding a discriminator (string or 32-bit integer).
  inline constexpr std::string_view kTypeIdAttribute = "polyjson.type_id";

  enum class FieldFlags : NGIN::UInt8
  {
    None = 0,
    // Decoding fails with MissingMember when the member is absent.
    Required = 1 << 0,
  };

  [[nodiscard]] constexpr FieldFlags operator|(FieldFlags a, FieldFlags b) noexcept
  {
    return static_cast<FieldFlags>(static_cast<NGIN::UInt8>(a) | static_cast<NGIN::UInt8>(b));
  }

  [[nodiscard]] constexpr bool HasFlag(FieldFlags set, FieldFlags flag) noexcept
  {
    return (static_cast<NGIN::UInt8>(set) & static_cast<NGIN::UInt8>(flag)) != 0;
  }

  class SerializerConfig;

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    struct CodecContext;

    NGIN_POLYJSON_API NameId InternNameId(std::string_view s) noexcept;
    NGIN_POLYJSON_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    NGIN_POLYJSON_API std::string_view NameFromId(NameId id) noexcept;
    // Intern a string into the registry's string storage and return a stable view
    NGIN_POLYJSON_API std::string_view InternName(std::string_view s) noexcept;

    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    using FieldEncodeFn = std::expected<void, Error> (*)(const void *, Json &, CodecContext &);
    using FieldDecodeFn = std::expected<void, Error> (*)(void *, const Json &, CodecContext &);

    struct FieldRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId{0};
      // Reflected class reached through this member (by value, optional, vector or
      // smart pointer); 0 for scalars.
      NGIN::UInt64 referencedTypeId{0};
      FieldFlags flags{FieldFlags::None};
      FieldEncodeFn Encode{nullptr};
      FieldDecodeFn Decode{nullptr};
      NGIN::Containers::Vector<AttributeDesc> attributes;
    };

    struct BaseRuntimeDesc
    {
      NGIN::UInt32 baseTypeIndex{static_cast<NGIN::UInt32>(-1)};
      NGIN::UInt64 baseTypeId{0};
      void *(*Upcast)(void *){nullptr};
      const void *(*UpcastConst)(const void *){nullptr};
      // Checked; null when the object is not a Derived.
      const void *(*DowncastConst)(const void *){nullptr};
    };

    struct TypeRuntimeDesc
    {
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId{0};
      NGIN::UIntSize sizeBytes{0};
      NGIN::UIntSize alignBytes{0};
      const std::type_info *rtti{nullptr};
      bool isAbstract{false};
      bool isPolymorphic{false};
      NGIN::Containers::Vector<FieldRuntimeDesc> fields;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> fieldIndex;
      NGIN::Containers::Vector<BaseRuntimeDesc> bases;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> baseIndex;
      NGIN::Containers::Vector<AttributeDesc> attributes;
      // Heap construction with `new T()` and matching `delete`.
      void *(*Construct)(){nullptr};
      void (*Destroy)(void *){nullptr};
    };

    struct Registry
    {
      NGIN::Containers::Vector<TypeRuntimeDesc> types;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;

      StringInterner names;
    };

    NGIN_POLYJSON_API Registry &GetRegistry() noexcept;

    [[nodiscard]] inline const NGIN::UInt32 *FindTypeIndex(NGIN::UInt64 typeId) noexcept
    {
      return GetRegistry().byTypeId.GetPtr(typeId);
    }

    // Qualified name for diagnostics; "<unregistered>" when the id is unknown.
    NGIN_POLYJSON_API std::string_view TypeNameOf(NGIN::UInt64 typeId) noexcept;
    NGIN_POLYJSON_API std::string_view TypeNameOf(const std::type_info &rtti) noexcept;

    // One edge of an inheritance path: bases[baseIndex] of types[typeIndex].
    struct BaseStep
    {
      NGIN::UInt32 typeIndex{0};
      NGIN::UInt32 baseIndex{0};
    };
    using BasePath = NGIN::Containers::Vector<BaseStep>;

    // Depth-first search from `fromIndex` to the type `toTypeId`; an empty path
    // means the two are the same type.
    NGIN_POLYJSON_API bool FindBasePath(NGIN::UInt32 fromIndex, NGIN::UInt64 toTypeId, BasePath &out);
    NGIN_POLYJSON_API void *UpcastAlong(const BasePath &path, void *object) noexcept;
    NGIN_POLYJSON_API const void *UpcastAlong(const BasePath &path, const void *object) noexcept;
    // Reverse of UpcastAlong; null when the object's dynamic type is not on the path.
    NGIN_POLYJSON_API const void *DowncastAlong(const BasePath &path, const void *object) noexcept;

    template <class T>
    concept HasPolyJsonReflect = requires(TypeBuilder<T> &b) {
      // ADL friend should be declared as: friend void PolyJsonReflect(Tag<T>, TypeBuilder<T>&)
      { PolyJsonReflect(Tag<T>{}, b) } -> std::same_as<void>;
    };

    // Detection for Describe<T>::Do(TypeBuilder<T>&)
    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(NGIN::PolyJson::Describe<T>::Do(std::declval<TypeBuilder<T> &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribe = HasDescribeImpl<T>::value;

    // Traits for pointer-to-member decomposition
    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    template <class D, class B>
    static void *UpcastThunk(void *p)
    {
      return static_cast<B *>(static_cast<D *>(p));
    }

    template <class D, class B>
    static const void *UpcastConstThunk(const void *p)
    {
      return static_cast<const B *>(static_cast<const D *>(p));
    }

    template <class D, class B>
    static const void *DowncastConstThunk(const void *p)
    {
      return dynamic_cast<const D *>(static_cast<const B *>(p));
    }

    // Ensure a type is present; returns the type index. The record is published
    // before the describe hook runs so self-referencing members terminate.
    template <class T>
    NGIN::UInt32 EnsureRegistered()
    {
      using U = std::remove_cvref_t<T>;
      static_assert(std::is_class_v<U>, "only class types are registered");
      auto &reg = GetRegistry();
      const auto tid = TypeIdOf<U>();
      if (auto *p = reg.byTypeId.GetPtr(tid))
        return *p;

      TypeRuntimeDesc rec{};
      rec.qualifiedNameId = InternNameId(NGIN::Meta::TypeName<U>::qualifiedName);
      rec.qualifiedName = NameFromId(rec.qualifiedNameId);
      rec.typeId = tid;
      rec.sizeBytes = sizeof(U);
      rec.alignBytes = alignof(U);
      rec.rtti = &typeid(U);
      rec.isAbstract = std::is_abstract_v<U>;
      rec.isPolymorphic = std::is_polymorphic_v<U>;
      if constexpr (std::is_default_constructible_v<U> && !std::is_abstract_v<U>)
        rec.Construct = []() -> void * { return new U(); };
      if constexpr (std::is_destructible_v<U>)
        rec.Destroy = [](void *p) { delete static_cast<U *>(p); };

      const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
      reg.types.PushBack(std::move(rec));
      reg.byTypeId.Insert(tid, idx);
      reg.byName.Insert(reg.types[idx].qualifiedNameId, idx);
#if defined(_MSC_VER)
      {
        auto qn = reg.types[idx].qualifiedName;
        auto addAlias = [&](std::string_view prefix) {
          if (qn.size() > prefix.size() && qn.substr(0, prefix.size()) == prefix)
            reg.byName.Insert(InternNameId(qn.substr(prefix.size())), idx);
        };
        addAlias("class ");
        addAlias("struct ");
      }
#endif

      if constexpr (HasPolyJsonReflect<U>)
      {
        TypeBuilder<U> b{idx};
        PolyJsonReflect(Tag<U>{}, b);
      }
      else if constexpr (HasDescribe<U>)
      {
        TypeBuilder<U> b{idx};
        NGIN::PolyJson::Describe<U>::Do(b);
      }
      return idx;
    }

  } // namespace detail

  class NGIN_POLYJSON_API Field
  {
  public:
    constexpr Field() = default;
    explicit constexpr Field(FieldHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.fieldIndex < reg.types[m_h.typeIndex].fields.Size();
    }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 TypeId() const;
    [[nodiscard]] NGIN::UInt64 ReferencedTypeId() const;
    [[nodiscard]] FieldFlags Flags() const;
    [[nodiscard]] bool IsRequired() const { return HasFlag(Flags(), FieldFlags::Required); }

    [[nodiscard]] NGIN::UIntSize AttributeCount() const;
    [[nodiscard]] AttributeDesc AttributeAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<AttributeDesc> FindAttribute(std::string_view key) const;

  private:
    FieldHandle m_h{};
  };

  class NGIN_POLYJSON_API Type
  {
  public:
    constexpr Type() = default;
    explicit constexpr Type(TypeHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      return m_h.IsValid() && m_h.index < detail::GetRegistry().types.Size();
    }
    [[nodiscard]] TypeHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view QualifiedName() const;
    [[nodiscard]] NGIN::UInt64 GetTypeId() const;
    [[nodiscard]] NGIN::UIntSize Size() const;
    [[nodiscard]] NGIN::UIntSize Alignment() const;
    [[nodiscard]] bool IsAbstract() const;
    [[nodiscard]] bool IsPolymorphic() const;
    // Has a default constructor usable for decoding.
    [[nodiscard]] bool IsConstructible() const;

    [[nodiscard]] NGIN::UIntSize FieldCount() const;
    [[nodiscard]] Field FieldAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedField GetField(std::string_view name) const;
    [[nodiscard]] std::optional<Field> FindField(std::string_view name) const;

    // Direct bases only.
    [[nodiscard]] NGIN::UIntSize BaseCount() const;
    [[nodiscard]] Type BaseAt(NGIN::UIntSize i) const;
    [[nodiscard]] bool IsDerivedFrom(const Type &base) const;
    // Reflexive and transitive over registered bases.
    [[nodiscard]] bool IsAssignableTo(const Type &base) const;

    [[nodiscard]] NGIN::UIntSize AttributeCount() const;
    [[nodiscard]] AttributeDesc AttributeAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<AttributeDesc> FindAttribute(std::string_view key) const;

    friend bool operator==(const Type &a, const Type &b) noexcept { return a.m_h.index == b.m_h.index; }

  private:
    TypeHandle m_h{};
  };

  // Queries
  NGIN_POLYJSON_API ExpectedType GetType(std::string_view name);
  NGIN_POLYJSON_API std::optional<Type> FindType(std::string_view name);
  NGIN_POLYJSON_API std::optional<Type> FindTypeById(NGIN::UInt64 typeId);
  NGIN_POLYJSON_API NGIN::UIntSize TypeCount() noexcept;

  template <class T>
  Type GetType()
  {
    return Type{TypeHandle{detail::EnsureRegistered<T>()}};
  }

  template <class T>
  std::optional<Type> TryGetType()
  {
    if (auto *p = detail::FindTypeIndex(detail::TypeIdOf<std::remove_cvref_t<T>>()))
      return Type{TypeHandle{*p}};
    return std::nullopt;
  }

  // Optional eager registration helper
  template <class T>
  inline bool AutoRegister()
  {
    (void)detail::EnsureRegistered<T>();
    return true;
  }

} // namespace NGIN::PolyJson
