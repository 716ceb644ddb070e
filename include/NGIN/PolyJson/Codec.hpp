// Codec.hpp
// Per-member JSON codecs and the object-level engine entry points they call into
#pragma once

#include <NGIN/PolyJson/Registry.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace NGIN::PolyJson
{
  namespace detail
  {
    struct PathSegment
    {
      std::string_view name{};
      NGIN::UIntSize index{0};
      bool isIndex{false};
    };

    // State threaded through one encode or decode call.
    struct CodecContext
    {
      explicit CodecContext(const SerializerConfig &cfg) noexcept : config(&cfg) {}

      const SerializerConfig *config;
      NGIN::UInt32 depth{0};
      std::vector<PathSegment> path;
    };

    class PathScope
    {
    public:
      PathScope(CodecContext &ctx, std::string_view member) : m_ctx(ctx)
      {
        m_ctx.path.push_back(PathSegment{member, 0, false});
      }
      PathScope(CodecContext &ctx, NGIN::UIntSize index) : m_ctx(ctx)
      {
        m_ctx.path.push_back(PathSegment{{}, index, true});
      }
      ~PathScope() { m_ctx.path.pop_back(); }

      PathScope(const PathScope &) = delete;
      PathScope &operator=(const PathScope &) = delete;

    private:
      CodecContext &m_ctx;
    };

    // "$", "$.Prop1", "$.Items[2].Child"
    NGIN_POLYJSON_API std::string RenderPath(const CodecContext &ctx);
    NGIN_POLYJSON_API Error MakeError(const CodecContext &ctx, ErrorCode code, std::string_view message, std::string detail = {});

    struct DecodedObject
    {
      // Viewed as the declared type passed to DecodeNewObject.
      void *object{nullptr};
      const std::type_info *dynamicType{nullptr};
    };

    // Encode `object`, viewed as `declaredTypeId`, whose most-derived type is `dynamicType`.
    NGIN_POLYJSON_API std::expected<void, Error> EncodeObject(CodecContext &ctx, NGIN::UInt64 declaredTypeId, const void *object,
                                                         const std::type_info &dynamicType, Json &out);
    // Encode a class held by value: exact type, members only, no discriminator.
    NGIN_POLYJSON_API std::expected<void, Error> EncodeValue(CodecContext &ctx, NGIN::UInt64 typeId, const void *object, Json &out);
    // Decode a new heap instance assignable to `declaredTypeId`. The caller owns the result.
    NGIN_POLYJSON_API std::expected<DecodedObject, Error> DecodeNewObject(CodecContext &ctx, NGIN::UInt64 declaredTypeId, const Json &in);
    // Decode members into an existing instance of exactly `typeId`.
    NGIN_POLYJSON_API std::expected<void, Error> DecodeObjectInto(CodecContext &ctx, NGIN::UInt64 typeId, void *object, const Json &in);

    // Integer types std::in_range accepts; character types are left without a codec.
    template <class T>
    concept JsonInteger = std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char> &&
                          !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t> && !std::is_same_v<T, char16_t> &&
                          !std::is_same_v<T, char32_t>;

  } // namespace detail

  // Value codec for a member type. The primary template covers reflected class
  // types held by value, encoded as plain objects; the specializations below
  // cover scalars and wrappers.
  template <class T>
  struct ValueCodec
  {
    static_assert(std::is_class_v<T>, "member type has no JSON codec");

    static void RegisterDependencies() { (void)detail::EnsureRegistered<T>(); }
    static NGIN::UInt64 ReferencedTypeId() { return detail::TypeIdOf<T>(); }

    static std::expected<void, Error> Encode(const T &value, Json &out, detail::CodecContext &ctx)
    {
      return detail::EncodeValue(ctx, detail::TypeIdOf<T>(), &value, out);
    }

    static std::expected<void, Error> Decode(const Json &in, T &value, detail::CodecContext &ctx)
    {
      return detail::DecodeObjectInto(ctx, detail::TypeIdOf<T>(), &value, in);
    }
  };

  // Shared no-op registration for scalar codecs.
  struct ScalarCodecBase
  {
    static void RegisterDependencies() {}
    static NGIN::UInt64 ReferencedTypeId() { return 0; }
  };

  template <>
  struct ValueCodec<bool> : ScalarCodecBase
  {
    static std::expected<void, Error> Encode(bool value, Json &out, detail::CodecContext &)
    {
      out = value;
      return {};
    }

    static std::expected<void, Error> Decode(const Json &in, bool &value, detail::CodecContext &ctx)
    {
      if (!in.is_boolean())
        return std::unexpected(detail::MakeError(ctx, ErrorCode::Format, "expected boolean", in.type_name()));
      value = in.get<bool>();
      return {};
    }
  };

  template <class T>
  requires detail::JsonInteger<T>
  struct ValueCodec<T> : ScalarCodecBase
  {
    static std::expected<void, Error> Encode(T value, Json &out, detail::CodecContext &)
    {
      out = value;
      return {};
    }

    static std::expected<void, Error> Decode(const Json &in, T &value, detail::CodecContext &ctx)
    {
      if (in.is_number_unsigned())
      {
        const auto v = in.get<std::uint64_t>();
        if (!std::in_range<T>(v))
          return std::unexpected(detail::MakeError(ctx, ErrorCode::Format, "integer out of range", std::to_string(v)));
        value = static_cast<T>(v);
        return {};
      }
      if (in.is_number_integer())
      {
        const auto v = in.get<std::int64_t>();
        if (!std::in_range<T>(v))
          return std::unexpected(detail::MakeError(ctx, ErrorCode::Format, "integer out of range", std::to_string(v)));
        value = static_cast<T>(v);
        return {};
      }
      return std::unexpected(detail::MakeError(ctx, ErrorCode::Format, "expected integer", in.type_name()));
    }
  };

  template <class T>
  requires std::is_floating_point_v<T>
  struct ValueCodec<T> : ScalarCodecBase
  {
    // JSON has no NaN or infinity; the writer would emit null for them.
    static std::expected<void, Error> Encode(T value, Json &out, detail::CodecContext &ctx)
    {
      if (!std::isfinite(value))
        return std::unexpected(detail::MakeError(ctx, ErrorCode::UnsupportedType, "non-finite number", std::to_string(value)));
      if constexpr (sizeof(T) > sizeof(double))
      {
        if (std::abs(value) > static_cast<T>(std::numeric_limits<double>::max()))
          return std::unexpected(detail::MakeError(ctx, ErrorCode::UnsupportedType, "number out of range", std::to_string(value)));
      }
      out = static_cast<double>(value);
      return {};
    }

    static std::expected<void, Error> Decode(const Json &in, T &value, detail::CodecContext &ctx)
    {
      if (!in.is_number())
        return std::unexpected(detail::MakeError(ctx, ErrorCode::Format, "expected number", in.type_name()));
      const auto v = in.get<double>();
      bool inRange = std::isfinite(v);
      if constexpr (sizeof(T) < sizeof(double))
        inRange = inRange && std::abs(v) <= static_cast<double>(std::numeric_limits<T>::max());
      if (!inRange)
        return std::unexpected(detail::MakeError(ctx, ErrorCode::Format, "number out of range", std::to_string(v)));
      value = static_cast<T>(v);
      return {};
    }
  };

  // Enumerations travel as their underlying integer.
  template <class T>
  requires std::is_enum_v<T>
  struct ValueCodec<T> : ScalarCodecBase
  {
    using Underlying = std::underlying_type_t<T>;

    static std::expected<void, Error> Encode(T value, Json &out, detail::CodecContext &ctx)
    {
      return ValueCodec<Underlying>::Encode(static_cast<Underlying>(value), out, ctx);
    }

    static std::expected<void, Error> Decode(const Json &in, T &value, detail::CodecContext &ctx)
    {
      Underlying raw{};
      if (auto r = ValueCodec<Underlying>::Decode(in, raw, ctx); !r)
        return r;
      value = static_cast<T>(raw);
      return {};
    }
  };

  template <>
  struct ValueCodec<std::string> : ScalarCodecBase
  {
    static std::expected<void, Error> Encode(const std::string &value, Json &out, detail::CodecContext &)
    {
      out = value;
      return {};
    }

    static std::expected<void, Error> Decode(const Json &in, std::string &value, detail::CodecContext &ctx)
    {
      if (!in.is_string())
        return std::unexpected(detail::MakeError(ctx, ErrorCode::Format, "expected string", in.type_name()));
      value = in.get_ref<const std::string &>();
      return {};
    }
  };

  template <class U>
  struct ValueCodec<std::optional<U>>
  {
    static void RegisterDependencies() { ValueCodec<U>::RegisterDependencies(); }
    static NGIN::UInt64 ReferencedTypeId() { return ValueCodec<U>::ReferencedTypeId(); }

    static std::expected<void, Error> Encode(const std::optional<U> &value, Json &out, detail::CodecContext &ctx)
    {
      if (!value)
      {
        out = nullptr;
        return {};
      }
      return ValueCodec<U>::Encode(*value, out, ctx);
    }

    static std::expected<void, Error> Decode(const Json &in, std::optional<U> &value, detail::CodecContext &ctx)
    {
      if (in.is_null())
      {
        value.reset();
        return {};
      }
      U tmp{};
      if (auto r = ValueCodec<U>::Decode(in, tmp, ctx); !r)
        return r;
      value = std::move(tmp);
      return {};
    }
  };

  template <class U, class A>
  struct ValueCodec<std::vector<U, A>>
  {
    static void RegisterDependencies() { ValueCodec<U>::RegisterDependencies(); }
    static NGIN::UInt64 ReferencedTypeId() { return ValueCodec<U>::ReferencedTypeId(); }

    static std::expected<void, Error> Encode(const std::vector<U, A> &value, Json &out, detail::CodecContext &ctx)
    {
      out = Json::array();
      NGIN::UIntSize i = 0;
      for (const auto &item : value)
      {
        detail::PathScope scope{ctx, i++};
        Json element;
        if (auto r = ValueCodec<U>::Encode(item, element, ctx); !r)
          return r;
        out.push_back(std::move(element));
      }
      return {};
    }

    static std::expected<void, Error> Decode(const Json &in, std::vector<U, A> &value, detail::CodecContext &ctx)
    {
      if (!in.is_array())
        return std::unexpected(detail::MakeError(ctx, ErrorCode::Format, "expected array", in.type_name()));
      value.clear();
      value.reserve(in.size());
      for (NGIN::UIntSize i = 0; i < in.size(); ++i)
      {
        detail::PathScope scope{ctx, i};
        U item{};
        if (auto r = ValueCodec<U>::Decode(in[i], item, ctx); !r)
          return r;
        value.push_back(std::move(item));
      }
      return {};
    }
  };

  // Owning pointers resolve through the contract chain using the pointee's dynamic type.
  template <class Ptr>
  struct OwningPointerCodec
  {
    using Element = typename Ptr::element_type;
    static_assert(std::is_class_v<Element>, "owning pointer members must point to class types");

    static void RegisterDependencies() { (void)detail::EnsureRegistered<Element>(); }
    static NGIN::UInt64 ReferencedTypeId() { return detail::TypeIdOf<Element>(); }

    static std::expected<void, Error> Encode(const Ptr &value, Json &out, detail::CodecContext &ctx)
    {
      if (!value)
      {
        out = nullptr;
        return {};
      }
      const Element &ref = *value;
      return detail::EncodeObject(ctx, detail::TypeIdOf<Element>(), value.get(), typeid(ref), out);
    }

    static std::expected<void, Error> Decode(const Json &in, Ptr &value, detail::CodecContext &ctx)
    {
      if (in.is_null())
      {
        value.reset();
        return {};
      }
      auto decoded = detail::DecodeNewObject(ctx, detail::TypeIdOf<Element>(), in);
      if (!decoded)
        return std::unexpected(std::move(decoded.error()));
      value.reset(static_cast<Element *>(decoded->object));
      return {};
    }
  };

  template <class U>
  struct ValueCodec<std::unique_ptr<U>> : OwningPointerCodec<std::unique_ptr<U>>
  {
  };

  template <class U>
  struct ValueCodec<std::shared_ptr<U>> : OwningPointerCodec<std::shared_ptr<U>>
  {
  };

  namespace detail
  {
    // Field thunks stored in FieldRuntimeDesc. `T` is the described type, which may
    // inherit the member from a base.
    template <class T, auto MemberPtr>
    std::expected<void, Error> FieldEncode(const void *obj, Json &out, CodecContext &ctx)
    {
      const auto &self = *static_cast<const T *>(obj);
      return ValueCodec<MemberTypeT<MemberPtr>>::Encode(self.*MemberPtr, out, ctx);
    }

    template <class T, auto MemberPtr>
    std::expected<void, Error> FieldDecode(void *obj, const Json &in, CodecContext &ctx)
    {
      auto &self = *static_cast<T *>(obj);
      return ValueCodec<MemberTypeT<MemberPtr>>::Decode(in, self.*MemberPtr, ctx);
    }

  } // namespace detail

} // namespace NGIN::PolyJson
