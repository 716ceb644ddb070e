#include <NGIN/PolyJson/Engine.hpp>

#include <string>
#include <utility>
#include <vector>

namespace NGIN::PolyJson::detail
{
  namespace
  {
    const std::string &DiscriminatorKey()
    {
      static const std::string key{kDiscriminatorProperty};
      return key;
    }

    class DepthGuard
    {
    public:
      explicit DepthGuard(CodecContext &ctx) noexcept : m_ctx(ctx) { ++m_ctx.depth; }
      ~DepthGuard() { --m_ctx.depth; }

      DepthGuard(const DepthGuard &) = delete;
      DepthGuard &operator=(const DepthGuard &) = delete;

      [[nodiscard]] bool Exceeded() const noexcept { return m_ctx.depth > m_ctx.config->Options().maxDepth; }

    private:
      CodecContext &m_ctx;
    };

    // Owns a freshly constructed instance until decoding hands it out.
    class OwnedInstance
    {
    public:
      OwnedInstance(void *object, void (*destroy)(void *)) noexcept : m_object(object), m_destroy(destroy) {}
      ~OwnedInstance()
      {
        if (m_object && m_destroy)
          m_destroy(m_object);
      }

      OwnedInstance(const OwnedInstance &) = delete;
      OwnedInstance &operator=(const OwnedInstance &) = delete;

      [[nodiscard]] void *Get() const noexcept { return m_object; }
      [[nodiscard]] void *Release() noexcept { return std::exchange(m_object, nullptr); }

    private:
      void *m_object;
      void (*m_destroy)(void *);
    };

    // Members of reflected bases come first, then the type's own, in declaration order.
    std::expected<void, Error> EncodeFields(CodecContext &ctx, const MemberPolicy &policy, NGIN::UInt32 typeIndex,
                                            const void *object, Json &out)
    {
      const auto &tdesc = GetRegistry().types[typeIndex];
      for (NGIN::UIntSize b = 0; b < tdesc.bases.Size(); ++b)
      {
        const auto &base = tdesc.bases[b];
        if (auto r = EncodeFields(ctx, policy, base.baseTypeIndex, base.UpcastConst(object), out); !r)
          return r;
      }
      for (NGIN::UIntSize i = 0; i < tdesc.fields.Size(); ++i)
      {
        const auto &f = tdesc.fields[i];
        PathScope scope{ctx, f.name};
        Json value;
        if (auto r = f.Encode(object, value, ctx); !r)
          return r;
        if (value.is_null() && !policy.writeNullMembers)
          continue;
        out[std::string{f.name}] = std::move(value);
      }
      return {};
    }

    std::expected<void, Error> EncodeMembers(CodecContext &ctx, const TypeContract &contract, const void *object, Json &out)
    {
      return EncodeFields(ctx, contract.policy, contract.typeIndex, object, out);
    }

    struct MemberSlot
    {
      const FieldRuntimeDesc *field{nullptr};
      void *object{nullptr};
    };

    // The type's own members shadow those of its bases.
    bool FindMember(NGIN::UInt32 typeIndex, NameId name, void *object, MemberSlot &out)
    {
      const auto &tdesc = GetRegistry().types[typeIndex];
      if (auto *fi = tdesc.fieldIndex.GetPtr(name))
      {
        out = MemberSlot{&tdesc.fields[*fi], object};
        return true;
      }
      for (NGIN::UIntSize b = 0; b < tdesc.bases.Size(); ++b)
      {
        const auto &base = tdesc.bases[b];
        if (FindMember(base.baseTypeIndex, name, base.Upcast(object), out))
          return true;
      }
      return false;
    }

    std::expected<void, Error> CheckRequired(CodecContext &ctx, NGIN::UInt32 typeIndex, const Json &in)
    {
      const auto &tdesc = GetRegistry().types[typeIndex];
      for (NGIN::UIntSize b = 0; b < tdesc.bases.Size(); ++b)
      {
        if (auto r = CheckRequired(ctx, tdesc.bases[b].baseTypeIndex, in); !r)
          return r;
      }
      for (NGIN::UIntSize i = 0; i < tdesc.fields.Size(); ++i)
      {
        const auto &f = tdesc.fields[i];
        if (!HasFlag(f.flags, FieldFlags::Required) || in.contains(std::string{f.name}))
          continue;
        PathScope scope{ctx, f.name};
        return std::unexpected(MakeError(ctx, ErrorCode::MissingMember, "required member missing", std::string{f.name}));
      }
      return {};
    }

    std::expected<void, Error> DecodeMembers(CodecContext &ctx, const TypeContract &contract, void *object, const Json &in,
                                             bool skipDiscriminator)
    {
      for (auto it = in.begin(); it != in.end(); ++it)
      {
        const std::string &key = it.key();
        if (skipDiscriminator && key == kDiscriminatorProperty)
          continue;
        MemberSlot slot{};
        NameId nid{};
        if (!FindNameId(key, nid) || !FindMember(contract.typeIndex, nid, object, slot))
        {
          if (contract.policy.allowUnknownMembers)
            continue;
          PathScope scope{ctx, key};
          return std::unexpected(MakeError(ctx, ErrorCode::Format, "unknown member", key));
        }
        PathScope scope{ctx, slot.field->name};
        if (auto r = slot.field->Decode(slot.object, it.value(), ctx); !r)
          return r;
      }
      return CheckRequired(ctx, contract.typeIndex, in);
    }

    Error DepthError(const CodecContext &ctx)
    {
      return MakeError(ctx, ErrorCode::Format, "maximum depth exceeded", std::to_string(ctx.config->Options().maxDepth));
    }
  } // namespace

  std::string RenderPath(const CodecContext &ctx)
  {
    std::string out{"$"};
    for (const auto &seg : ctx.path)
    {
      if (seg.isIndex)
      {
        out += '[';
        out += std::to_string(seg.index);
        out += ']';
      }
      else
      {
        out += '.';
        out += seg.name;
      }
    }
    return out;
  }

  Error MakeError(const CodecContext &ctx, ErrorCode code, std::string_view message, std::string detail)
  {
    return Error{code, message, std::move(detail), RenderPath(ctx)};
  }

  std::expected<void, Error> EncodeObject(CodecContext &ctx, NGIN::UInt64 declaredTypeId, const void *object,
                                          const std::type_info &dynamicType, Json &out)
  {
    DepthGuard depth{ctx};
    if (depth.Exceeded())
      return std::unexpected(DepthError(ctx));

    const auto *contract = ctx.config->FindContract(declaredTypeId);
    if (!contract)
      return std::unexpected(MakeError(ctx, ErrorCode::UnsupportedType, "no contract for type", std::string{TypeNameOf(declaredTypeId)}));

    if (contract->kind == ContractKind::Object)
    {
      out = Json::object();
      return EncodeMembers(ctx, *contract, object, out);
    }

    const auto *variant = contract->resolution->FindByDynamicType(dynamicType);
    if (!variant)
      return std::unexpected(MakeError(ctx, ErrorCode::UnsupportedType, "type is not a registered variant",
                                       std::string{TypeNameOf(dynamicType)}));
    const void *concrete = DowncastAlong(variant->path, object);
    if (!concrete)
      return std::unexpected(MakeError(ctx, ErrorCode::UnsupportedType, "object does not match its variant",
                                       std::string{TypeNameOf(variant->typeId)}));
    const auto *body = ctx.config->FindObjectContract(variant->typeId);
    if (!body)
      return std::unexpected(MakeError(ctx, ErrorCode::UnsupportedType, "no contract for variant", std::string{TypeNameOf(variant->typeId)}));

    out = Json::object();
    out[DiscriminatorKey()] = variant->discriminator.ToJson();
    return EncodeMembers(ctx, *body, concrete, out);
  }

  std::expected<void, Error> EncodeValue(CodecContext &ctx, NGIN::UInt64 typeId, const void *object, Json &out)
  {
    DepthGuard depth{ctx};
    if (depth.Exceeded())
      return std::unexpected(DepthError(ctx));

    const auto *contract = ctx.config->FindObjectContract(typeId);
    if (!contract)
      return std::unexpected(MakeError(ctx, ErrorCode::UnsupportedType, "no contract for type", std::string{TypeNameOf(typeId)}));
    out = Json::object();
    return EncodeMembers(ctx, *contract, object, out);
  }

  std::expected<DecodedObject, Error> DecodeNewObject(CodecContext &ctx, NGIN::UInt64 declaredTypeId, const Json &in)
  {
    DepthGuard depth{ctx};
    if (depth.Exceeded())
      return std::unexpected(DepthError(ctx));

    const auto *contract = ctx.config->FindContract(declaredTypeId);
    if (!contract)
      return std::unexpected(MakeError(ctx, ErrorCode::UnsupportedType, "no contract for type", std::string{TypeNameOf(declaredTypeId)}));
    if (!in.is_object())
      return std::unexpected(MakeError(ctx, ErrorCode::Format, "expected object", in.type_name()));

    const auto &reg = GetRegistry();
    if (contract->kind == ContractKind::Object)
    {
      const auto &tdesc = reg.types[contract->typeIndex];
      if (!tdesc.Construct)
        return std::unexpected(MakeError(ctx, ErrorCode::UnsupportedType, "type is not default constructible",
                                         std::string{tdesc.qualifiedName}));
      OwnedInstance instance{tdesc.Construct(), tdesc.Destroy};
      if (auto r = DecodeMembers(ctx, *contract, instance.Get(), in, false); !r)
        return std::unexpected(std::move(r.error()));
      return DecodedObject{instance.Release(), tdesc.rtti};
    }

    auto it = in.find(DiscriminatorKey());
    if (it == in.end())
      return std::unexpected(MakeError(ctx, ErrorCode::Format, "missing discriminator", std::string{kDiscriminatorProperty}));
    const auto *variant = contract->resolution->FindByDiscriminator(*it);
    if (!variant)
      return std::unexpected(MakeError(ctx, ErrorCode::Format, "unknown discriminator", it->dump()));
    const auto *body = ctx.config->FindObjectContract(variant->typeId);
    if (!body)
      return std::unexpected(MakeError(ctx, ErrorCode::UnsupportedType, "no contract for variant", std::string{TypeNameOf(variant->typeId)}));

    const auto &vdesc = reg.types[variant->typeIndex];
    OwnedInstance instance{vdesc.Construct(), vdesc.Destroy};
    if (auto r = DecodeMembers(ctx, *body, instance.Get(), in, true); !r)
      return std::unexpected(std::move(r.error()));
    return DecodedObject{UpcastAlong(variant->path, instance.Release()), variant->rtti};
  }

  std::expected<void, Error> DecodeObjectInto(CodecContext &ctx, NGIN::UInt64 typeId, void *object, const Json &in)
  {
    DepthGuard depth{ctx};
    if (depth.Exceeded())
      return std::unexpected(DepthError(ctx));

    const auto *contract = ctx.config->FindObjectContract(typeId);
    if (!contract)
      return std::unexpected(MakeError(ctx, ErrorCode::UnsupportedType, "no contract for type", std::string{TypeNameOf(typeId)}));
    if (!in.is_object())
      return std::unexpected(MakeError(ctx, ErrorCode::Format, "expected object", in.type_name()));
    return DecodeMembers(ctx, *contract, object, in, false);
  }

  std::expected<Json, Error> EncodeRoot(const SerializerConfig &config, const ObjectView &value)
  {
    if (!value.object)
      return Json(nullptr);
    if (!value.type.IsValid())
      return std::unexpected(Error{ErrorCode::UnsupportedType, "type is not registered",
                                   value.dynamicType ? std::string{TypeNameOf(*value.dynamicType)} : std::string{}});

    const auto &reg = GetRegistry();
    const auto &tdesc = reg.types[value.type.Handle().index];
    const std::type_info &dynamicType = value.dynamicType ? *value.dynamicType : *tdesc.rtti;

    BasePath path;
    if (!FindBasePath(value.type.Handle().index, config.BaseType().GetTypeId(), path))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "value is not assignable to the base type",
                                   std::string{tdesc.qualifiedName}});

    CodecContext ctx{config};
    Json out;
    if (auto r = EncodeObject(ctx, config.BaseType().GetTypeId(), UpcastAlong(path, value.object), dynamicType, out); !r)
      return std::unexpected(std::move(r.error()));
    return out;
  }

  std::expected<DecodedObject, Error> DecodeRoot(const SerializerConfig &config, const Json &document)
  {
    if (document.is_null())
      return DecodedObject{};
    CodecContext ctx{config};
    return DecodeNewObject(ctx, config.BaseType().GetTypeId(), document);
  }

  std::expected<Json, Error> ParseDocument(std::string_view text)
  {
    try
    {
      return Json::parse(text.begin(), text.end());
    }
    catch (const Json::exception &e)
    {
      // parse_error for bad syntax, out_of_range for numbers beyond double.
      return std::unexpected(Error{ErrorCode::Format, "malformed JSON", e.what()});
    }
  }

  std::expected<void, Error> DumpDocument(const SerializerConfig &config, const Json &document, std::string &out)
  {
    try
    {
      out += document.dump(config.Options().indent, ' ', false, Json::error_handler_t::strict);
      return {};
    }
    catch (const Json::type_error &e)
    {
      return std::unexpected(Error{ErrorCode::Format, "string is not valid UTF-8", e.what()});
    }
  }

} // namespace NGIN::PolyJson::detail
