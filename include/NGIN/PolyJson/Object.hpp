// Object.hpp
// Borrowed and owning type-erased object references used by the non-generic facade
#pragma once

#include <NGIN/PolyJson/Registry.hpp>

#include <memory>
#include <utility>
#include <typeinfo>
#include <type_traits>

namespace NGIN::PolyJson
{

  // Non-owning view of an instance: its address, the registered type the address
  // is viewed as, and its most-derived dynamic type.
  struct ObjectView
  {
    const void *object{nullptr};
    Type type{};
    const std::type_info *dynamicType{nullptr};

    // `value` must be of a registered type (its own record or one of its bases).
    template <class T>
    requires(!std::is_pointer_v<T>)
    [[nodiscard]] static ObjectView Of(const T &value)
    {
      ObjectView v{};
      v.object = &value;
      if (auto t = TryGetType<T>())
        v.type = *t;
      v.dynamicType = &typeid(value);
      return v;
    }
  };

  // Owning, move-only box around a decoded heap instance. The instance is viewed
  // as GetType() and destroyed through that type's record.
  class NGIN_POLYJSON_API Object
  {
  public:
    Object() = default;
    Object(void *object, Type type, const std::type_info *dynamicType) noexcept
        : m_object(object), m_type(type), m_dynamic(dynamicType)
    {
    }
    ~Object();

    Object(Object &&other) noexcept;
    Object &operator=(Object &&other) noexcept;
    Object(const Object &) = delete;
    Object &operator=(const Object &) = delete;

    [[nodiscard]] bool IsNull() const noexcept { return m_object == nullptr; }
    [[nodiscard]] Type GetType() const noexcept { return m_type; }
    // typeid(void) when empty.
    [[nodiscard]] const std::type_info &DynamicType() const noexcept;
    [[nodiscard]] void *Data() noexcept { return m_object; }
    [[nodiscard]] const void *Data() const noexcept { return m_object; }

    // Typed access to the held pointer; T must be the viewed type.
    template <class T>
    [[nodiscard]] T *As() noexcept
    {
      if (!m_object || m_type.GetTypeId() != detail::TypeIdOf<T>())
        return nullptr;
      return static_cast<T *>(m_object);
    }

    template <class T>
    [[nodiscard]] const T *As() const noexcept
    {
      if (!m_object || m_type.GetTypeId() != detail::TypeIdOf<T>())
        return nullptr;
      return static_cast<const T *>(m_object);
    }

    // Transfer ownership out; leaves the box empty on success, untouched on a type mismatch.
    template <class T>
    [[nodiscard]] std::unique_ptr<T> Release() noexcept
    {
      T *p = As<T>();
      if (!p)
        return nullptr;
      m_object = nullptr;
      m_dynamic = nullptr;
      return std::unique_ptr<T>(p);
    }

    void Reset() noexcept;

  private:
    void *m_object{nullptr};
    Type m_type{};
    const std::type_info *m_dynamic{nullptr};
  };

} // namespace NGIN::PolyJson
