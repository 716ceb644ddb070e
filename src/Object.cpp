#include <NGIN/PolyJson/Object.hpp>

namespace NGIN::PolyJson
{

  Object::~Object() { Reset(); }

  Object::Object(Object &&other) noexcept
      : m_object(std::exchange(other.m_object, nullptr)),
        m_type(other.m_type),
        m_dynamic(std::exchange(other.m_dynamic, nullptr))
  {
  }

  Object &Object::operator=(Object &&other) noexcept
  {
    if (this != &other)
    {
      Reset();
      m_object = std::exchange(other.m_object, nullptr);
      m_type = other.m_type;
      m_dynamic = std::exchange(other.m_dynamic, nullptr);
    }
    return *this;
  }

  const std::type_info &Object::DynamicType() const noexcept
  {
    return m_dynamic ? *m_dynamic : typeid(void);
  }

  void Object::Reset() noexcept
  {
    if (!m_object)
      return;
    const auto &reg = detail::GetRegistry();
    if (m_type.IsValid())
    {
      if (auto destroy = reg.types[m_type.Handle().index].Destroy)
        destroy(m_object);
    }
    m_object = nullptr;
    m_dynamic = nullptr;
  }

} // namespace NGIN::PolyJson
