// SourceRef.hpp
// Untyped reference to a source object: absent, statically typed, or runtime-resolved
#pragma once

#include <NGIN/Primitives.hpp>

#include <cstddef>
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <variant>

#include <Morph/Mapping/Convert.hpp>

namespace Morph::Mapping
{

  // Non-polymorphic source; only its static type is known.
  struct TypedSource
  {
    NGIN::UInt64 typeId{0};
    const void *object{nullptr};
  };

  // Polymorphic source; the dynamic type is recovered through RTTI.
  struct RuntimeSource
  {
    NGIN::UInt64 staticTypeId{0};
    const void *staticObject{nullptr};
    NGIN::UInt64 dynamicRttiId{0};
    const void *mostDerived{nullptr};
  };

  namespace detail
  {
    template <class T>
    struct IsSmartPointer : std::false_type
    {
    };
    template <class T>
    struct IsSmartPointer<std::shared_ptr<T>> : std::true_type
    {
    };
    template <class T, class Del>
    struct IsSmartPointer<std::unique_ptr<T, Del>> : std::true_type
    {
    };

    template <class T>
    inline constexpr bool IsPointerLike = std::is_pointer_v<T> || IsSmartPointer<T>::value;
  } // namespace detail

  class SourceRef
  {
  public:
    using Value = std::variant<std::monostate, TypedSource, RuntimeSource>;

    SourceRef() = default;
    SourceRef(std::nullptr_t) {}

    template <class T>
    SourceRef(const T *object)
    {
      bind(object);
    }

    template <class T>
    SourceRef(T *object) : SourceRef(static_cast<const T *>(object))
    {
    }

    template <class T>
    SourceRef(const std::shared_ptr<T> &object) : SourceRef(static_cast<const T *>(object.get()))
    {
    }

    template <class T, class Del>
    SourceRef(const std::unique_ptr<T, Del> &object) : SourceRef(static_cast<const T *>(object.get()))
    {
    }

    // A named object; never absent.
    template <class T>
    requires (std::is_class_v<T> && !detail::IsSmartPointer<T>::value)
    SourceRef(const T &object) : SourceRef(&object)
    {
    }

    [[nodiscard]] bool IsAbsent() const noexcept { return std::holds_alternative<std::monostate>(m_value); }
    [[nodiscard]] bool IsRuntime() const noexcept { return std::holds_alternative<RuntimeSource>(m_value); }
    [[nodiscard]] const Value &Get() const noexcept { return m_value; }

    [[nodiscard]] NGIN::UInt64 StaticTypeId() const noexcept
    {
      if (auto *t = std::get_if<TypedSource>(&m_value))
        return t->typeId;
      if (auto *r = std::get_if<RuntimeSource>(&m_value))
        return r->staticTypeId;
      return 0;
    }

    [[nodiscard]] const void *StaticObject() const noexcept
    {
      if (auto *t = std::get_if<TypedSource>(&m_value))
        return t->object;
      if (auto *r = std::get_if<RuntimeSource>(&m_value))
        return r->staticObject;
      return nullptr;
    }

  private:
    template <class T>
    void bind(const T *object)
    {
      using U = std::remove_cv_t<T>;
      if (!object)
        return;
      if constexpr (std::is_polymorphic_v<U>)
      {
        RuntimeSource r{};
        r.staticTypeId = detail::TypeIdOf<U>();
        r.staticObject = object;
        r.dynamicRttiId = detail::RttiIdOf(typeid(*object));
        r.mostDerived = dynamic_cast<const void *>(object);
        m_value = r;
      }
      else
      {
        m_value = TypedSource{detail::TypeIdOf<U>(), object};
      }
    }

    Value m_value{};
  };

} // namespace Morph::Mapping
