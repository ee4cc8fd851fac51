// Convert.hpp: Any -> member store resolution and type-id utilities
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <concepts>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

#include <Morph/Mapping/Types.hpp>

namespace Morph::Mapping::detail
{

  // Compute FNV-based type id for a type
  template <class T>
  inline NGIN::UInt64 TypeIdOf()
  {
    auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
    return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
  }

  // Id of the RTTI record of a type; lets a polymorphic object's dynamic type be looked up.
  inline NGIN::UInt64 RttiIdOf(const std::type_info &info)
  {
    const char *name = info.name();
    return NGIN::Hashing::FNV1a64(name, std::strlen(name));
  }

  template <class T>
  inline NGIN::UInt64 RttiIdOf()
  {
    return RttiIdOf(typeid(std::remove_cv_t<std::remove_reference_t<T>>));
  }

  template <class T>
  inline constexpr bool is_numeric_v = std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>>;

  // Arithmetic conversions whose result is defined for every source value:
  // non-narrowing ones, plus integer to floating point.
  template <class From, class To>
  concept ValuePreserving = std::is_arithmetic_v<From> && std::is_arithmetic_v<To> &&
                            (requires(From v) { To{v}; } || (std::is_integral_v<From> && std::is_floating_point_v<To>));

  using LoadFn = Any (*)(const void *);
  using StoreFn = void (*)(void *, const Any &);
  using ResolveStoreFn = StoreFn (*)(NGIN::UInt64);

  // Access is a FieldAccess/PropertyAccess policy (Registry.hpp). From is the
  // payload type held by the Any.
  template <class Access, class From>
  void StoreMember(void *obj, const Any &value)
  {
    using Value = typename Access::Value;
    if constexpr (std::is_same_v<From, Value>)
      Access::Write(obj, value.template Cast<Value>());
    else if constexpr (std::is_pointer_v<From>)
    {
      // C strings; null stores an empty string.
      const auto *text = value.template Cast<From>();
      Access::Write(obj, text ? Value(text) : Value{});
    }
    else
      Access::Write(obj, static_cast<Value>(value.template Cast<From>()));
  }

  template <class Access, class... From>
  inline StoreFn PickStore(NGIN::UInt64 from)
  {
    StoreFn out = nullptr;
    (void)((from == TypeIdOf<From>() ? (out = &StoreMember<Access, From>, true) : false) || ...);
    return out;
  }

  template <class Access, class... From>
  inline StoreFn PickArithmeticStore(NGIN::UInt64 from)
  {
    using Value = typename Access::Value;
    StoreFn out = nullptr;
    (void)(((ValuePreserving<From, Value> && from == TypeIdOf<From>())
                ? (out = &StoreMember<Access, From>, true)
                : false) ||
           ...);
    return out;
  }

  // Safe conversions into a member: exact type, value-preserving arithmetic,
  // string-like -> std::string. Returns nullptr when the member cannot accept `from`.
  template <class Access>
  StoreFn ResolveStore(NGIN::UInt64 from)
  {
    using Value = typename Access::Value;
    if constexpr (!Access::Writable)
    {
      return nullptr;
    }
    else
    {
      if (from == TypeIdOf<Value>())
        return &StoreMember<Access, Value>;
      if constexpr (is_numeric_v<Value>)
      {
        return PickArithmeticStore<Access, bool, signed char, unsigned char, char, short, unsigned short, int, unsigned int, long,
                                   unsigned long, long long, unsigned long long, float, double, long double>(
            from);
      }
      else if constexpr (std::is_same_v<Value, std::string>)
      {
        return PickStore<Access, std::string_view, const char *, char *>(from);
      }
      else
      {
        return nullptr;
      }
    }
  }

  template <class M>
  void CopyAssign(void *dst, const void *src)
  {
    *static_cast<M *>(dst) = *static_cast<const M *>(src);
  }

} // namespace Morph::Mapping::detail
