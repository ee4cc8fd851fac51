// Types.hpp
// Public-facing error codes and small handle types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <string_view>
#include <expected>

namespace Morph::Mapping
{

  using Any = NGIN::Utilities::Any<>;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    DuplicateMapping = 3,
    InvalidMemberExpression = 4,
    IncompatibleMemberType = 5,
    MappingNotFound = 6,
    DuplicateMemberMapping = 7,
  };

  // Errors are plain values. Type ids and the member name give the context;
  // FormatError (Diagnostics.hpp) turns them into readable text.
  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    NGIN::UInt64 sourceTypeId{0};
    NGIN::UInt64 destinationTypeId{0};
    std::string_view member{};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    constexpr Error(ErrorCode c, std::string_view m, NGIN::UInt64 src, NGIN::UInt64 dst, std::string_view mem = {})
        : code(c), message(m), sourceTypeId(src), destinationTypeId(dst), member(mem)
    {
    }
  };

  // Small opaque handles (indices into the type table). Intentionally trivial.
  struct TypeHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  enum class MemberKind : unsigned char
  {
    Field = 0,
    Property = 1,
  };

  struct MemberHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 memberIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && memberIndex != static_cast<NGIN::UInt32>(-1); }
  };

  struct BaseHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 baseIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && baseIndex != static_cast<NGIN::UInt32>(-1); }
  };

  // Forward decls of high-level wrappers
  class Type;
  class Member;
  class Base;

  using ExpectedType = std::expected<Type, Error>;
  using ExpectedMember = std::expected<Member, Error>;

} // namespace Morph::Mapping
