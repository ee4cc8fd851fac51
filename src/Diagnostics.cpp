#include <Morph/Mapping/Diagnostics.hpp>
#include <Morph/Mapping/Registry.hpp>

namespace Morph::Mapping
{
  namespace
  {
    void AppendType(std::string &out, NGIN::UInt64 typeId)
    {
      if (auto t = FindTypeById(typeId))
      {
        out.append(t->QualifiedName());
        return;
      }
      out.append("type#");
      out.append(std::to_string(typeId));
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
    case ErrorCode::DuplicateMapping:
      return "DuplicateMapping";
    case ErrorCode::InvalidMemberExpression:
      return "InvalidMemberExpression";
    case ErrorCode::IncompatibleMemberType:
      return "IncompatibleMemberType";
    case ErrorCode::MappingNotFound:
      return "MappingNotFound";
    case ErrorCode::DuplicateMemberMapping:
      return "DuplicateMemberMapping";
    }
    return "Unknown";
  }

  std::string FormatError(const Error &error)
  {
    std::string out;
    out.append(ErrorCodeName(error.code));
    out.append(": ");
    out.append(error.message);
    if (error.sourceTypeId != 0 || error.destinationTypeId != 0)
    {
      out.append(" (");
      if (error.sourceTypeId != 0)
        AppendType(out, error.sourceTypeId);
      else
        out.append("?");
      out.append(" -> ");
      if (error.destinationTypeId != 0)
        AppendType(out, error.destinationTypeId);
      else
        out.append("?");
      if (!error.member.empty())
      {
        out.append(", member '");
        out.append(error.member);
        out.append("'");
      }
      out.append(")");
    }
    else if (!error.member.empty())
    {
      out.append(" (member '");
      out.append(error.member);
      out.append("')");
    }
    return out;
  }

} // namespace Morph::Mapping
