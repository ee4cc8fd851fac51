// MapBuilder.hpp
// Fluent configuration of one MapRule; returned by MapRegistry::CreateMap<S, D>()
#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include <Morph/Mapping/MapRule.hpp>
#include <Morph/Mapping/NameUtils.hpp>

namespace Morph::Mapping
{

  // A failed call leaves the rule unchanged. The first failure is kept and
  // reported by Status(); later calls still run.
  template <class S, class D>
  class MapBuilder
  {
  public:
    explicit MapBuilder(MapRule *rule) : m_rule(rule) {}

    // Destination member computed from the whole source: fn(const S&) -> R.
    template <class Fn>
    requires std::invocable<const std::remove_cvref_t<Fn> &, const S &>
    MapBuilder &ForMember(MemberSelector destination, Fn &&fn)
    {
      using R = std::remove_cvref_t<std::invoke_result_t<const std::remove_cvref_t<Fn> &, const S &>>;
      static_assert(!std::is_void_v<R>, "member derivation must return a value");
      auto dst = ResolveDestination(destination);
      if (!dst)
        return *this;
      CustomMemberMapping m{};
      m.destinationNameId = dst->Desc().nameId;
      m.destinationName = dst->Desc().name;
      m.destination = std::move(*dst);
      m.resultTypeId = detail::TypeIdOf<R>();
      m.derive = [f = std::forward<Fn>(fn)](const void *src) -> Any { return Any{R(f(*static_cast<const S *>(src)))}; };
      m_rule->AddCustomMapping(std::move(m));
      return *this;
    }

    // Destination member copied from one top-level source member.
    MapBuilder &ForMember(MemberSelector destination, MemberSelector source)
    {
      if (!CheckMutable())
        return *this;
      auto src = detail::ResolveMember(m_rule->SourceTypeIndex(), source);
      if (!src)
        return Fail(WithDestination(src.error()));
      if (!src->Desc().readable)
        return Fail(Error{ErrorCode::InvalidMemberExpression, "source member is not readable", m_rule->SourceTypeId(),
                          m_rule->DestinationTypeId(), src->Desc().name});
      auto dst = ResolveDestination(destination);
      if (!dst)
        return *this;
      CustomMemberMapping m{};
      m.destinationNameId = dst->Desc().nameId;
      m.destinationName = dst->Desc().name;
      m.resultTypeId = src->Desc().typeId;
      m.destination = std::move(*dst);
      m.sourceMember = std::move(*src);
      m_rule->AddCustomMapping(std::move(m));
      return *this;
    }

    // Excludes a member (by name on either side) from auto-copy.
    MapBuilder &MarkCollection(MemberSelector member)
    {
      if (!CheckMutable())
        return *this;
      auto found = detail::ResolveMember(m_rule->SourceTypeIndex(), member);
      if (!found)
        found = detail::ResolveMember(m_rule->DestinationTypeIndex(), member);
      if (!found)
        return Fail(WithDestination(found.error()));
      m_rule->AddCollectionMember(found->Desc().nameId);
      return *this;
    }

    // Source member left out of auto-copy. Unknown names are accepted and have no effect.
    MapBuilder &IgnoreMember(std::string_view name)
    {
      if (!CheckMutable())
        return *this;
      m_rule->AddIgnoredMember(detail::InternNameId(name));
      return *this;
    }

    template <auto MemberPtr>
    MapBuilder &IgnoreMember()
    {
      return IgnoreMember(detail::MemberNameOf<MemberPtr>());
    }

    MapBuilder &IgnoreMembers(std::initializer_list<std::string_view> names)
    {
      for (auto name : names)
        IgnoreMember(name);
      return *this;
    }

    // Runs after all member assignments. A second call replaces the first hook.
    template <class Fn>
    requires std::invocable<Fn &, const S &, D &>
    MapBuilder &AfterMap(Fn &&fn)
    {
      if (!CheckMutable())
        return *this;
      m_rule->SetAfterMap([f = std::forward<Fn>(fn)](const void *src, void *dst) mutable {
        f(*static_cast<const S *>(src), *static_cast<D *>(dst));
      });
      return *this;
    }

    [[nodiscard]] std::expected<void, Error> Status() const
    {
      if (m_error)
        return std::unexpected(*m_error);
      return {};
    }

    [[nodiscard]] const MapRule &Rule() const noexcept { return *m_rule; }

  private:
    MapBuilder &Fail(Error e)
    {
      if (!m_error)
        m_error = e;
      return *this;
    }

    Error WithDestination(Error e) const
    {
      e.sourceTypeId = m_rule->SourceTypeId();
      e.destinationTypeId = m_rule->DestinationTypeId();
      return e;
    }

    bool CheckMutable()
    {
      if (!m_rule->IsFinalized())
        return true;
      Fail(Error{ErrorCode::InvalidMemberExpression, "rule is finalized", m_rule->SourceTypeId(),
                 m_rule->DestinationTypeId()});
      return false;
    }

    std::optional<detail::MemberPath> ResolveDestination(const MemberSelector &destination)
    {
      if (!CheckMutable())
        return std::nullopt;
      auto dst = detail::ResolveMember(m_rule->DestinationTypeIndex(), destination);
      if (!dst)
      {
        Fail(WithDestination(dst.error()));
        return std::nullopt;
      }
      const auto &desc = dst->Desc();
      if (!desc.writable)
      {
        Fail(Error{ErrorCode::InvalidMemberExpression, "destination member is not writable", m_rule->SourceTypeId(),
                   m_rule->DestinationTypeId(), desc.name});
        return std::nullopt;
      }
      if (m_rule->HasCustomMapping(desc.nameId))
      {
        Fail(Error{ErrorCode::DuplicateMemberMapping, "destination member is already mapped", m_rule->SourceTypeId(),
                   m_rule->DestinationTypeId(), desc.name});
        return std::nullopt;
      }
      return std::move(*dst);
    }

    MapRule *m_rule{nullptr};
    std::optional<Error> m_error;
  };

} // namespace Morph::Mapping
