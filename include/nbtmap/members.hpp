#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace nbtmap {

/*
 * Per-member mapping directive. Only members registered with a directive
 * take part in mapping; the exported name defaults to the member name.
 * Names are kept as views for the life of the member table, so they are
 * taken as string literals.
 */
struct Directive {
    std::optional<std::string_view> name;
    bool hide_when_default = false;

    constexpr Directive hide_default() const
    {
        Directive copy = *this;
        copy.hide_when_default = true;
        return copy;
    }
};

constexpr Directive tagged() { return Directive{}; }
constexpr Directive tagged(const char* name) { return Directive{std::string_view(name), false}; }

/*
 * Specialise for every record type:
 *
 *   template<> struct nbtmap::Mapping<Player> {
 *       static auto members() {
 *           return nbtmap::members(
 *               nbtmap::field("id", &Player::id, nbtmap::tagged()),
 *               nbtmap::readonly("inventory", &Player::inventory, nbtmap::tagged("inv")));
 *       }
 *   };
 *
 * Registration order is the order of the compound's children.
 */
template<class T>
struct Mapping {};

template<class T>
concept Mapped = requires { Mapping<T>::members(); };

namespace detail {

class MemberInfo {
public:
    constexpr MemberInfo(std::string_view name, std::optional<Directive> directive)
        : name_(name), directive_(directive) {}

    constexpr std::string_view name() const { return name_; }
    constexpr const std::optional<Directive>& directive() const { return directive_; }
    constexpr bool mapped() const { return directive_.has_value(); }
    constexpr bool hide_when_default() const { return directive_ && directive_->hide_when_default; }

    constexpr std::string_view exported_name() const
    {
        if (directive_ && directive_->name) {
            return *directive_->name;
        }
        return name_;
    }

private:
    std::string_view name_;
    std::optional<Directive> directive_;
};

} // namespace detail

// Instance data member, assigned on deserialize
template<class C, class M>
class Field : public detail::MemberInfo {
public:
    using value_type = M;
    static constexpr bool replaceable = true;

    constexpr Field(std::string_view name, M C::*ptr, std::optional<Directive> directive)
        : MemberInfo(name, directive), ptr_(ptr) {}

    const M& read(const C& obj) const { return obj.*ptr_; }
    void assign(C& obj, M&& value) const { obj.*ptr_ = std::move(value); }

private:
    M C::*ptr_;
};

// Static data member, shared by every instance of the owner
template<class M>
class StaticField : public detail::MemberInfo {
public:
    using value_type = M;
    static constexpr bool replaceable = true;

    constexpr StaticField(std::string_view name, M* ptr, std::optional<Directive> directive)
        : MemberInfo(name, directive), ptr_(ptr) {}

    template<class C>
    const M& read(const C&) const { return *ptr_; }

    template<class C>
    void assign(C&, M&& value) const { *ptr_ = std::move(value); }

private:
    M* ptr_;
};

// Getter/setter pair
template<class C, class G, class S>
class Property : public detail::MemberInfo {
public:
    using value_type = std::remove_cvref_t<std::invoke_result_t<G C::*, const C&>>;
    static constexpr bool replaceable = true;

    constexpr Property(std::string_view name, G C::*getter, S C::*setter,
                       std::optional<Directive> directive)
        : MemberInfo(name, directive), getter_(getter), setter_(setter) {}

    decltype(auto) read(const C& obj) const { return std::invoke(getter_, obj); }
    void assign(C& obj, value_type&& value) const { std::invoke(setter_, obj, std::move(value)); }

private:
    G C::*getter_;
    S C::*setter_;
};

/*
 * Member without a mutator. Deserialize never replaces it, it fills the
 * existing value in place, so the object keeps its identity.
 */
template<class C, class M>
class ReadOnly : public detail::MemberInfo {
public:
    using value_type = M;
    static constexpr bool replaceable = false;

    constexpr ReadOnly(std::string_view name, M C::*ptr, std::optional<Directive> directive)
        : MemberInfo(name, directive), ptr_(ptr) {}

    const M& read(const C& obj) const { return obj.*ptr_; }
    M& mutate(C& obj) const { return obj.*ptr_; }

private:
    M C::*ptr_;
};

template<class C, class M>
constexpr Field<C, M> field(const char* name, M C::*ptr,
                            std::optional<Directive> directive = std::nullopt)
{
    static_assert(!std::is_function_v<M>, "use property() for member functions");
    return Field<C, M>(name, ptr, directive);
}

template<class M>
constexpr StaticField<M> static_field(const char* name, M* ptr,
                                      std::optional<Directive> directive = std::nullopt)
{
    return StaticField<M>(name, ptr, directive);
}

template<class C, class G, class S>
constexpr Property<C, G, S> property(const char* name, G C::*getter, S C::*setter,
                                     std::optional<Directive> directive = std::nullopt)
{
    return Property<C, G, S>(name, getter, setter, directive);
}

template<class C, class M>
constexpr ReadOnly<C, M> readonly(const char* name, M C::*ptr,
                                  std::optional<Directive> directive = std::nullopt)
{
    return ReadOnly<C, M>(name, ptr, directive);
}

template<class... Members>
constexpr std::tuple<Members...> members(Members... list)
{
    return std::tuple<Members...>(std::move(list)...);
}

/*
 * Member table of a record type. Built on first use and only read after
 * that, so concurrent callers can share it.
 */
template<class T>
const auto& members_of()
{
    static const auto table = Mapping<T>::members();
    return table;
}

template<class Table, class F>
void for_each_member(const Table& table, F&& f)
{
    std::apply([&f](const auto&... member) { (f(member), ...); }, table);
}

} // namespace nbtmap
