//------------------------------------------------------------------------------
/*
    This file is part of shylock, a private loan ledger engine.
    Copyright (c) 2025 The Shylock Authors.

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#ifndef SHYLOCK_BASICS_EXPECTED_H_INCLUDED
#define SHYLOCK_BASICS_EXPECTED_H_INCLUDED

#include <shylock/basics/contract.h>

#include <boost/outcome/result.hpp>

#include <concepts>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace shylock {

/** Thrown when an Expected is asked for the half it does not hold. */
struct bad_expected_access : public std::runtime_error
{
    bad_expected_access() : std::runtime_error("bad expected access")
    {
    }
};

namespace detail {

// Every unchecked access to the wrong alternative throws
struct ExpectedPolicy : boost::outcome_v2::policy::base
{
    template <class Impl>
    static constexpr void
    wide_value_check(Impl&& self)
    {
        if (!base::_has_value(std::forward<Impl>(self)))
            Throw<bad_expected_access>();
    }

    template <class Impl>
    static constexpr void
    wide_error_check(Impl&& self)
    {
        if (!base::_has_error(std::forward<Impl>(self)))
            Throw<bad_expected_access>();
    }

    template <class Impl>
    static constexpr void
    wide_exception_check(Impl&&)
    {
        Throw<bad_expected_access>();
    }
};

template <class T, class E>
using ExpectedStorage = boost::outcome_v2::result<T, E, ExpectedPolicy>;

}  // namespace detail

/** Wraps the error half of an Expected so it can be returned directly. */
template <class E>
class Unexpected
{
    static_assert(!std::is_void_v<E>, "E must not be void");

    E error_;

public:
    constexpr explicit Unexpected(E const& e) : error_(e)
    {
    }

    constexpr explicit Unexpected(E&& e) : error_(std::move(e))
    {
    }

    constexpr E const&
    value() const&
    {
        return error_;
    }

    constexpr E&&
    value() &&
    {
        return std::move(error_);
    }
};

/** Either a T or the E describing why there is no T.

    Stored in a boost::outcome_v2::result. Reading the alternative that is
    not held throws bad_expected_access.
*/
template <class T, class E>
class [[nodiscard]] Expected
{
    detail::ExpectedStorage<T, E> r_;

public:
    template <class U>
        requires std::convertible_to<U, T>
    constexpr Expected(U&& value)
        : r_(boost::outcome_v2::in_place_type<T>, std::forward<U>(value))
    {
    }

    template <class U>
        requires std::convertible_to<U, E>
    constexpr Expected(Unexpected<U> e)
        : r_(boost::outcome_v2::in_place_type<E>, std::move(e).value())
    {
    }

    constexpr bool
    has_value() const
    {
        return r_.has_value();
    }

    constexpr explicit
    operator bool() const
    {
        return r_.has_value();
    }

    constexpr T const&
    value() const
    {
        return r_.value();
    }

    constexpr T&
    value()
    {
        return r_.value();
    }

    constexpr E const&
    error() const
    {
        return r_.error();
    }

    constexpr T const&
    operator*() const
    {
        return value();
    }

    constexpr T&
    operator*()
    {
        return value();
    }

    constexpr T const*
    operator->() const
    {
        return &value();
    }

    constexpr T*
    operator->()
    {
        return &value();
    }
};

/** Success carrying nothing, or an E. */
template <class E>
class [[nodiscard]] Expected<void, E>
{
    detail::ExpectedStorage<void, E> r_;

public:
    constexpr Expected() : r_(boost::outcome_v2::success())
    {
    }

    template <class U>
        requires std::convertible_to<U, E>
    constexpr Expected(Unexpected<U> e)
        : r_(boost::outcome_v2::in_place_type<E>, std::move(e).value())
    {
    }

    constexpr explicit
    operator bool() const
    {
        return r_.has_value();
    }

    constexpr E const&
    error() const
    {
        return r_.error();
    }
};

}  // namespace shylock

#endif
