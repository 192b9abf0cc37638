#ifndef SHYLOCK_LEDGER_DAYCOUNT_H_INCLUDED
#define SHYLOCK_LEDGER_DAYCOUNT_H_INCLUDED

#include <shylock/basics/Money.h>
#include <shylock/basics/Rate.h>

#include <cstdint>

namespace shylock {

static constexpr std::uint32_t daysInYear = 365;

/** Actual/365 simple interest on a balance.

    Computes `balance * annualRate * days / 365` exactly and rounds half-up
    to the minor unit.

    @throws std::invalid_argument if days is negative.
    @throws std::overflow_error if the result does not fit in Money.
*/
Money
accrueInterest(
    Money const& balance,
    Rate const& annualRate,
    std::int64_t days);

/** Returns `amount * rate` rounded half-up to the minor unit.

    @throws std::overflow_error if the result does not fit in Money.
*/
Money
applyRate(Money const& amount, Rate const& rate);

}  // namespace shylock

#endif
