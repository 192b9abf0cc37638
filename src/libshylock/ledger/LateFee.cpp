#include <shylock/basics/contract.h>
#include <shylock/basics/mulDiv.h>
#include <shylock/ledger/DayCount.h>
#include <shylock/ledger/LateFee.h>

#include <stdexcept>

namespace shylock {

Money
assessLateFee(Money const& cycleInterest, LateFeePolicy const& policy)
{
    if (policy.amount.signum() < 0)
        Throw<std::invalid_argument>(
            "late fee amount is negative: " + to_string(policy.amount));

    switch (policy.kind)
    {
        case LateFeePolicy::Kind::fixed:
            return applyRate(Money{Money::minorPerMajor}, policy.amount);

        case LateFeePolicy::Kind::percentOfCycleInterest:
            if (cycleInterest.signum() <= 0)
                return Money{};

            // The amount is in percentage points: divide by a further 100
            return Money{static_cast<Money::value_type>(mulDivThrow(
                static_cast<std::uint64_t>(cycleInterest.minorUnits()),
                static_cast<std::uint64_t>(policy.amount.mantissa()),
                power10(policy.amount.scale() + 2),
                Rounding::halfUp))};
    }
    return Money{};
}

}  // namespace shylock
