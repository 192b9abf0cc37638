#ifndef SHYLOCK_LEDGER_CYCLERECORD_H_INCLUDED
#define SHYLOCK_LEDGER_CYCLERECORD_H_INCLUDED

#include <shylock/basics/Date.h>
#include <shylock/basics/Money.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace shylock {

/* One row of the ledger, describing a single billing cycle.
 *
 * A cycle runs from the previous due date (the origination date for the
 * first cycle) to dueDate. Interest accrues on the balance in effect at the
 * start of the cycle. The cycle is satisfied once enough payment money has
 * arrived to cover that interest.
 *
 * Balance identity, for every row:
 *   endingPrincipalBalance ==
 *       openingPrincipalBalance + lateFeeAssessed - principalApplied
 */
struct CycleRecord
{
    // 1-based index of the cycle.
    std::uint32_t cycle = 0;

    Date dueDate;

    // Date of the payment whose arrival finally covered the cycle interest.
    // Empty if the cycle is still open.
    std::optional<Date> satisfyingPaymentDate;

    // Days from dueDate to the satisfying payment, or to the as-of date for
    // an open cycle. Never negative.
    std::int64_t daysLate = 0;

    Money openingPrincipalBalance;

    Money cycleInterest;

    // Payment money posted against this cycle: interest plus principal
    // applied, or the partial pool for an open cycle.
    Money amountPosted;

    // Capitalized into the balance this cycle.
    Money lateFeeAssessed;

    Money principalApplied;

    Money endingPrincipalBalance;

    // Payment money held over for later cycles.
    Money carryForward;

    bool
    isOpen() const
    {
        return !satisfyingPaymentDate.has_value();
    }

    bool
    operator==(CycleRecord const& other) const = default;
};

using Ledger = std::vector<CycleRecord>;

}  // namespace shylock

#endif
