#ifndef SHYLOCK_LEDGER_LATEFEE_H_INCLUDED
#define SHYLOCK_LEDGER_LATEFEE_H_INCLUDED

#include <shylock/basics/Money.h>
#include <shylock/ledger/LoanTerms.h>

namespace shylock {

/** Returns the late fee for a cycle under the given policy.

    A fixed fee is the policy amount. A percentage fee is that percent of
    the cycle's accrued interest. Both are rounded half-up to the minor
    unit; zero is a valid fee.
*/
Money
assessLateFee(Money const& cycleInterest, LateFeePolicy const& policy);

}  // namespace shylock

#endif
