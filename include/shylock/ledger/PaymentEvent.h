#ifndef SHYLOCK_LEDGER_PAYMENTEVENT_H_INCLUDED
#define SHYLOCK_LEDGER_PAYMENTEVENT_H_INCLUDED

#include <shylock/basics/Date.h>
#include <shylock/basics/Money.h>

#include <vector>

namespace shylock {

/** A payment received from the borrower. */
struct PaymentEvent
{
    Date date;

    // Always positive once normalized.
    Money amount;

    bool
    operator==(PaymentEvent const& other) const
    {
        return date == other.date && amount == other.amount;
    }
};

using PaymentEvents = std::vector<PaymentEvent>;

}  // namespace shylock

#endif
