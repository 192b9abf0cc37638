#ifndef SHYLOCK_LEDGER_LEDGERERRORS_H_INCLUDED
#define SHYLOCK_LEDGER_LEDGERERRORS_H_INCLUDED

#include <stdexcept>
#include <string>

namespace shylock {

/** Loan terms that cannot produce a ledger.

    Raised before any cycle is computed when the principal, a rate, the
    late fee amount or the grace period is negative.
*/
class InvalidTerms : public std::invalid_argument
{
public:
    explicit InvalidTerms(std::string const& what)
        : std::invalid_argument("Invalid loan terms: " + what)
    {
    }
};

/** Payment events reached the engine out of date order.

    The normalizer guarantees strictly increasing dates, so this signals a
    broken caller rather than bad user data.
*/
class UnorderedInternalState : public std::logic_error
{
public:
    explicit UnorderedInternalState(std::string const& what)
        : std::logic_error(what)
    {
    }
};

}  // namespace shylock

#endif
