#ifndef SHYLOCK_APP_STATEMENT_STATEMENTCONTEXT_H_INCLUDED
#define SHYLOCK_APP_STATEMENT_STATEMENTCONTEXT_H_INCLUDED

#include <shylock/basics/Date.h>

#include <cstddef>
#include <string>

namespace shylock {

/** Everything a statement shows that is not part of the ledger itself. */
struct StatementContext
{
    std::string loanName = "Loan";
    std::string lenderName;
    std::string borrowerName;

    Date generatedOn;

    // Ledger rows printed under each activity heading.
    std::size_t rowsPerPage = 24;
};

}  // namespace shylock

#endif
