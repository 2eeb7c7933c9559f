// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RETURN_CODES_H_81307482137054156
#define RETURN_CODES_H_81307482137054156

#include <zen/error_log.h>


namespace rsh
{
enum RshReturnCode //as returned after process exit
{
    RSH_RC_SUCCESS   = 0,
    RSH_RC_WARNING   = 1,
    RSH_RC_ERROR     = 2,
    RSH_RC_EXCEPTION = 4,
};


inline
void raiseReturnCode(RshReturnCode& rc, RshReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


inline
RshReturnCode mapToReturnCode(const zen::ErrorLogStats& stats)
{
    if (stats.error > 0)
        return RSH_RC_ERROR;
    if (stats.warning > 0)
        return RSH_RC_WARNING;
    return RSH_RC_SUCCESS;
}
}

#endif //RETURN_CODES_H_81307482137054156
