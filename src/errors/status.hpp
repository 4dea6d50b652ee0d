#pragma once

#include <string>

namespace errors
{
    // Outcome of an operation on a single monitored file or artifact.
    // Everything other than Ok is recoverable at file granularity.
    enum class Status
    {
        Ok,
        NotFound,          // baseline or source file missing
        AccessDenied,      // locked or permission-restricted, retry next cycle
        Corrupt,           // unreadable/invalid artifact or spreadsheet
        Timeout,           // extraction exceeded its budget
        ResourceExhausted, // memory over limit during batch work
        PersistFailure     // every save attempt failed
    };

    inline const char *toString(Status status)
    {
        switch (status)
        {
        case Status::Ok:
            return "Ok";
        case Status::NotFound:
            return "NotFound";
        case Status::AccessDenied:
            return "AccessDenied";
        case Status::Corrupt:
            return "Corrupt";
        case Status::Timeout:
            return "Timeout";
        case Status::ResourceExhausted:
            return "ResourceExhausted";
        case Status::PersistFailure:
            return "PersistFailure";
        }
        return "Unknown";
    }
} // namespace errors
