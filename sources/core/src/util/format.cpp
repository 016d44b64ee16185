#include "util/format.hpp"

#include <iomanip>

std::ostream& rvfs::operator<<(std::ostream& out, Hex value) {
    std::ios_base::fmtflags flags = out.flags();
    char fill = out.fill();

    out << "0x" << std::hex << std::setfill(value.fill) << std::setw(value.width) << value.value;

    out.fill(fill);
    out.flags(flags);
    return out;
}

std::string_view rvfs::StatusName(RvfsStatus status) noexcept {
    switch (status) {
    case RvfsStatusSuccess:
        return "Success";
    case RvfsStatusOutOfMemory:
        return "Out of memory";
    case RvfsStatusNotFound:
        return "Not found";
    case RvfsStatusInvalidInput:
        return "Invalid input";
    case RvfsStatusNotSupported:
        return "Not supported";
    case RvfsStatusAlreadyExists:
        return "Already exists";
    case RvfsStatusTraverseNonFolder:
        return "Traverse non-folder";
    case RvfsStatusInvalidPath:
        return "Invalid path";
    case RvfsStatusInvalidData:
        return "Invalid data";
    case RvfsStatusInvalidHandle:
        return "Invalid handle";
    case RvfsStatusCompleted:
        return "Completed";
    case RvfsStatusAccessDenied:
        return "Access denied";
    case RvfsStatusApprovalMissing:
        return "Approval missing";
    default:
        return "Unknown";
    }
}

std::ostream& operator<<(std::ostream& out, RvfsStatusId value) {
    return out << rvfs::StatusName(value) << " (" << rvfs::Hex(RvfsStatus(value)).pad(8) << ")";
}
