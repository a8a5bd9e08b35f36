#include "vmk/util/format.hpp"

using namespace stdx::literals;

static stdx::StringView GetStatusName(OsStatusId status) {
    switch (status) {
    case OsStatusSuccess: return "Success"_sv;
    case OsStatusOutOfMemory: return "OutOfMemory"_sv;
    case OsStatusNotFound: return "NotFound"_sv;
    case OsStatusInvalidInput: return "InvalidInput"_sv;
    case OsStatusNotSupported: return "NotSupported"_sv;
    case OsStatusAlreadyExists: return "AlreadyExists"_sv;
    case OsStatusOutOfBounds: return "OutOfBounds"_sv;
    case OsStatusInvalidAddress: return "InvalidAddress"_sv;
    case OsStatusDeviceBusy: return "DeviceBusy"_sv;
    case OsStatusAccessDenied: return "AccessDenied"_sv;
    case OsStatusNotAvailable: return "NotAvailable"_sv;
    default: return stdx::StringView();
    }
}

void vmk::Format<OsStatusId>::format(IOutStream& out, OsStatusId value) {
    stdx::StringView name = GetStatusName(value);
    if (name.isEmpty()) {
        out.format(Hex(OsStatus(value)).pad(4));
    } else {
        out.format(name, " (", Hex(OsStatus(value)).pad(4), ")");
    }
}
