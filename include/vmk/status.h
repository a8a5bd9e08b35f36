#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef uint64_t OsStatus;

enum OsStatusId {
    /// @brief The operation was successful.
    OsStatusSuccess = 0x0000,

    /// @brief The operation could not be completed due to a lack of memory.
    OsStatusOutOfMemory = 0x0001,

    /// @brief The requested resource could not be found.
    OsStatusNotFound = 0x0002,

    /// @brief The input to the operation was invalid.
    OsStatusInvalidInput = 0x0003,

    /// @brief The resource does not support the operation.
    ///
    /// Returned when a page table walk reaches a huge page leaf.
    OsStatusNotSupported = 0x0004,

    /// @brief The resource already exists.
    ///
    /// Returned when mapping onto a page that is already present.
    OsStatusAlreadyExists = 0x0005,

    OsStatusOutOfBounds = 0x000f,

    /// @brief The memory address is not available.
    OsStatusInvalidAddress = 0x0013,

    OsStatusDeviceBusy = 0x0016,

    /// @brief The operation was denied due to insufficient permissions.
    OsStatusAccessDenied = 0x001c,

    /// @brief The requested resource was found, but is not available.
    OsStatusNotAvailable = 0x001e,
};

#ifdef __cplusplus
}
#endif
