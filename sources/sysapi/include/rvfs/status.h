#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef uint64_t RvfsStatus;

enum RvfsStatusId {
    /// @brief The operation was successful.
    RvfsStatusSuccess = 0x0000,

    /// @brief The operation could not be completed due to a lack of memory.
    RvfsStatusOutOfMemory = 0x0001,

    /// @brief The requested resource could not be found.
    RvfsStatusNotFound = 0x0002,

    /// @brief The input to the operation was invalid.
    RvfsStatusInvalidInput = 0x0003,

    /// @brief The resource does not support the operation.
    ///
    /// Returned by write family calls on read only streams, and for
    /// seek origins the stream does not handle.
    RvfsStatusNotSupported = 0x0004,

    /// @brief The resource already exists.
    RvfsStatusAlreadyExists = 0x0005,

    /// @brief Attempted to traverse over a non-folder entry.
    ///
    /// When listing a path an entry that wasnt a folder was encountered.
    RvfsStatusTraverseNonFolder = 0x0006,

    /// @brief The path is malformed.
    ///
    /// Malformed paths are paths that are not absolute, or that contain
    /// empty segments.
    RvfsStatusInvalidPath = 0x0007,

    /// @brief The data is invalid.
    ///
    /// A provider handed back data that breaks its contract, such as an
    /// empty chunk.
    RvfsStatusInvalidData = 0x0008,

    /// @brief The handle is stale or invalid.
    ///
    /// Returned by content operations on a stream that has been closed.
    RvfsStatusInvalidHandle = 0x0009,

    /// @brief The operation was completed.
    ///
    /// Returned by iterators once there are no more items.
    RvfsStatusCompleted = 0x000a,

    /// @brief The operation was denied due to insufficient permissions.
    ///
    /// Reported by providers, the client layer translates this into
    /// @ref RvfsStatusApprovalMissing.
    RvfsStatusAccessDenied = 0x000b,

    /// @brief The client has no approval to access the resource.
    RvfsStatusApprovalMissing = 0x000c,
};

#define RVFS_SUCCESS(status) ((status) == RvfsStatusSuccess)
#define RVFS_ERROR(status) ((status) != RvfsStatusSuccess)

#ifdef __cplusplus
}
#endif
