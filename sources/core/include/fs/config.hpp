#pragma once

#include <rvfs/status.h>

#include "fs/path.hpp"
#include "logger/appender.hpp"

#include <string>

namespace rvfs {
    using ClientId = std::string;

    /// @brief Configuration for a @a VfsClient.
    struct VfsConfig {
        /// @brief The client whose filesystem is accessed, for example "C.1234567890abcdef".
        ClientId clientId;

        /// @brief The namespace of the remote vfs that the providers are bound to.
        ///
        /// Only names the remote resource in approval failures and log messages,
        /// providers always receive client paths.
        std::string pathPrefix{kDefaultVfsPrefix};

        /// @brief The depth used by listings that do not specify one.
        int defaultDepth = 1;

        /// @brief The minimum level of messages written to the global log queue.
        LogLevel logLevel = LogLevel::eInfo;

        /// @brief Check that the configuration is usable.
        ///
        /// @retval RvfsStatusInvalidInput The client id or the path prefix is malformed,
        ///                                or the default depth is below 1.
        RvfsStatus verify() const;
    };
}
