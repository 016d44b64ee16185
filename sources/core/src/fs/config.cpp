#include "fs/config.hpp"

using namespace rvfs;

RvfsStatus VfsConfig::verify() const {
    if (clientId.empty()) {
        return RvfsStatusInvalidInput;
    }

    //
    // Client paths are absolute and supply their own leading separator.
    //
    if (pathPrefix.empty() || pathPrefix.back() == kPathSeparator || pathPrefix.front() == kPathSeparator) {
        return RvfsStatusInvalidInput;
    }

    if (defaultDepth < 1) {
        return RvfsStatusInvalidInput;
    }

    return RvfsStatusSuccess;
}
