#pragma once

#include "core/types.hpp"

#include <string>

namespace bpfs::overlay {
class FilesystemOperations;
}

namespace bpfs::fuse {

struct MountOptions {
    fs::path mount_point;
    bool foreground = true;
    bool debug = false; ///< libfuse's own request tracing (-d)
};

/// Mount ops through libfuse 3 and serve requests on its multi-threaded
/// loop until the filesystem is unmounted. Returns fuse_main's status.
int run(overlay::FilesystemOperations& ops, const MountOptions& options);

/// Name of a uid, or the number as text when it has no passwd entry.
std::string user_name(u32 uid);

} // namespace bpfs::fuse
