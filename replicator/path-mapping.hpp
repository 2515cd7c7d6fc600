#ifndef REPLICATOR_PATH_MAPPING_HPP_INCLUDED
#define REPLICATOR_PATH_MAPPING_HPP_INCLUDED
//
// path-mapping.hpp
//
#include "filesystem-common.hpp"

#include <optional>
#include <string>

namespace replicator
{

    // Returns the part of sourcePath below rootPath with no leading or trailing separators, or
    // nullopt if sourcePath is not rootPath or inside it.  Both '\' and '/' count as separators on
    // every platform, and on windows the prefix is compared case insensitively.
    [[nodiscard]] std::optional<std::wstring>
        relativeRemainder(const std::wstring & sourcePath, const std::wstring & rootPath);

    // Strips rootPath from the front of sourcePath and puts destinationRoot in its place.  Trailing
    // separators on any of the three inputs make no difference, and the separator used to join is
    // the one destinationRoot already uses.
    //  i.e.  ("\\server\share\folder\", "\\server\share\", "D:\Backup\")  ->  "D:\Backup\folder"
    //
    // Throws std::invalid_argument if sourcePath is not inside rootPath.
    [[nodiscard]] fs::path mapDestinationPath(
        const fs::path & sourcePath, const fs::path & rootPath, const fs::path & destinationRoot);

} // namespace replicator

#endif // REPLICATOR_PATH_MAPPING_HPP_INCLUDED
