#ifndef PSYNC_PATHUTILS_H
#define PSYNC_PATHUTILS_H

#include <string>

namespace utils {
    // File existence checks
    bool FileExistsUtf8(const std::string &file);
    bool DirectoryExistsUtf8(const std::string &dir);

    // Create directory tree (creates all directories in path)
    bool CreateFileTreeUtf8(const std::string &path);

    // Directory deletion (recursive)
    bool DeleteDirectoryUtf8(const std::string &path);

    std::string GetDirectoryUtf8(const std::string &path);
    std::string CombinePathUtf8(const std::string &path1, const std::string &path2);

    // Expands a leading "~" or "~/" from $HOME. Other forms are returned untouched.
    std::string ExpandUserUtf8(const std::string &path);

    // System paths
    std::string GetTempPathUtf8();

    // File I/O. Reads are binary; no newline translation takes place.
    bool ReadTextFileUtf8(const std::string &path, std::string &out);

    // Follows a chain of symlinks to the file it names; non-links are returned as-is.
    std::string ResolveSymlinkUtf8(const std::string &path);

    // Writes through "<target>.tmp" then renames over the target, where the
    // target is the path with symlinks resolved. Missing parent directories are created.
    bool WriteTextFileUtf8(const std::string &path, const std::string &content);
}

#endif // PSYNC_PATHUTILS_H
