// FileSystem: path handling for the options file and the work files it names (POSIX)

#ifndef FILE_SYSTEM_H
#define FILE_SYSTEM_H

#include <string>

namespace FileSystem {

constexpr char separator = '/';

// "dir" + "file" -> "dir/file" (an empty 'dir' returns 'file' unchanged)
std::string join(const std::string& dir, const std::string& file);

// Canonical absolute path of an existing file or directory
// - Throws std::runtime_error if the path cannot be resolved
std::string realpath(const std::string& path);

// Directory part of a path: "a/b/c.in" -> "a/b", "c.in" -> ".", "/c.in" -> "/"
std::string dirname(const std::string& path);

bool isAbsolutePath(const std::string& path);

// Absolute form of 'path', which is taken to be relative to 'base_dir' unless
// it is already absolute
// - Input files use this to locate the files they list
std::string resolveRelativePath(const std::string& path, const std::string& base_dir);

} // end namespace FileSystem

#endif // ifndef FILE_SYSTEM_H
