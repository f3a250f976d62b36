#ifndef JSONL_UTILS_COMMON_PLATFORM_COMPAT_H
#define JSONL_UTILS_COMMON_PLATFORM_COMPAT_H

// 64-bit stdio seeking. On POSIX the build defines _FILE_OFFSET_BITS=64 so
// that off_t is 64 bits wide on 32-bit systems too.

#include <cstdint>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#else
#include <sys/types.h>
#include <unistd.h>
#endif

namespace jsonl::utils::compat {

#ifdef _WIN32
using file_offset_t = __int64;

inline int seek64(FILE *file, file_offset_t offset, int whence) {
    return _fseeki64(file, offset, whence);
}

inline file_offset_t tell64(FILE *file) { return _ftelli64(file); }
#else
using file_offset_t = off_t;

inline int seek64(FILE *file, file_offset_t offset, int whence) {
    return fseeko(file, offset, whence);
}

inline file_offset_t tell64(FILE *file) { return ftello(file); }
#endif

}  // namespace jsonl::utils::compat

#endif  // JSONL_UTILS_COMMON_PLATFORM_COMPAT_H
