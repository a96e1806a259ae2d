#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace execbox {

// One header record of a TAR stream
struct TarEntry {
    std::string name;          // path inside the archive, "./" stripped
    char type;                 // ustar typeflag ('0', '5', '2', ...)
    size_t size;               // declared payload size
    unsigned int mode;         // permission bits
    size_t data_offset;        // payload position inside the stream

    bool is_regular() const;
    bool is_directory() const;
};

// TAR streams between host paths and sandbox paths.
// Knows nothing about containers: the runtime client moves the bytes.
class Archiver {
public:
    // Archive a file or a directory tree. The root entry keeps the base name
    // of source_path unless arcname is given. Entries are emitted sorted.
    // Throws ArchiveError if source_path does not exist or cannot be read.
    static std::string pack(const std::string& source_path, const std::string& arcname = "");

    // Extract into dest_dir. All headers are inspected first: if the declared
    // payload exceeds size_limit nothing is written and PayloadTooLargeError
    // is thrown. size_limit == 0 means unlimited. Malformed archives and
    // entries escaping dest_dir throw ArchiveError, also before any write.
    static void unpack(const std::string& archive, const std::string& dest_dir, size_t size_limit);

    // Sum of the declared sizes of all regular-file entries
    static size_t declared_size(const std::string& archive);

    // Header records of the stream (ustar, GNU long names, PAX path/size)
    static std::vector<TarEntry> list(const std::string& archive);
};

} // namespace execbox
