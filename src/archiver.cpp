#include "archiver.h"
#include "constants.h"
#include "errors.h"
#include <tar.h>
#include <sys/stat.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <limits>
#include <cstdio>
#include <cstring>

namespace fs = std::filesystem;

namespace execbox {

namespace {

// Typeflags <tar.h> does not define
constexpr char GNU_LONGNAME = 'L';
constexpr char GNU_LONGLINK = 'K';
constexpr char PAX_HEADER = 'x';
constexpr char PAX_GLOBAL_HEADER = 'g';

// ustar header layout
constexpr size_t OFF_NAME = 0;
constexpr size_t OFF_MODE = 100;
constexpr size_t OFF_UID = 108;
constexpr size_t OFF_GID = 116;
constexpr size_t OFF_SIZE = 124;
constexpr size_t OFF_MTIME = 136;
constexpr size_t OFF_CHKSUM = 148;
constexpr size_t OFF_TYPE = 156;
constexpr size_t OFF_MAGIC = 257;
constexpr size_t OFF_VERSION = 263;
constexpr size_t OFF_PREFIX = 345;
constexpr size_t NAME_LENGTH = 100;
constexpr size_t PREFIX_LENGTH = 155;
constexpr unsigned long long MAX_OCTAL_SIZE = 077777777777ULL;  // 11 digits

size_t padded(size_t size) {
    return (size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE * TAR_BLOCK_SIZE;
}

void write_octal(char* field, size_t width, unsigned long long value) {
    // width - 1 digits followed by NUL
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1), value);
}

unsigned int unsigned_checksum(const char* header) {
    unsigned int sum = 0;
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        bool in_field = i >= OFF_CHKSUM && i < OFF_CHKSUM + 8;
        sum += in_field ? ' ' : static_cast<unsigned char>(header[i]);
    }
    return sum;
}

int signed_checksum(const char* header) {
    int sum = 0;
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        bool in_field = i >= OFF_CHKSUM && i < OFF_CHKSUM + 8;
        sum += in_field ? ' ' : static_cast<signed char>(header[i]);
    }
    return sum;
}

std::string make_header(const std::string& name, char type, size_t size,
                        unsigned int mode, long long mtime) {
    if (size > MAX_OCTAL_SIZE) {
        throw ArchiveError("entry too large for ustar: " + name);
    }

    std::string block(TAR_BLOCK_SIZE, '\0');
    char* h = &block[0];

    std::memcpy(h + OFF_NAME, name.data(), std::min(name.size(), NAME_LENGTH));
    write_octal(h + OFF_MODE, 8, mode & 07777);
    write_octal(h + OFF_UID, 8, 0);
    write_octal(h + OFF_GID, 8, 0);
    write_octal(h + OFF_SIZE, 12, size);
    write_octal(h + OFF_MTIME, 12, mtime > 0 ? static_cast<unsigned long long>(mtime) : 0);
    h[OFF_TYPE] = type;
    std::memcpy(h + OFF_MAGIC, TMAGIC, TMAGLEN);
    std::memcpy(h + OFF_VERSION, TVERSION, TVERSLEN);

    std::snprintf(h + OFF_CHKSUM, 7, "%06o", unsigned_checksum(h));
    h[OFF_CHKSUM + 7] = ' ';
    return block;
}

void append_entry(std::string& out, const std::string& name, char type,
                  unsigned int mode, long long mtime, const std::string& data) {
    if (name.size() > NAME_LENGTH) {
        std::string long_name = name + '\0';
        out += make_header("././@LongLink", GNU_LONGNAME, long_name.size(), 0644, 0);
        out += long_name;
        out.append(padded(long_name.size()) - long_name.size(), '\0');
    }
    out += make_header(name, type, data.size(), mode, mtime);
    out += data;
    out.append(padded(data.size()) - data.size(), '\0');
}

std::string read_whole_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ArchiveError("cannot read " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

void append_path(std::string& out, const fs::path& path, const std::string& name) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        throw ArchiveError("cannot stat " + path.string());
    }

    if (S_ISDIR(st.st_mode)) {
        std::string dir_name = name.back() == '/' ? name : name + "/";
        append_entry(out, dir_name, DIRTYPE, st.st_mode, st.st_mtime, "");
    } else if (S_ISREG(st.st_mode)) {
        append_entry(out, name, REGTYPE, st.st_mode, st.st_mtime, read_whole_file(path));
    } else {
        std::cout << "[Archiver] Skipping non-regular file: " << path.string() << std::endl;
    }
}

unsigned long long parse_number(const char* field, size_t width) {
    if (static_cast<unsigned char>(field[0]) & 0x80) {
        // GNU base-256
        unsigned long long value = static_cast<unsigned char>(field[0]) & 0x7F;
        for (size_t i = 1; i < width; ++i) {
            if (value >> 56) {
                throw ArchiveError("numeric field out of range");
            }
            value = (value << 8) | static_cast<unsigned char>(field[i]);
        }
        return value;
    }

    unsigned long long value = 0;
    size_t i = 0;
    while (i < width && field[i] == ' ') i++;
    for (; i < width; ++i) {
        char c = field[i];
        if (c == '\0' || c == ' ') break;
        if (c < '0' || c > '7') {
            throw ArchiveError("invalid numeric field");
        }
        value = value * 8 + static_cast<unsigned long long>(c - '0');
    }
    return value;
}

std::string field_string(const char* field, size_t width) {
    return std::string(field, strnlen(field, width));
}

bool is_zero_block(const char* block) {
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (block[i] != '\0') return false;
    }
    return true;
}

bool has_no_payload(char type) {
    return type == LNKTYPE || type == SYMTYPE || type == CHRTYPE ||
           type == BLKTYPE || type == DIRTYPE || type == FIFOTYPE;
}

// PAX extended header: "<len> <key>=<value>\n" records
void parse_pax(const std::string& data, std::string& path, bool& has_path,
               size_t& size, bool& has_size) {
    size_t pos = 0;
    while (pos < data.size()) {
        if (data[pos] == '\0') break;  // trailing padding

        size_t space = data.find(' ', pos);
        if (space == std::string::npos) {
            throw ArchiveError("malformed PAX record");
        }
        size_t length = 0;
        for (size_t i = pos; i < space; ++i) {
            if (data[i] < '0' || data[i] > '9') {
                throw ArchiveError("malformed PAX record length");
            }
            length = length * 10 + static_cast<size_t>(data[i] - '0');
        }
        if (length <= space - pos + 1 || pos + length > data.size() || data[pos + length - 1] != '\n') {
            throw ArchiveError("malformed PAX record");
        }

        std::string record = data.substr(space + 1, pos + length - space - 2);
        size_t equals = record.find('=');
        if (equals == std::string::npos) {
            throw ArchiveError("malformed PAX record");
        }
        std::string key = record.substr(0, equals);
        std::string value = record.substr(equals + 1);

        if (key == "path") {
            path = value;
            has_path = true;
        } else if (key == "size") {
            try {
                size = static_cast<size_t>(std::stoull(value));
            } catch (const std::exception&) {
                throw ArchiveError("malformed PAX size: " + value);
            }
            has_size = true;
        }
        pos += length;
    }
}

std::string strip_dot_slash(std::string name) {
    while (name.compare(0, 2, "./") == 0) {
        name.erase(0, 2);
    }
    return name;
}

// Destination-relative path of an entry; empty for the archive root
fs::path checked_relative_path(const std::string& name) {
    if (!name.empty() && name[0] == '/') {
        throw ArchiveError("absolute path in archive: " + name);
    }
    fs::path relative;
    for (const auto& part : fs::path(name)) {
        std::string component = part.string();
        if (component == "..") {
            throw ArchiveError("parent reference in archive: " + name);
        }
        if (component.empty() || component == ".") continue;
        relative /= part;
    }
    return relative;
}

} // namespace

bool TarEntry::is_directory() const {
    return type == DIRTYPE || (type == AREGTYPE && !name.empty() && name.back() == '/');
}

bool TarEntry::is_regular() const {
    return (type == REGTYPE || type == AREGTYPE || type == CONTTYPE) && !is_directory();
}

std::string Archiver::pack(const std::string& source_path, const std::string& arcname) {
    fs::path source(source_path);
    if (source.filename().empty()) {
        source = source.parent_path();  // trailing separator
    }

    std::error_code ec;
    fs::file_status status = fs::symlink_status(source, ec);
    if (ec || !fs::exists(status)) {
        throw ArchiveError("cannot archive missing path " + source_path);
    }

    std::string root = arcname.empty() ? source.filename().string() : arcname;
    if (root.empty()) {
        throw ArchiveError("cannot derive an archive name for " + source_path);
    }

    std::string out;
    if (fs::is_directory(status)) {
        append_path(out, source, root);

        std::vector<fs::path> children;
        for (const auto& entry : fs::recursive_directory_iterator(source)) {
            children.push_back(entry.path());
        }
        std::sort(children.begin(), children.end());

        for (const auto& child : children) {
            append_path(out, child, root + "/" + child.lexically_relative(source).generic_string());
        }
    } else {
        append_path(out, source, root);
    }

    out.append(2 * TAR_BLOCK_SIZE, '\0');
    return out;
}

std::vector<TarEntry> Archiver::list(const std::string& archive) {
    std::vector<TarEntry> entries;

    std::string long_name;
    bool has_long_name = false;
    std::string pax_path;
    bool has_pax_path = false;
    size_t pax_size = 0;
    bool has_pax_size = false;

    size_t offset = 0;
    while (offset < archive.size()) {
        if (archive.size() - offset < TAR_BLOCK_SIZE) {
            throw ArchiveError("truncated header at offset " + std::to_string(offset));
        }

        const char* h = archive.data() + offset;
        if (is_zero_block(h)) {
            break;
        }

        // Some historic writers summed signed bytes
        long long stored = static_cast<long long>(parse_number(h + OFF_CHKSUM, 8));
        if (stored != unsigned_checksum(h) && stored != signed_checksum(h)) {
            throw ArchiveError("checksum mismatch at offset " + std::to_string(offset));
        }

        char type = h[OFF_TYPE];
        size_t size = static_cast<size_t>(parse_number(h + OFF_SIZE, 12));
        size_t data_offset = offset + TAR_BLOCK_SIZE;

        bool is_meta = type == GNU_LONGNAME || type == GNU_LONGLINK ||
                       type == PAX_HEADER || type == PAX_GLOBAL_HEADER;
        if (!is_meta && has_pax_size) {
            size = pax_size;
        }
        if (!is_meta && has_no_payload(type)) {
            size = 0;
        }
        if (size > archive.size() - data_offset) {
            throw ArchiveError("truncated entry at offset " + std::to_string(offset));
        }
        size_t next = std::min(data_offset + padded(size), archive.size());

        if (type == GNU_LONGNAME) {
            long_name = field_string(archive.data() + data_offset, size);
            has_long_name = true;
        } else if (type == PAX_HEADER) {
            parse_pax(archive.substr(data_offset, size), pax_path, has_pax_path,
                      pax_size, has_pax_size);
        } else if (!is_meta) {
            TarEntry entry;
            if (has_pax_path) {
                entry.name = pax_path;
            } else if (has_long_name) {
                entry.name = long_name;
            } else {
                entry.name = field_string(h + OFF_NAME, NAME_LENGTH);
                if (std::memcmp(h + OFF_MAGIC, TMAGIC, TMAGLEN) == 0) {
                    std::string prefix = field_string(h + OFF_PREFIX, PREFIX_LENGTH);
                    if (!prefix.empty()) {
                        entry.name = prefix + "/" + entry.name;
                    }
                }
            }
            entry.name = strip_dot_slash(entry.name);
            entry.type = type;
            entry.size = size;
            entry.mode = static_cast<unsigned int>(parse_number(h + OFF_MODE, 8) & 07777);
            entry.data_offset = data_offset;
            entries.push_back(entry);

            has_long_name = false;
            has_pax_path = false;
            has_pax_size = false;
        }

        offset = next;
    }

    return entries;
}

size_t Archiver::declared_size(const std::string& archive) {
    size_t total = 0;
    for (const auto& entry : list(archive)) {
        if (!entry.is_regular()) continue;
        if (entry.size > std::numeric_limits<size_t>::max() - total) {
            return std::numeric_limits<size_t>::max();
        }
        total += entry.size;
    }
    return total;
}

void Archiver::unpack(const std::string& archive, const std::string& dest_dir, size_t size_limit) {
    std::vector<TarEntry> entries = list(archive);

    // Size check before touching the destination
    size_t total = 0;
    std::vector<std::string> regular_names;
    for (const auto& entry : entries) {
        if (!entry.is_regular()) continue;
        regular_names.push_back(entry.name);
        total = entry.size > std::numeric_limits<size_t>::max() - total
                    ? std::numeric_limits<size_t>::max()
                    : total + entry.size;
    }
    if (size_limit > 0 && total > size_limit) {
        std::string what = regular_names.size() == 1
                               ? fs::path(regular_names.front()).filename().string()
                               : "archive";
        throw PayloadTooLargeError("File " + what + " is " + std::to_string(total) +
                                       " bytes, (max size is " + std::to_string(size_limit) +
                                       " bytes)",
                                   total, size_limit);
    }

    std::vector<fs::path> targets;
    targets.reserve(entries.size());
    for (const auto& entry : entries) {
        targets.push_back(checked_relative_path(entry.name));
    }

    fs::path dest(dest_dir);
    fs::create_directories(dest);

    for (size_t i = 0; i < entries.size(); ++i) {
        const TarEntry& entry = entries[i];
        if (targets[i].empty()) continue;
        fs::path target = dest / targets[i];

        if (entry.is_directory()) {
            fs::create_directories(target);
        } else if (entry.is_regular()) {
            fs::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw ExecutionError(FailureKind::RESOURCE_EXHAUSTED,
                                     "Cannot create " + target.string());
            }
            out.write(archive.data() + entry.data_offset, static_cast<std::streamsize>(entry.size));
            out.close();
            if (!out) {
                throw ExecutionError(FailureKind::RESOURCE_EXHAUSTED,
                                     "Cannot write " + target.string());
            }
            fs::permissions(target,
                            static_cast<fs::perms>(entry.mode & 0777) |
                                fs::perms::owner_read | fs::perms::owner_write);
        } else {
            std::cout << "[Archiver] Skipping " << entry.name << " (type '"
                      << (entry.type ? entry.type : '0') << "')" << std::endl;
        }
    }
}

} // namespace execbox
