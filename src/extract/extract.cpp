#include "rootcache/extract.hpp"
#include "rootcache/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

#include <lzma.h>
#include <zlib.h>

namespace fs = std::filesystem;

namespace rootcache {

// ============================================================================
// Tar Format Constants (POSIX ustar + GNU/pax extensions)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_CHKSUM_SIZE = 8;
static constexpr size_t TAR_LINKNAME_SIZE = 100;
static constexpr size_t TAR_PREFIX_SIZE = 155;

static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_CHRTYPE = '3';
static constexpr char TAR_BLKTYPE = '4';
static constexpr char TAR_DIRTYPE = '5';
static constexpr char TAR_FIFOTYPE = '6';
static constexpr char TAR_CONTTYPE = '7';
static constexpr char TAR_GNU_LONGNAME = 'L';
static constexpr char TAR_GNU_LONGLINK = 'K';
static constexpr char TAR_PAX_HEADER = 'x';
static constexpr char TAR_PAX_GLOBAL = 'g';

// Upper bound for GNU long-name and pax header payloads
static constexpr uint64_t TAR_MAX_META_SIZE = 1024 * 1024;

static constexpr size_t INPUT_CHUNK_SIZE = 64 * 1024;

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[12];                 // 136
    char chksum[TAR_CHKSUM_SIZE];   // 148
    char typeflag;                  // 156
    char linkname[TAR_LINKNAME_SIZE]; // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

const char* archive_format_to_string(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::TarGz: return "tar.gz";
        case ArchiveFormat::TarXz: return "tar.xz";
    }
    return "unknown";
}

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ============================================================================
// Decompressing Sources
// ============================================================================

enum class ReadStatus {
    Data,
    End,
    Error,
};

class Decompressor {
public:
    virtual ~Decompressor() = default;

    // Produce up to `cap` bytes into `out`; `produced` is 0 only with End/Error
    virtual ReadStatus read(uint8_t* out, size_t cap, size_t& produced) = 0;

    const std::string& error() const { return error_; }

protected:
    // Refill the input buffer from the archive file; false at EOF
    bool refill(std::ifstream& file) {
        file.read(reinterpret_cast<char*>(in_.data()), static_cast<std::streamsize>(in_.size()));
        in_len_ = static_cast<size_t>(file.gcount());
        return in_len_ > 0;
    }

    std::vector<uint8_t> in_ = std::vector<uint8_t>(INPUT_CHUNK_SIZE);
    size_t in_len_ = 0;
    std::string error_;
};

// gzip via zlib; concatenated members are decoded back to back
class GzipDecompressor : public Decompressor {
public:
    explicit GzipDecompressor(std::ifstream& file) : file_(file) {
        std::memset(&strm_, 0, sizeof(strm_));
        if (inflateInit2(&strm_, 16 + MAX_WBITS) == Z_OK) {
            initialized_ = true;
        } else {
            error_ = "failed to initialize gzip decoder";
        }
    }

    ~GzipDecompressor() override {
        if (initialized_) inflateEnd(&strm_);
    }

    GzipDecompressor(const GzipDecompressor&) = delete;
    GzipDecompressor& operator=(const GzipDecompressor&) = delete;

    ReadStatus read(uint8_t* out, size_t cap, size_t& produced) override {
        produced = 0;
        if (!initialized_) return ReadStatus::Error;

        while (produced == 0) {
            if (finished_) return ReadStatus::End;

            if (strm_.avail_in == 0) {
                if (!refill(file_)) {
                    if (file_.bad()) {
                        error_ = "failed to read archive";
                        return ReadStatus::Error;
                    }
                    if (member_started_) {
                        error_ = "gzip stream truncated";
                        return ReadStatus::Error;
                    }
                    finished_ = true;
                    return ReadStatus::End;
                }
                strm_.next_in = in_.data();
                strm_.avail_in = static_cast<uInt>(in_len_);
            }

            member_started_ = true;
            strm_.next_out = out;
            strm_.avail_out = static_cast<uInt>(cap);

            int ret = inflate(&strm_, Z_NO_FLUSH);
            produced = cap - strm_.avail_out;

            if (ret == Z_STREAM_END) {
                member_started_ = false;
                if (inflateReset(&strm_) != Z_OK) {
                    error_ = "failed to reset gzip decoder";
                    return ReadStatus::Error;
                }
            } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
                error_ = std::string("corrupt gzip data: ") + (strm_.msg ? strm_.msg : "inflate failed");
                return ReadStatus::Error;
            }
        }
        return ReadStatus::Data;
    }

private:
    std::ifstream& file_;
    z_stream strm_;
    bool initialized_ = false;
    bool member_started_ = false;
    bool finished_ = false;
};

const char* lzma_ret_to_string(lzma_ret ret) {
    switch (ret) {
        case LZMA_MEM_ERROR: return "out of memory";
        case LZMA_MEMLIMIT_ERROR: return "memory limit reached";
        case LZMA_FORMAT_ERROR: return "not an xz stream";
        case LZMA_OPTIONS_ERROR: return "unsupported xz options";
        case LZMA_DATA_ERROR: return "data is corrupt";
        case LZMA_BUF_ERROR: return "unexpected end of input";
        default: return "decoder error";
    }
}

class XzDecompressor : public Decompressor {
public:
    explicit XzDecompressor(std::ifstream& file) : file_(file) {
        lzma_ret ret = lzma_stream_decoder(&strm_, UINT64_MAX, LZMA_CONCATENATED);
        if (ret == LZMA_OK) {
            initialized_ = true;
        } else {
            error_ = std::string("failed to initialize xz decoder: ") + lzma_ret_to_string(ret);
        }
    }

    ~XzDecompressor() override {
        lzma_end(&strm_);
    }

    XzDecompressor(const XzDecompressor&) = delete;
    XzDecompressor& operator=(const XzDecompressor&) = delete;

    ReadStatus read(uint8_t* out, size_t cap, size_t& produced) override {
        produced = 0;
        if (!initialized_) return ReadStatus::Error;

        while (produced == 0) {
            if (finished_) return ReadStatus::End;

            lzma_action action = LZMA_RUN;
            if (strm_.avail_in == 0 && !eof_) {
                if (refill(file_)) {
                    strm_.next_in = in_.data();
                    strm_.avail_in = in_len_;
                } else {
                    if (file_.bad()) {
                        error_ = "failed to read archive";
                        return ReadStatus::Error;
                    }
                    eof_ = true;
                }
            }
            if (eof_) action = LZMA_FINISH;

            strm_.next_out = out;
            strm_.avail_out = cap;

            lzma_ret ret = lzma_code(&strm_, action);
            produced = cap - strm_.avail_out;

            if (ret == LZMA_STREAM_END) {
                finished_ = true;
                break;
            }
            if (ret != LZMA_OK) {
                error_ = std::string("corrupt xz data: ") + lzma_ret_to_string(ret);
                return ReadStatus::Error;
            }
        }
        return produced > 0 ? ReadStatus::Data : ReadStatus::End;
    }

private:
    std::ifstream& file_;
    lzma_stream strm_ = LZMA_STREAM_INIT;
    bool initialized_ = false;
    bool eof_ = false;
    bool finished_ = false;
};

// Exact-size reads over a decompressor
class TarStream {
public:
    explicit TarStream(Decompressor& source) : source_(source), buf_(INPUT_CHUNK_SIZE) {}

    // Fills exactly n bytes. `clean_end` is set when the stream ended before
    // the first byte was read.
    bool read_exact(uint8_t* out, size_t n, bool& clean_end) {
        clean_end = false;
        size_t done = 0;
        while (done < n) {
            if (pos_ == len_) {
                ReadStatus status = source_.read(buf_.data(), buf_.size(), len_);
                pos_ = 0;
                if (status == ReadStatus::Error) {
                    error_ = source_.error();
                    return false;
                }
                if (status == ReadStatus::End) {
                    if (done == 0) {
                        clean_end = true;
                    } else {
                        error_ = "unexpected end of archive";
                    }
                    return false;
                }
            }
            size_t take = std::min(n - done, len_ - pos_);
            std::memcpy(out + done, buf_.data() + pos_, take);
            pos_ += take;
            done += take;
        }
        return true;
    }

    // Hand `n` bytes to `sink` in chunks
    template <typename Sink>
    bool consume(uint64_t n, Sink&& sink) {
        while (n > 0) {
            if (pos_ == len_) {
                ReadStatus status = source_.read(buf_.data(), buf_.size(), len_);
                pos_ = 0;
                if (status != ReadStatus::Data) {
                    error_ = status == ReadStatus::Error ? source_.error()
                                                         : "unexpected end of archive";
                    return false;
                }
            }
            size_t take = static_cast<size_t>(std::min<uint64_t>(n, len_ - pos_));
            if (!sink(buf_.data() + pos_, take)) return false;
            pos_ += take;
            n -= take;
        }
        return true;
    }

    bool skip(uint64_t n) {
        return consume(n, [](const uint8_t*, size_t) { return true; });
    }

    const std::string& error() const { return error_; }

private:
    Decompressor& source_;
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
    size_t len_ = 0;
    std::string error_;
};

// ============================================================================
// Header Helpers
// ============================================================================

uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

// GNU base-256 encoding for sizes beyond the octal field range
uint64_t parse_numeric(const char* data, size_t size) {
    if (static_cast<unsigned char>(data[0]) & 0x80) {
        uint64_t result = static_cast<unsigned char>(data[0]) & 0x7f;
        for (size_t i = 1; i < size; ++i) {
            result = (result << 8) | static_cast<unsigned char>(data[i]);
        }
        return result;
    }
    return parse_octal(data, size);
}

bool checksum_matches(const TarHeader& header) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&header);
    uint32_t sum = 0;
    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        // Checksum field is treated as spaces during calculation
        if (i >= 148 && i < 156) {
            sum += ' ';
        } else {
            sum += bytes[i];
        }
    }
    return sum == parse_octal(header.chksum, TAR_CHKSUM_SIZE);
}

bool is_zero_block(const uint8_t* block) {
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

std::string field_string(const char* data, size_t size) {
    return std::string(data, strnlen(data, size));
}

uint64_t padding_for(uint64_t size) {
    return (TAR_BLOCK_SIZE - (size % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE;
}

// Parse "<len> key=value\n" pax records for path and linkpath
void parse_pax_records(const std::string& data, std::string& path, std::string& linkpath) {
    size_t pos = 0;
    while (pos < data.size()) {
        size_t space = data.find(' ', pos);
        if (space == std::string::npos) return;

        size_t len = 0;
        for (size_t i = pos; i < space; ++i) {
            if (data[i] < '0' || data[i] > '9') return;
            len = len * 10 + static_cast<size_t>(data[i] - '0');
        }
        if (len == 0 || pos + len > data.size()) return;

        std::string record = data.substr(space + 1, pos + len - space - 1);
        if (!record.empty() && record.back() == '\n') record.pop_back();

        auto eq = record.find('=');
        if (eq != std::string::npos) {
            std::string key = record.substr(0, eq);
            if (key == "path") {
                path = record.substr(eq + 1);
            } else if (key == "linkpath") {
                linkpath = record.substr(eq + 1);
            }
        }
        pos += len;
    }
}

// Strip "./" and trailing slashes; reject absolute and escaping paths
bool normalize_entry_path(const std::string& raw, std::string& out, std::string& error) {
    if (!raw.empty() && raw[0] == '/') {
        error = "absolute path not allowed: " + raw;
        return false;
    }

    fs::path normalized;
    for (const auto& component : fs::path(raw)) {
        std::string comp = component.string();
        if (comp == "..") {
            error = "path traversal not allowed: " + raw;
            return false;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    out = normalized.string();
    return true;
}

// A parent that is a symlink would let later entries write outside target
bool parent_is_symlink(const fs::path& root, const std::string& rel) {
    fs::path current = root;
    fs::path parent = fs::path(rel).parent_path();
    for (const auto& component : parent) {
        current /= component;
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(current, ec))) {
            return true;
        }
    }
    return false;
}

void remove_existing(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (!ec && status.type() != fs::file_type::not_found &&
        status.type() != fs::file_type::directory) {
        fs::remove(path, ec);
    }
}

struct DeferredMode {
    fs::path path;
    fs::perms perms;
};

} // namespace

// ============================================================================
// Public API
// ============================================================================

FormatDetectResult detect_archive_format(const std::string& archive_path) {
    FormatDetectResult result;
    std::string name = get_filename(archive_path);

    if (ends_with(name, ".tar.gz") || ends_with(name, ".tgz")) {
        result.format = ArchiveFormat::TarGz;
    } else if (ends_with(name, ".tar.xz") || ends_with(name, ".txz")) {
        result.format = ArchiveFormat::TarXz;
    } else {
        result.kind = ErrorKind::UnsupportedArchiveFormat;
        result.error = "unsupported archive format: " + name;
        return result;
    }

    result.ok = true;
    return result;
}

ExtractResult extract_archive(const std::string& archive_path,
                              const std::string& target_dir,
                              ArchiveFormat format) {
    ExtractResult result;

    auto fail = [&result](ErrorKind kind, const std::string& error) {
        result.ok = false;
        result.kind = kind;
        result.error = error;
        return result;
    };

    std::ifstream file(archive_path, std::ios::binary);
    if (!file) {
        return fail(ErrorKind::Io, "failed to open archive: " + archive_path);
    }

    if (!create_directories(target_dir)) {
        return fail(ErrorKind::Io, "failed to create directory: " + target_dir);
    }

    std::unique_ptr<Decompressor> source;
    if (format == ArchiveFormat::TarGz) {
        source = std::make_unique<GzipDecompressor>(file);
    } else {
        source = std::make_unique<XzDecompressor>(file);
    }
    if (!source->error().empty()) {
        return fail(ErrorKind::Io, source->error());
    }

    spdlog::debug("extracting {} ({}) into {}", archive_path,
                  archive_format_to_string(format), target_dir);

    const fs::path root(target_dir);
    TarStream stream(*source);
    std::vector<DeferredMode> dir_modes;

    std::string long_name;
    std::string long_link;
    std::string pax_path;
    std::string pax_linkpath;

    while (true) {
        TarHeader header;
        bool clean_end = false;
        if (!stream.read_exact(reinterpret_cast<uint8_t*>(&header), TAR_BLOCK_SIZE, clean_end)) {
            if (clean_end) break;
            return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
        }

        if (is_zero_block(reinterpret_cast<const uint8_t*>(&header))) {
            break;
        }

        if (!checksum_matches(header)) {
            return fail(ErrorKind::Io, "corrupt tar header in " + archive_path);
        }

        uint64_t size = parse_numeric(header.size, TAR_SIZE_SIZE);
        uint64_t padded = size + padding_for(size);
        char typeflag = header.typeflag;

        // Metadata entries describe the next header
        if (typeflag == TAR_GNU_LONGNAME || typeflag == TAR_GNU_LONGLINK ||
            typeflag == TAR_PAX_HEADER) {
            if (size > TAR_MAX_META_SIZE) {
                return fail(ErrorKind::Io, "oversized tar extension header in " + archive_path);
            }
            std::string data;
            data.reserve(static_cast<size_t>(size));
            bool read_ok = stream.consume(size, [&data](const uint8_t* p, size_t n) {
                data.append(reinterpret_cast<const char*>(p), n);
                return true;
            });
            if (!read_ok || !stream.skip(padding_for(size))) {
                return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
            }

            if (typeflag == TAR_GNU_LONGNAME) {
                long_name = data.substr(0, strnlen(data.c_str(), data.size()));
            } else if (typeflag == TAR_GNU_LONGLINK) {
                long_link = data.substr(0, strnlen(data.c_str(), data.size()));
            } else {
                parse_pax_records(data, pax_path, pax_linkpath);
            }
            continue;
        }

        if (typeflag == TAR_PAX_GLOBAL) {
            if (!stream.skip(padded)) {
                return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
            }
            continue;
        }

        std::string raw_path;
        if (!pax_path.empty()) {
            raw_path = pax_path;
        } else if (!long_name.empty()) {
            raw_path = long_name;
        } else {
            // Old GNU headers reuse the prefix area, so only POSIX ustar has one
            if (header.prefix[0] != '\0' && std::memcmp(header.magic, "ustar", 6) == 0) {
                raw_path = field_string(header.prefix, TAR_PREFIX_SIZE) + "/";
            }
            raw_path += field_string(header.name, TAR_NAME_SIZE);
        }

        std::string link_target;
        if (!pax_linkpath.empty()) {
            link_target = pax_linkpath;
        } else if (!long_link.empty()) {
            link_target = long_link;
        } else {
            link_target = field_string(header.linkname, TAR_LINKNAME_SIZE);
        }

        long_name.clear();
        long_link.clear();
        pax_path.clear();
        pax_linkpath.clear();

        std::string rel;
        std::string path_error;
        if (!normalize_entry_path(raw_path, rel, path_error)) {
            return fail(ErrorKind::Io, path_error);
        }

        if (rel.empty()) {
            // The archive root itself ("./")
            if (!stream.skip(padded)) {
                return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
            }
            continue;
        }

        if (parent_is_symlink(root, rel)) {
            return fail(ErrorKind::Io, "entry path traverses a symlink: " + rel);
        }

        fs::path full_path = root / rel;
        fs::perms mode = static_cast<fs::perms>(parse_octal(header.mode, TAR_MODE_SIZE) & 07777);
        std::error_code ec;

        switch (typeflag) {
            case TAR_DIRTYPE: {
                if (!create_directories(full_path.string())) {
                    return fail(ErrorKind::Io, "failed to create directory: " + rel);
                }
                // Applied last so read-only directories can still be filled
                dir_modes.push_back({full_path, mode});
                if (!stream.skip(padded)) {
                    return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
                }
                break;
            }

            case TAR_REGTYPE:
            case TAR_AREGTYPE:
            case TAR_CONTTYPE: {
                if (!create_directories(full_path.parent_path().string())) {
                    return fail(ErrorKind::Io, "failed to create parent directory for: " + rel);
                }
                remove_existing(full_path);

                std::ofstream out(full_path, std::ios::binary | std::ios::trunc);
                if (!out) {
                    return fail(ErrorKind::Io, "failed to create file: " + rel);
                }
                bool write_failed = false;
                bool read_ok = stream.consume(size, [&out, &write_failed](const uint8_t* p, size_t n) {
                    out.write(reinterpret_cast<const char*>(p), static_cast<std::streamsize>(n));
                    if (!out) {
                        write_failed = true;
                        return false;
                    }
                    return true;
                });
                out.close();
                if (write_failed || !out) {
                    return fail(ErrorKind::Io, "failed to write file: " + rel);
                }
                if (!read_ok || !stream.skip(padding_for(size))) {
                    return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
                }

                fs::permissions(full_path, mode, ec);
                if (ec) {
                    spdlog::debug("failed to set mode on {}: {}", rel, ec.message());
                }
                break;
            }

            case TAR_SYMTYPE: {
                if (!create_directories(full_path.parent_path().string())) {
                    return fail(ErrorKind::Io, "failed to create parent directory for: " + rel);
                }
                remove_existing(full_path);
                fs::create_symlink(link_target, full_path, ec);
                if (ec) {
                    return fail(ErrorKind::Io, "failed to create symlink " + rel + ": " + ec.message());
                }
                if (!stream.skip(padded)) {
                    return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
                }
                break;
            }

            case TAR_LNKTYPE: {
                std::string link_rel;
                if (!normalize_entry_path(link_target, link_rel, path_error) || link_rel.empty()) {
                    return fail(ErrorKind::Io, "invalid hard link target for " + rel + ": " + link_target);
                }
                if (parent_is_symlink(root, link_rel) ||
                    fs::is_symlink(fs::symlink_status(root / link_rel, ec))) {
                    return fail(ErrorKind::Io, "hard link target traverses a symlink: " + rel +
                                                   " -> " + link_target);
                }
                if (!create_directories(full_path.parent_path().string())) {
                    return fail(ErrorKind::Io, "failed to create parent directory for: " + rel);
                }
                remove_existing(full_path);
                fs::create_hard_link(root / link_rel, full_path, ec);
                if (ec) {
                    return fail(ErrorKind::Io, "failed to create hard link " + rel + ": " + ec.message());
                }
                if (!stream.skip(padded)) {
                    return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
                }
                break;
            }

            case TAR_CHRTYPE:
            case TAR_BLKTYPE:
            case TAR_FIFOTYPE:
                spdlog::debug("skipping special file {}", rel);
                if (!stream.skip(padded)) {
                    return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
                }
                continue;

            default:
                spdlog::debug("skipping unsupported tar entry type '{}' for {}", typeflag, rel);
                if (!stream.skip(padded)) {
                    return fail(ErrorKind::Io, stream.error() + ": " + archive_path);
                }
                continue;
        }

        ++result.entries;
    }

    // Deepest directories first
    for (auto it = dir_modes.rbegin(); it != dir_modes.rend(); ++it) {
        std::error_code ec;
        fs::permissions(it->path, it->perms, ec);
        if (ec) {
            spdlog::debug("failed to set mode on {}: {}", it->path.string(), ec.message());
        }
    }

    spdlog::info("extracted {} entries into {}", result.entries, target_dir);
    result.ok = true;
    return result;
}

} // namespace rootcache
