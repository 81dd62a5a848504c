#include "lanshare/codec/zip_writer.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <sys/stat.h>

namespace lanshare::codec {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralSignature = 0x06054b50;
constexpr uint32_t kZip64EndSignature = 0x06064b50;
constexpr uint32_t kZip64LocatorSignature = 0x07064b50;

constexpr uint16_t kFlagUtf8 = 0x0800;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflate = 8;
constexpr uint16_t kVersionDefault = 20;
constexpr uint16_t kVersionZip64 = 45;
constexpr uint16_t kMadeByUnix = 3 << 8;
constexpr uint16_t kZip64ExtraId = 0x0001;

constexpr uint32_t kMax32 = 0xFFFFFFFFu;
constexpr uint16_t kMax16 = 0xFFFFu;

void put16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void put64(std::string& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

// MS-DOS date/time in local time, clamped to the format's 1980 epoch
void to_dos_time(std::time_t t, uint16_t& dos_time, uint16_t& dos_date) {
    std::tm tm{};
    if (t <= 0) {
        t = std::time(nullptr);
    }
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    if (tm.tm_year < 80) {
        dos_time = 0;
        dos_date = (1 << 5) | 1;
        return;
    }
    dos_time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dos_date = static_cast<uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

// Bit 11 may only be set when the name really is UTF-8
bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates, beyond U+10FFFF
        static const uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[extra] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace

ZipWriter::ZipWriter(Key, fs::path path, int level, size_t chunk_size)
    : path_(std::move(path))
    , level_(level)
    , chunk_size_(chunk_size) {
}

ZipWriter::~ZipWriter() {
    if (out_.is_open()) {
        out_.close();
    }
}

Result<std::unique_ptr<ZipWriter>> ZipWriter::create(const fs::path& path, int level, size_t chunk_size) {
    if (level < 0 || level > 9) {
        level = 6;
    }
    auto writer = std::make_unique<ZipWriter>(Key{}, path, level, chunk_size == 0 ? 64 * 1024 : chunk_size);
    writer->out_.open(path, std::ios::binary | std::ios::in | std::ios::out | std::ios::trunc);
    if (!writer->out_) {
        return Err<std::unique_ptr<ZipWriter>>("Cannot create archive " + path.string());
    }
    return Ok(std::move(writer));
}

Result<void> ZipWriter::write_bytes(const std::string& bytes) {
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out_) {
        return Err<void>("Write to " + path_.string() + " failed");
    }
    offset_ += bytes.size();
    return Ok();
}

void ZipWriter::rollback(uint64_t offset) {
    out_.clear();
    out_.seekp(static_cast<std::streamoff>(offset));
    offset_ = offset;
}

Result<void> ZipWriter::write_local_header(const Entry& entry) {
    std::string header;
    put32(header, kLocalHeaderSignature);
    put16(header, entry.zip64 ? kVersionZip64 : kVersionDefault);
    put16(header, entry.flags);
    put16(header, entry.method);
    put16(header, entry.dos_time);
    put16(header, entry.dos_date);
    put32(header, 0);   // crc, patched
    put32(header, entry.zip64 ? kMax32 : 0);
    put32(header, entry.zip64 ? kMax32 : 0);
    put16(header, static_cast<uint16_t>(entry.name.size()));
    put16(header, entry.zip64 ? 20 : 0);
    header += entry.name;
    if (entry.zip64) {
        put16(header, kZip64ExtraId);
        put16(header, 16);
        put64(header, 0);
        put64(header, 0);
    }
    return write_bytes(header);
}

Result<void> ZipWriter::patch_local_header(const Entry& entry) {
    const uint64_t resume_at = offset_;

    std::string crc_and_sizes;
    put32(crc_and_sizes, entry.crc);
    if (!entry.zip64) {
        put32(crc_and_sizes, static_cast<uint32_t>(entry.compressed_size));
        put32(crc_and_sizes, static_cast<uint32_t>(entry.uncompressed_size));
    }
    out_.seekp(static_cast<std::streamoff>(entry.local_offset + 14));
    out_.write(crc_and_sizes.data(), static_cast<std::streamsize>(crc_and_sizes.size()));

    if (entry.zip64) {
        std::string sizes;
        put64(sizes, entry.uncompressed_size);
        put64(sizes, entry.compressed_size);
        out_.seekp(static_cast<std::streamoff>(entry.local_offset + 30 + entry.name.size() + 4));
        out_.write(sizes.data(), static_cast<std::streamsize>(sizes.size()));
    }

    out_.seekp(static_cast<std::streamoff>(resume_at));
    if (!out_) {
        return Err<void>("Patching entry header in " + path_.string() + " failed");
    }
    return Ok();
}

Result<void> ZipWriter::add_directory(const std::string& name, std::time_t modified) {
    if (finished_) {
        return Err<void>(std::string("Archive already finished"));
    }

    Entry entry;
    entry.name = name;
    entry.flags = is_valid_utf8(entry.name) ? kFlagUtf8 : 0;
    if (entry.name.empty() || entry.name.back() != '/') {
        entry.name += '/';
    }
    entry.method = kMethodStored;
    entry.local_offset = offset_;
    entry.external_attributes = (static_cast<uint32_t>(S_IFDIR | 0755) << 16) | 0x10;
    to_dos_time(modified, entry.dos_time, entry.dos_date);

    auto written = write_local_header(entry);
    if (written.is_error()) {
        rollback(entry.local_offset);
        return written;
    }
    entries_.push_back(std::move(entry));
    return Ok();
}

Result<void> ZipWriter::add_file(const std::string& name, const fs::path& source) {
    if (finished_) {
        return Err<void>(std::string("Archive already finished"));
    }

    std::error_code ec;
    const uint64_t size = fs::file_size(source, ec);
    if (ec) {
        return Err<void>("Cannot stat " + source.string() + ": " + ec.message());
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return Err<void>("Cannot open " + source.string());
    }

    Entry entry;
    entry.name = name;
    entry.flags = is_valid_utf8(entry.name) ? kFlagUtf8 : 0;
    entry.method = kMethodDeflate;
    entry.local_offset = offset_;
    entry.zip64 = size >= kZip64EntryThreshold;
    entry.external_attributes = static_cast<uint32_t>(S_IFREG | 0644) << 16;

    struct stat st{};
    to_dos_time(::stat(source.c_str(), &st) == 0 ? st.st_mtime : 0, entry.dos_time, entry.dos_date);

    auto header = write_local_header(entry);
    if (header.is_error()) {
        rollback(entry.local_offset);
        return header;
    }

    z_stream stream{};
    if (deflateInit2(&stream, level_, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        rollback(entry.local_offset);
        return Err<void>(std::string("deflateInit2 failed"));
    }

    std::vector<char> input(chunk_size_);
    std::vector<char> output(chunk_size_ + 1024);
    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t total_in = 0;
    uint64_t total_out = 0;
    std::string failure;

    bool done = false;
    while (!done) {
        in.read(input.data(), static_cast<std::streamsize>(input.size()));
        const auto got = static_cast<size_t>(in.gcount());
        if (in.bad()) {
            failure = "Read error in " + source.string();
            break;
        }
        const bool last = in.eof();

        crc = crc32(crc, reinterpret_cast<const Bytef*>(input.data()), static_cast<uInt>(got));
        total_in += got;

        stream.next_in = reinterpret_cast<Bytef*>(input.data());
        stream.avail_in = static_cast<uInt>(got);
        const int flush = last ? Z_FINISH : Z_NO_FLUSH;

        do {
            stream.next_out = reinterpret_cast<Bytef*>(output.data());
            stream.avail_out = static_cast<uInt>(output.size());
            int rc = deflate(&stream, flush);
            if (rc == Z_STREAM_ERROR) {
                failure = "deflate failed for " + source.string();
                break;
            }
            const size_t produced = output.size() - stream.avail_out;
            out_.write(output.data(), static_cast<std::streamsize>(produced));
            if (!out_) {
                failure = "Write to " + path_.string() + " failed";
                break;
            }
            total_out += produced;
            offset_ += produced;
            if (rc == Z_STREAM_END) {
                done = true;
            }
        } while (stream.avail_out == 0 && failure.empty());

        if (!failure.empty()) {
            break;
        }
    }
    deflateEnd(&stream);

    if (failure.empty() && total_in != size) {
        failure = source.string() + " changed size while archiving";
    }
    if (failure.empty() && !entry.zip64 && total_out >= kMax32) {
        failure = source.string() + " compressed beyond 4 GiB without ZIP64 fields";
    }

    if (!failure.empty()) {
        rollback(entry.local_offset);
        return Err<void>(failure);
    }

    entry.crc = static_cast<uint32_t>(crc);
    entry.compressed_size = total_out;
    entry.uncompressed_size = total_in;

    auto patched = patch_local_header(entry);
    if (patched.is_error()) {
        rollback(entry.local_offset);
        return patched;
    }

    entries_.push_back(std::move(entry));
    return Ok();
}

Result<void> ZipWriter::write_central_directory() {
    const uint64_t central_offset = offset_;

    for (const auto& entry : entries_) {
        const bool offset_overflow = entry.local_offset >= kMax32;
        std::string extra;
        if (entry.zip64 || offset_overflow) {
            std::string fields;
            if (entry.zip64) {
                put64(fields, entry.uncompressed_size);
                put64(fields, entry.compressed_size);
            }
            if (offset_overflow) {
                put64(fields, entry.local_offset);
            }
            put16(extra, kZip64ExtraId);
            put16(extra, static_cast<uint16_t>(fields.size()));
            extra += fields;
        }

        std::string record;
        put32(record, kCentralHeaderSignature);
        put16(record, kMadeByUnix | kVersionZip64);
        put16(record, (entry.zip64 || offset_overflow) ? kVersionZip64 : kVersionDefault);
        put16(record, entry.flags);
        put16(record, entry.method);
        put16(record, entry.dos_time);
        put16(record, entry.dos_date);
        put32(record, entry.crc);
        put32(record, entry.zip64 ? kMax32 : static_cast<uint32_t>(entry.compressed_size));
        put32(record, entry.zip64 ? kMax32 : static_cast<uint32_t>(entry.uncompressed_size));
        put16(record, static_cast<uint16_t>(entry.name.size()));
        put16(record, static_cast<uint16_t>(extra.size()));
        put16(record, 0);   // comment
        put16(record, 0);   // disk number start
        put16(record, 0);   // internal attributes
        put32(record, entry.external_attributes);
        put32(record, offset_overflow ? kMax32 : static_cast<uint32_t>(entry.local_offset));
        record += entry.name;
        record += extra;

        auto written = write_bytes(record);
        if (written.is_error()) {
            return written;
        }
    }

    const uint64_t central_size = offset_ - central_offset;
    const uint64_t count = entries_.size();
    const bool need_zip64 = count >= kMax16 || central_offset >= kMax32 || central_size >= kMax32;

    std::string tail;
    if (need_zip64) {
        const uint64_t zip64_end_offset = offset_;
        put32(tail, kZip64EndSignature);
        put64(tail, 44);                       // size of remaining record
        put16(tail, kMadeByUnix | kVersionZip64);
        put16(tail, kVersionZip64);
        put32(tail, 0);                        // this disk
        put32(tail, 0);                        // disk with central directory
        put64(tail, count);
        put64(tail, count);
        put64(tail, central_size);
        put64(tail, central_offset);

        put32(tail, kZip64LocatorSignature);
        put32(tail, 0);
        put64(tail, zip64_end_offset);
        put32(tail, 1);                        // total disks
    }

    put32(tail, kEndOfCentralSignature);
    put16(tail, 0);
    put16(tail, 0);
    put16(tail, need_zip64 ? kMax16 : static_cast<uint16_t>(count));
    put16(tail, need_zip64 ? kMax16 : static_cast<uint16_t>(count));
    put32(tail, need_zip64 ? kMax32 : static_cast<uint32_t>(central_size));
    put32(tail, need_zip64 ? kMax32 : static_cast<uint32_t>(central_offset));
    put16(tail, 0);                            // comment length

    return write_bytes(tail);
}

Result<void> ZipWriter::finish() {
    if (finished_) {
        return Ok();
    }

    auto written = write_central_directory();
    if (written.is_error()) {
        return written;
    }

    out_.flush();
    const bool ok = static_cast<bool>(out_);
    out_.close();
    finished_ = true;
    if (!ok) {
        return Err<void>("Flushing " + path_.string() + " failed");
    }

    // A failed final entry may have left bytes past the end of the directory
    std::error_code ec;
    if (fs::file_size(path_, ec) != offset_ && !ec) {
        fs::resize_file(path_, offset_, ec);
    }
    if (ec) {
        return Err<void>("Trimming " + path_.string() + " failed: " + ec.message());
    }

    spdlog::debug("Archive {} finished: {} entries, {} bytes", path_.string(), entries_.size(), offset_);
    return Ok();
}

} // namespace lanshare::codec
