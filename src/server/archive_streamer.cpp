#include "lanshare/server/archive_streamer.hpp"
#include "lanshare/codec/zip_writer.hpp"
#include "lanshare/core/file_stat.hpp"
#include "lanshare/index/directory_indexer.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <set>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace lanshare::server {

namespace fs = std::filesystem;
using network::HttpResponse;
using network::HttpStatus;

Result<std::shared_ptr<TempFile>> TempFile::create(const fs::path& directory, const std::string& prefix) {
    std::error_code ec;
    fs::path dir = directory.empty() ? fs::temp_directory_path(ec) : directory;
    if (ec) {
        return Err<std::shared_ptr<TempFile>>("No temporary directory: " + ec.message());
    }

#ifndef _WIN32
    std::string pattern = (dir / (prefix + "-XXXXXX")).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');
    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        return Err<std::shared_ptr<TempFile>>("Cannot create temporary file in " + dir.string());
    }
    ::close(fd);
    return Ok(std::make_shared<TempFile>(Key{}, fs::path(name.data())));
#else
    for (int attempt = 0; attempt < 100; ++attempt) {
        fs::path candidate = dir / (prefix + "-" + std::to_string(std::rand()) + ".tmp");
        if (!fs::exists(candidate, ec)) {
            std::ofstream touch(candidate, std::ios::binary);
            if (touch) {
                return Ok(std::make_shared<TempFile>(Key{}, candidate));
            }
        }
    }
    return Err<std::shared_ptr<TempFile>>("Cannot create temporary file in " + dir.string());
#endif
}

TempFile::~TempFile() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("Could not remove temporary file {}: {}", path_.string(), ec.message());
    }
}

ArchiveStreamer::ArchiveStreamer(fs::path root, ArchiveOptions options)
    : root_(std::move(root))
    , options_(std::move(options)) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = 2 * 1024 * 1024;
    }
}

std::string ArchiveStreamer::root_name() const {
    std::error_code ec;
    fs::path absolute = fs::absolute(root_, ec);
    fs::path normal = (ec ? root_ : absolute).lexically_normal();
    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }
    std::string name = normal.filename().string();
    return name.empty() ? "share" : name;
}

Result<std::shared_ptr<TempFile>> ArchiveStreamer::build(ArchiveReport* report) const {
    using Built = std::shared_ptr<TempFile>;

    auto root_info = stat_path(root_);
    if (!root_info || !root_info->is_directory) {
        return Err<Built>("Shared directory not found: " + root_.string());
    }

    auto temp = TempFile::create(options_.temp_directory, "lanshare-archive");
    if (temp.is_error()) {
        return Err<Built>(temp.error());
    }

    auto writer = codec::ZipWriter::create(temp.value()->path(), options_.compression_level, options_.chunk_size);
    if (writer.is_error()) {
        return Err<Built>(writer.error());
    }

    const std::string prefix = root_name() + "/";
    const index::WalkResult walk = index::walk_tree(root_);

    // A folder is written explicitly only when nothing below it is
    std::set<std::string> non_empty;
    for (const auto& entry : walk.entries) {
        for (auto slash = entry.path.find('/'); slash != std::string::npos;
             slash = entry.path.find('/', slash + 1)) {
            non_empty.insert(entry.path.substr(0, slash));
        }
    }

    ArchiveReport local;
    ArchiveReport& out = report ? *report : local;
    out.files_skipped += walk.skipped;

    for (const auto& entry : walk.entries) {
        if (entry.is_folder()) {
            if (non_empty.count(entry.path) > 0) {
                continue;
            }
            auto added = writer.value()->add_directory(prefix + entry.path,
                                                       static_cast<std::time_t>(entry.modified));
            if (added.is_error()) {
                return Err<Built>(added.error());
            }
            ++out.directories_added;
            continue;
        }

        auto added = writer.value()->add_file(prefix + entry.path, root_ / fs::path(entry.path));
        if (added.is_error()) {
            spdlog::warn("Skipping {} in archive: {}", entry.path, added.error());
            ++out.files_skipped;
            continue;
        }
        ++out.files_added;
    }

    auto finished = writer.value()->finish();
    if (finished.is_error()) {
        return Err<Built>(finished.error());
    }

    std::error_code ec;
    out.archive_size = fs::file_size(temp.value()->path(), ec);
    if (ec) {
        return Err<Built>("Cannot size archive: " + ec.message());
    }

    spdlog::info("Archive of {}: {} files, {} empty folders, {} skipped, {} bytes",
                 root_.string(), out.files_added, out.directories_added, out.files_skipped, out.archive_size);
    return Ok(temp.value());
}

Result<void> ArchiveStreamer::stream(const TempFile& archive, const network::ChunkSink& sink) const {
    std::ifstream input(archive.path(), std::ios::binary);
    if (!input) {
        return Err<void>("Cannot open archive " + archive.path().string());
    }

    std::vector<uint8_t> buffer(options_.chunk_size);
    while (true) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto got = static_cast<size_t>(input.gcount());
        if (got == 0) {
            break;
        }
        auto sent = sink(buffer.data(), got);
        if (sent.is_error()) {
            return sent;
        }
    }
    if (input.bad()) {
        return Err<void>("Read error in archive " + archive.path().string());
    }
    return Ok();
}

HttpResponse ArchiveStreamer::serve() const {
    ArchiveReport report;
    auto built = build(&report);
    if (built.is_error()) {
        spdlog::error("Archive build failed: {}", built.error());
        HttpResponse response(HttpStatus::INTERNAL_SERVER_ERROR);
        response.set_body("Archive could not be built");
        response.set_header("Content-Type", "text/plain; charset=utf-8");
        return response;
    }

    std::shared_ptr<TempFile> archive = built.value();
    HttpResponse response(HttpStatus::OK);
    response.set_header("Content-Type", "application/zip");
    response.set_header("Content-Disposition", "attachment; filename=\"" + root_name() + ".zip\"");

    ArchiveStreamer self = *this;
    response.set_body_writer(report.archive_size, [self, archive](const network::ChunkSink& sink) {
        return self.stream(*archive, sink);
    });
    return response;
}

} // namespace lanshare::server
