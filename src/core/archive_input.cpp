#include "archive_input.h"

#include "cli_parse.h"
#include "image_io.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <system_error>
#include <utility>

#include <archive.h>
#include <archive_entry.h>

namespace gearpix::core {

namespace {

constexpr size_t k_archive_block_size = 10240;

fs::path make_extract_dir(const fs::path& archive) {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::error_code ec;
    fs::path root = fs::temp_directory_path(ec);
    if (ec || root.empty()) {
        root = fs::path(".");
    }
    return root / ("gearicon_extract_" + archive.stem().string() + "_" + std::to_string(stamp)
                   + "_" + std::to_string(counter.fetch_add(1)));
}

std::string archive_message(struct archive* a) {
    const char* message = archive_error_string(a);
    return message != nullptr ? message : "unknown libarchive error";
}

bool extract_all(const fs::path& archive_path, const fs::path& output_dir, PipelineError& error) {
    struct archive* a = archive_read_new();
    if (a == nullptr) {
        return fail(error, ErrorCode::Archive, "failed to create archive reader");
    }
    archive_read_support_format_all(a);
    archive_read_support_filter_all(a);

    if (archive_read_open_filename(a, archive_path.string().c_str(), k_archive_block_size) != ARCHIVE_OK) {
        const std::string reason = archive_message(a);
        archive_read_free(a);
        return fail(error, ErrorCode::Archive, "failed to open archive " + archive_path.string() + ": " + reason);
    }

    struct archive* ext = archive_write_disk_new();
    if (ext == nullptr) {
        archive_read_free(a);
        return fail(error, ErrorCode::Archive, "failed to create archive writer");
    }
    // Entries are rewritten to absolute paths below the output folder, so only
    // ".." components and symlink escapes need rejecting.
    archive_write_disk_set_options(ext, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_SECURE_NODOTDOT
                                            | ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    bool ok = true;
    struct archive_entry* entry = nullptr;
    while (ok) {
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_OK) {
            ok = fail(error, ErrorCode::Archive, "failed to read archive header: " + archive_message(a));
            break;
        }
        if (archive_entry_filetype(entry) == AE_IFDIR) {
            continue;
        }
        const char* filename = archive_entry_pathname(entry);
        if (filename == nullptr) {
            continue;
        }

        const fs::path output_path = output_dir / fs::path(filename).relative_path();
        std::error_code ec;
        fs::create_directories(output_path.parent_path(), ec);
        archive_entry_set_pathname(entry, output_path.string().c_str());

        r = archive_write_header(ext, entry);
        if (r < ARCHIVE_OK) {
            ok = fail(error, ErrorCode::Archive, "failed to write archive entry " + std::string(filename) + ": "
                                                    + archive_message(ext));
            break;
        }
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while ((r = archive_read_data_block(a, &buff, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(ext, buff, size, offset) < ARCHIVE_OK) {
                ok = fail(error, ErrorCode::Archive, "failed to write archive data: " + archive_message(ext));
                break;
            }
        }
        if (ok && r != ARCHIVE_EOF) {
            ok = fail(error, ErrorCode::Archive, "failed to read archive data: " + archive_message(a));
        }
        if (archive_write_finish_entry(ext) < ARCHIVE_OK && ok) {
            ok = fail(error, ErrorCode::Archive, "failed to finish archive entry: " + archive_message(ext));
        }
    }

    archive_read_close(a);
    archive_read_free(a);
    archive_write_close(ext);
    archive_write_free(ext);
    return ok;
}

} // namespace

void ExtractedArchive::cleanup() {
    if (working_folder.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(working_folder, ec);
    working_folder.clear();
    images.clear();
}

bool is_archive_path(const fs::path& path) {
    const std::string filename = to_lower_copy(path.filename().string());
    auto ends_with = [&filename](const std::string& suffix) {
        return filename.size() >= suffix.size()
               && filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(".tar") || ends_with(".tar.gz") || ends_with(".tgz")
           || ends_with(".tar.bz2") || ends_with(".tbz2")
           || ends_with(".tar.xz") || ends_with(".txz");
}

bool extract_archive_images(const fs::path& archive, ExtractedArchive& out, PipelineError& error) {
    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        return fail(error, ErrorCode::MissingResource, "archive not found: " + archive.string());
    }

    ExtractedArchive extracted;
    extracted.archive_path = archive;
    extracted.working_folder = make_extract_dir(archive);
    fs::create_directories(extracted.working_folder, ec);
    if (ec) {
        return fail(error, ErrorCode::Archive,
                    "failed to create temporary directory " + extracted.working_folder.string() + ": " + ec.message());
    }

    if (!extract_all(archive, extracted.working_folder, error)) {
        extracted.cleanup();
        return false;
    }

    for (fs::recursive_directory_iterator it(extracted.working_folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && is_supported_image_extension(it->path())) {
            extracted.images.push_back(it->path());
        }
    }
    if (ec) {
        const std::string reason = ec.message();
        extracted.cleanup();
        return fail(error, ErrorCode::Archive, "failed to list extracted files of " + archive.string() + ": " + reason);
    }
    std::ranges::sort(extracted.images);

    out = std::move(extracted);
    return true;
}

} // namespace gearpix::core
