#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace platform {

namespace {

struct WriterDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};
struct EntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};
using Writer = std::unique_ptr<struct archive, WriterDeleter>;
using Entry = std::unique_ptr<struct archive_entry, EntryDeleter>;

Result<void> archive_failure(struct archive* a, const std::string& what) {
    const char* msg = archive_error_string(a);
    return Result<void>::Err(what + ": " + (msg ? msg : "unknown libarchive error"));
}

} // namespace

Result<void> gzip_file(const fs::path& src, const fs::path& dest) {
    std::ifstream in(src, std::ios::binary);
    if (!in) return Result<void>::Err("cannot read " + src.string());

    std::error_code ec;
    auto size = fs::file_size(src, ec);
    if (ec) return Result<void>::Err("cannot stat " + src.string() + ": " + ec.message());

    Writer w(archive_write_new());
    if (!w) return Result<void>::Err("libarchive writer unavailable");
    archive_write_set_format_raw(w.get());
    archive_write_add_filter_gzip(w.get());
    if (archive_write_open_filename(w.get(), dest.c_str()) != ARCHIVE_OK) {
        return archive_failure(w.get(), "open " + dest.string());
    }

    Entry e(archive_entry_new());
    archive_entry_set_pathname(e.get(), src.filename().c_str());
    archive_entry_set_filetype(e.get(), AE_IFREG);
    archive_entry_set_perm(e.get(), 0644);
    archive_entry_set_size(e.get(), static_cast<la_int64_t>(size));
    if (archive_write_header(w.get(), e.get()) != ARCHIVE_OK) {
        return archive_failure(w.get(), "gzip header");
    }

    char buf[64 * 1024];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        if (archive_write_data(w.get(), buf, static_cast<size_t>(in.gcount())) < 0) {
            return archive_failure(w.get(), "gzip write");
        }
    }
    if (archive_write_close(w.get()) != ARCHIVE_OK) {
        return archive_failure(w.get(), "gzip close");
    }
    return Result<void>::Ok();
}

} // namespace platform
