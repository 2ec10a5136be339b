#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace platform {

static std::string archive_err(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

// Reject absolute paths and any ".." component ("zip slip")
static bool is_safe_entry_path(const fs::path& rel) {
    if (rel.empty() || rel.is_absolute() || rel.has_root_name()) return false;
    for (const auto& part : rel) {
        if (part == "..") return false;
    }
    return true;
}

std::vector<std::string> extract_zip(const fs::path& zip_path, const fs::path& dest_dir) {
    std::unique_ptr<struct archive, decltype(&archive_read_free)> a(archive_read_new(),
                                                                    &archive_read_free);
    if (!a) throw std::runtime_error("Failed to create archive reader");

    archive_read_support_format_zip(a.get());

    if (archive_read_open_filename(a.get(), zip_path.string().c_str(), 65536) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to open " + zip_path.filename().string() + ": "
                                 + archive_err(a.get()));
    }

    fs::create_directories(dest_dir);

    std::vector<std::string> written;
    struct archive_entry* entry = nullptr;
    int rc;
    while ((rc = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        const char* name = archive_entry_pathname(entry);
        if (!name) continue;

        fs::path rel = fs::path(name).lexically_normal();
        if (!is_safe_entry_path(rel)) {
            throw std::runtime_error(std::string("Refusing unsafe archive entry: ") + name);
        }

        fs::path out_path = dest_dir / rel;
        auto type = archive_entry_filetype(entry);

        if (type == AE_IFDIR) {
            fs::create_directories(out_path);
            continue;
        }
        if (type != AE_IFREG) {
            continue;  // links and specials are not part of templates
        }

        fs::create_directories(out_path.parent_path());
        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write " + out_path.string());
        }

        const void* buf;
        size_t size;
        la_int64_t offset;
        int data_rc;
        while ((data_rc = archive_read_data_block(a.get(), &buf, &size, &offset)) == ARCHIVE_OK) {
            out.write(static_cast<const char*>(buf), static_cast<std::streamsize>(size));
        }
        if (data_rc != ARCHIVE_EOF) {
            throw std::runtime_error("Corrupt archive entry " + rel.generic_string() + ": "
                                     + archive_err(a.get()));
        }
        out.close();

        // Preserve execute bits from the archive
        auto mode = archive_entry_perm(entry);
        if (mode & 0111) {
            fs::permissions(out_path, static_cast<fs::perms>(mode & 0777), fs::perm_options::replace);
        }

        written.push_back(rel.generic_string());
    }

    if (rc != ARCHIVE_EOF) {
        throw std::runtime_error(std::string("Failed reading archive: ") + archive_err(a.get()));
    }

    return written;
}

bool flatten_single_root(const fs::path& dir) {
    fs::path only;
    int count = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        only = e.path();
        if (++count > 1) return false;
    }
    if (count != 1 || !fs::is_directory(only)) return false;

    // Move into a sibling name first so a child named like the root can't collide
    fs::path staging = dir / (".flatten_" + only.filename().string());
    fs::rename(only, staging);
    std::vector<fs::path> children;
    for (const auto& e : fs::directory_iterator(staging)) {
        children.push_back(e.path());
    }
    for (const auto& child : children) {
        fs::rename(child, dir / child.filename());
    }
    fs::remove_all(staging);
    return true;
}

std::vector<std::string> merge_tree(const fs::path& src, const fs::path& dst) {
    std::vector<std::string> copied;
    fs::create_directories(dst);
    for (const auto& e : fs::recursive_directory_iterator(src)) {
        fs::path rel = fs::relative(e.path(), src);
        fs::path target = dst / rel;
        if (e.is_directory()) {
            fs::create_directories(target);
        } else if (e.is_regular_file()) {
            fs::create_directories(target.parent_path());
            fs::copy_file(e.path(), target, fs::copy_options::overwrite_existing);
            copied.push_back(rel.generic_string());
        }
    }
    return copied;
}

} // namespace platform
