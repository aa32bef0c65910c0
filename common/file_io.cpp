// ============================================================
// file_io.cpp -- Output path resolution and file writing
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <atomic>
#include <fstream>
#include <functional>
#include <system_error>
#include <thread>

namespace {

// True if p (normalised, absolute) is root_dir or below it
bool is_within(const fs::path& root_dir, const fs::path& p) {
    fs::path rel = p.lexically_relative(root_dir);
    if (rel.empty()) return false;
    auto first = rel.begin();
    return first == rel.end() || first->string() != "..";
}

std::atomic<u64> g_temp_counter{0};

} // namespace

fs::path file_io::prepare_output_root(const std::string& dir) {
    fs::path p(dir);
    fs::create_directories(p);
    return fs::weakly_canonical(fs::absolute(p));
}

fs::path file_io::resolve_output_path(const fs::path& root_dir, const std::string& name) {
    if (name.empty()) {
        throw UnsafePathError("Empty file name");
    }
    if (name.find('\0') != std::string::npos) {
        throw UnsafePathError("NUL byte in file name");
    }

    fs::path rel(name);
    if (rel.is_absolute() || rel.has_root_directory() || rel.has_root_name()) {
        throw UnsafePathError("Absolute path rejected: " + name);
    }

    fs::path full = (root_dir / rel).lexically_normal();
    if (full.filename().empty()) {
        // "dir/" or "dir/." names a directory, not a file
        throw UnsafePathError("Name does not denote a file: " + name);
    }
    if (!is_within(root_dir, full) || full == root_dir) {
        throw UnsafePathError("Path escapes output directory: " + name);
    }
    return full;
}

void file_io::ensure_parent_dirs(const fs::path& root_dir, const fs::path& target) {
    fs::path parent = target.parent_path();
    if (parent.empty()) return;
    fs::create_directories(parent);

    // A symlinked directory inside the output tree could point elsewhere
    fs::path real_parent = fs::canonical(parent);
    if (!is_within(root_dir, real_parent)) {
        throw UnsafePathError("Parent directory resolves outside output directory: " +
                              real_parent.string());
    }
}

void file_io::write_file_atomic(const fs::path& target, const std::vector<u8>& data) {
    fs::path tmp = target;
    tmp += ".part." + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000) +
           "." + std::to_string(g_temp_counter.fetch_add(1));

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot create " + tmp.string());
        }
        if (!data.empty()) {
            out.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
        }
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("Write failed: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw std::runtime_error("rename " + tmp.string() + " -> " + target.string() +
                                 " failed: " + ec.message());
    }
}

std::string file_io::wire_name(const std::string& path) {
    return fs::path(path).filename().string();
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}
