// ============================================================
// dir_scanner.cpp -- Recursive input collection
// ============================================================

#include "dir_scanner.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

DirScanner::DirScanner(std::vector<std::string> inputs)
    : inputs_(std::move(inputs)) {}

std::vector<FileEntry> DirScanner::scan() {
    std::vector<FileEntry> out;
    skipped_ = 0;

    for (const auto& input : inputs_) {
        std::error_code ec;
        fs::file_status st = fs::status(input, ec);
        if (ec || !fs::exists(st)) {
            LOG_WARN("[Client] Input not found, skipped: " + input);
            ++skipped_;
            continue;
        }
        if (fs::is_directory(st)) {
            scan_dir(input, out);
        } else if (fs::is_regular_file(st)) {
            FileEntry fe;
            fe.path      = input;
            fe.file_size = file_io::get_file_size(input);
            out.push_back(std::move(fe));
        } else {
            LOG_WARN("[Client] Not a regular file, skipped: " + input);
            ++skipped_;
        }
    }

    std::sort(out.begin(), out.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.path < b.path;
    });
    out.erase(std::unique(out.begin(), out.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.path == b.path;
    }), out.end());

    check_name_collisions(out);
    return out;
}

void DirScanner::check_name_collisions(const std::vector<FileEntry>& files) {
    name_collisions_ = 0;
    std::unordered_map<std::string, const std::string*> first_seen;
    for (const auto& f : files) {
        auto ins = first_seen.emplace(file_io::wire_name(f.path), &f.path);
        if (!ins.second) {
            ++name_collisions_;
            LOG_WARN("[Client] " + f.path + " and " + *ins.first->second +
                     " share the name " + ins.first->first +
                     "; the receiver keeps only one of them");
        }
    }
}

void DirScanner::scan_dir(const std::string& dir, std::vector<FileEntry>& out) {
    fs::path root(dir);
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARN("[Client] Cannot read directory " + dir + ": " + ec.message());
        ++skipped_;
        return;
    }

    // An increment that fails also leaves the iterator at end, so the
    // error is checked after each step rather than by the loop condition.
    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code fec;
        if (it->is_regular_file(fec)) {
            FileEntry fe;
            fe.path      = it->path().string();
            fe.file_size = file_io::get_file_size(fe.path);
            out.push_back(std::move(fe));
        }
        it.increment(ec);
        if (ec) {
            LOG_WARN("[Client] Error while scanning " + dir + ": " + ec.message());
            ++skipped_;
            break;
        }
    }
}
