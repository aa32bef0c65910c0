#pragma once

// ============================================================
// dir_scanner.hpp -- Input collection for the sender process
//   Expands the command-line inputs into the list of regular files
//   to send: files are taken as given, directories are walked
//   recursively.
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>

struct FileEntry {
    std::string path;       // path handed to the sender
    u64         file_size{0};
};

class DirScanner {
public:
    explicit DirScanner(std::vector<std::string> inputs);

    // Walk every input. Missing inputs and unreadable directory entries
    // are logged and skipped. The result is sorted by path and
    // free of duplicates.
    std::vector<FileEntry> scan();

    // Inputs that did not exist or could not be read
    size_t skipped() const { return skipped_; }

    // Files whose base name repeats an earlier one. The receiver keys
    // files by base name, so only the last of them survives there.
    size_t name_collisions() const { return name_collisions_; }

private:
    std::vector<std::string> inputs_;
    size_t                   skipped_{0};
    size_t                   name_collisions_{0};

    void check_name_collisions(const std::vector<FileEntry>& files);

    void scan_dir(const std::string& dir, std::vector<FileEntry>& out);
};
