#include "store/atomic_file.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "utils/log.hpp"

namespace sprintgate::store {
namespace {

bool sync_path(const std::filesystem::path& path, int flags) {
    const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    const bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

}

bool write_file_atomic(const std::filesystem::path& path,
                       const std::string& payload,
                       std::ostream& error_sink) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error_sink << "[AtomicFile] Failed to create parent directory for '" << path.string() << "': " << ec.message() << "\n";
            return false;
        }
    }

    const std::filesystem::path tmp_full = path.string() + ".tmp";

    std::filesystem::perms target_perms = std::filesystem::perms::unknown;
    const bool target_exists = std::filesystem::exists(path, ec);
    if (!ec && target_exists) {
        target_perms = std::filesystem::status(path, ec).permissions();
    }
    ec.clear();

    {
        std::ofstream out(tmp_full, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error_sink << "[AtomicFile] Failed to open temp file '" << tmp_full.string() << "' for writing\n";
            return false;
        }
        out << payload;
        out.flush();
        if (!out.good()) {
            error_sink << "[AtomicFile] Stream error while writing temp '" << tmp_full.string() << "'\n";
            out.close();
            std::filesystem::remove(tmp_full, ec);
            return false;
        }
    }

    if (!sync_path(tmp_full, O_RDONLY)) {
        error_sink << "[AtomicFile] fsync('" << tmp_full.string() << "') failed\n";
        std::filesystem::remove(tmp_full, ec);
        return false;
    }

    if (target_perms != std::filesystem::perms::unknown) {
        std::filesystem::permissions(tmp_full, target_perms, ec);
        ec.clear();
    }

    std::filesystem::rename(tmp_full, path, ec);
    if (ec) {
        error_sink << "[AtomicFile] rename('" << tmp_full.string() << "' -> '" << path.string() << "') failed: " << ec.message() << "\n";
        std::filesystem::remove(tmp_full, ec);
        return false;
    }

    // The rename already happened; a failed directory sync only weakens crash durability.
    if (!parent.empty() && !sync_path(parent, O_RDONLY | O_DIRECTORY)) {
        log::warn("[AtomicFile] fsync of directory '" + parent.string() + "' failed after replacing '" + path.string() + "'");
    }
    return true;
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}
