#include "PathUtils.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace utils {
    bool FileExistsUtf8(const std::string &file) {
        if (file.empty())
            return false;
        std::error_code ec;
        return fs::exists(fs::u8path(file), ec);
    }

    bool DirectoryExistsUtf8(const std::string &dir) {
        if (dir.empty())
            return false;
        std::error_code ec;
        return fs::is_directory(fs::u8path(dir), ec);
    }

    bool CreateFileTreeUtf8(const std::string &path) {
        if (path.empty())
            return false;
        std::error_code ec;
        const fs::path tree = fs::u8path(path);
        if (fs::is_directory(tree, ec))
            return true;
        fs::create_directories(tree, ec);
        return !ec;
    }

    bool DeleteDirectoryUtf8(const std::string &path) {
        if (path.empty())
            return false;
        std::error_code ec;
        fs::remove_all(fs::u8path(path), ec);
        return !ec;
    }

    std::string GetDirectoryUtf8(const std::string &path) {
        if (path.empty())
            return "";
        return fs::u8path(path).parent_path().u8string();
    }

    std::string CombinePathUtf8(const std::string &path1, const std::string &path2) {
        if (path1.empty())
            return path2;
        if (path2.empty())
            return path1;
        return (fs::u8path(path1) / fs::u8path(path2)).u8string();
    }

    std::string ExpandUserUtf8(const std::string &path) {
        if (path.empty() || path[0] != '~')
            return path;
        if (path.size() > 1 && path[1] != '/')
            return path;

        const char *home = std::getenv("HOME");
        if (!home || !*home)
            return path;
        return std::string(home) + path.substr(1);
    }

    std::string GetTempPathUtf8() {
        std::error_code ec;
        fs::path temp = fs::temp_directory_path(ec);
        if (ec)
            return "";
        return temp.u8string();
    }

    bool ReadTextFileUtf8(const std::string &path, std::string &out) {
        std::ifstream file(fs::u8path(path), std::ios::binary);
        if (!file.is_open())
            return false;

        out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        return !file.bad();
    }

    std::string ResolveSymlinkUtf8(const std::string &path) {
        if (path.empty())
            return path;

        fs::path current = fs::u8path(path);
        std::error_code ec;
        // Dangling links resolve to the file they name so the write creates it
        for (int hops = 0; hops < 40 && fs::is_symlink(current, ec); ++hops) {
            fs::path next = fs::read_symlink(current, ec);
            if (ec)
                break;
            current = next.is_absolute() ? next : current.parent_path() / next;
        }
        return current.lexically_normal().u8string();
    }

    bool WriteTextFileUtf8(const std::string &path, const std::string &content) {
        const std::string resolved = ResolveSymlinkUtf8(path);
        const fs::path target = fs::u8path(resolved);
        std::string dir = GetDirectoryUtf8(resolved);
        if (!dir.empty() && !DirectoryExistsUtf8(dir)) {
            if (!CreateFileTreeUtf8(dir))
                return false;
        }

        fs::path tempPath = target;
        tempPath += ".tmp";

        std::error_code ec;
        {
            std::ofstream stream(tempPath, std::ios::binary | std::ios::trunc);
            if (!stream.is_open())
                return false;
            stream.write(content.data(), static_cast<std::streamsize>(content.size()));
            stream.flush();
            if (!stream.good()) {
                stream.close();
                fs::remove(tempPath, ec);
                return false;
            }
        }

        // Keep the mode of the file being replaced
        std::error_code statusEc;
        const fs::file_status existing = fs::status(target, statusEc);
        if (!statusEc && fs::is_regular_file(existing))
            fs::permissions(tempPath, existing.permissions(), fs::perm_options::replace, ec);

        if (!ec)
            fs::rename(tempPath, target, ec);
        if (ec) {
            std::error_code cleanup;
            fs::remove(tempPath, cleanup);
            return false;
        }
        return true;
    }
}
