#include "FileSystemUtil.h"
#include "ImageFormat.h"
#include "utils/Logging.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace ImageConverter {

FileSystemUtil::SourceState FileSystemUtil::checkSource(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return SourceState::NotFound;
    }
    if (!fs::is_regular_file(path, ec)) {
        return SourceState::Unreadable;
    }
    std::ifstream stream(path, std::ios::binary);
    return stream.is_open() ? SourceState::Readable : SourceState::Unreadable;
}

bool FileSystemUtil::isWritableDirectory(const fs::path& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_directory(path, ec)) {
        return false;
    }
#ifdef _WIN32
    return ::_waccess(path.c_str(), 2) == 0;
#else
    return ::access(path.c_str(), W_OK | X_OK) == 0;
#endif
}

fs::path FileSystemUtil::resolvePath(const fs::path& path) {
    try {
        if (fs::exists(path)) {
            return fs::canonical(path);
        }
        return fs::absolute(path);
    } catch (const fs::filesystem_error& e) {
        qCWarning(lcConfig) << "resolvePath error:" << e.what();
        return path;
    }
}

std::vector<fs::path> FileSystemUtil::getImageFiles(const fs::path& directory, bool recursive) {
    std::vector<fs::path> files;
    fs::path dir = resolvePath(directory);

    try {
        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(dir)) {
                if (entry.is_regular_file() && ImageFormat::isImageExtension(entry.path().extension().string())) {
                    files.push_back(entry.path());
                }
            }
        } else {
            for (const auto& entry : fs::directory_iterator(dir)) {
                if (entry.is_regular_file() && ImageFormat::isImageExtension(entry.path().extension().string())) {
                    files.push_back(entry.path());
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        qCWarning(lcConfig) << "getImageFiles error:" << e.what();
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<fs::path> FileSystemUtil::expandInputs(const std::vector<fs::path>& inputs, bool recursive) {
    std::vector<fs::path> files;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (fs::is_directory(input, ec)) {
            auto found = getImageFiles(input, recursive);
            if (found.empty()) {
                qCWarning(lcConfig) << "No image files found in" << input.string().c_str();
            }
            files.insert(files.end(), found.begin(), found.end());
        } else {
            files.push_back(input);
        }
    }
    return files;
}

} // namespace ImageConverter
