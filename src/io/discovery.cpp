// ==============================================================================
// discovery.cpp - File Discovery
// ==============================================================================

#include "logveil/discovery.hpp"

#include "logveil/platform.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace logveil::io {

namespace fs = std::filesystem;

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Проверяет, соответствует ли файл набору расширений
bool matches_extensions(const fs::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions) {
    if (!extensions.has_value()) {
        return true;
    }
    if (!file_path.has_extension()) {
        return false;
    }

    std::string ext = file_path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return extensions->count(ext) > 0;
}

/// Ошибка обхода: предупреждение при skip_errors, иначе исключение
void fail(const DiscoveryOptions& opt, const std::string& message) {
    if (!opt.skip_errors) {
        throw std::runtime_error(message);
    }
    if (opt.on_warning) {
        opt.on_warning(message);
    } else {
        std::cerr << "[!] " << message << "\n";
    }
}

/// Рекурсивно обходит директорию и собирает файлы (depth-first)
void collect_files_recursive(const fs::path& path, const DiscoveryOptions& opt,
                             std::vector<fs::path>& result) {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        fail(opt, "failed to check path existence - " + ec.message());
        return;
    }
    if (!exists) {
        fail(opt, "specified path does not exist - " + platform::path_to_utf8(path));
        return;
    }

    fs::file_status status = fs::status(path, ec);
    if (ec) {
        fail(opt, "failed to get metadata for file - " + ec.message());
        return;
    }

    if (fs::is_directory(status)) {
        fs::directory_iterator it(path, ec);
        if (ec) {
            fail(opt, "failed to read directory - " + ec.message());
            return;
        }
        const fs::directory_iterator end{};
        for (; !ec && it != end; it.increment(ec)) {
            collect_files_recursive(it->path(), opt, result);
        }
        if (ec) {
            fail(opt, "failed to enter directory - " + ec.message());
        }
    } else if (fs::is_regular_file(status)) {
        if (matches_extensions(path, opt.extensions)) {
            result.push_back(path);
        }
    }
    // Сокеты, устройства и прочие специальные файлы пропускаются
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::vector<fs::path> discover_files(const std::vector<fs::path>& inputs,
                                     const DiscoveryOptions& opt) {
    std::vector<fs::path> result;
    for (const auto& input : inputs) {
        collect_files_recursive(input, opt, result);
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::string normalize_extension(const std::string& ext) {
    if (!ext.empty() && ext[0] == '.') {
        return ext.substr(1);
    }
    return ext;
}

}  // namespace logveil::io
