#include "import_resolver.hpp"
#include <system_error>

namespace {

bool isPathStyle(const std::string& module) {
    return module == "." || module == ".." ||
           module.compare(0, 2, "./") == 0 || module.compare(0, 3, "../") == 0;
}

// A lexically normalized relative path that starts with ".." escapes the root
bool escapesRoot(const fs::path& relativePath) {
    auto it = relativePath.begin();
    return it != relativePath.end() && *it == "..";
}

std::string toGeneric(const fs::path& path) {
    std::string result = path.lexically_normal().generic_string();
    if (result.compare(0, 2, "./") == 0) {
        result.erase(0, 2);
    }
    return result;
}

} // namespace

ImportResolver::ImportResolver(const fs::path& root)
    : root_(root) {
}

const std::vector<std::string>& ImportResolver::candidateExtensions() {
    static const std::vector<std::string> extensions = {
        ".py", ".ts", ".tsx", ".js", ".jsx", ".mjs"
    };
    return extensions;
}

const std::vector<std::string>& ImportResolver::indexFiles() {
    static const std::vector<std::string> files = {
        "__init__.py", "index.ts", "index.tsx", "index.js", "index.jsx"
    };
    return files;
}

std::optional<std::string> ImportResolver::resolve(const std::string& importingFile, const Import& import) const {
    if (!import.isRelative || import.module.empty()) {
        return std::nullopt;
    }

    const fs::path baseDir = fs::path(importingFile).parent_path();
    const bool pathStyle = isPathStyle(import.module);

    std::optional<fs::path> target = pathStyle
        ? pathTarget(baseDir, import.module)
        : dottedTarget(baseDir, import.module);
    if (!target) {
        return std::nullopt;
    }

    // "./util.js" may already name the file
    if (pathStyle && !target->empty() && isFile(*target)) {
        return toGeneric(*target);
    }

    if (!target->empty()) {
        for (const auto& extension : candidateExtensions()) {
            fs::path candidate = *target;
            candidate += extension;
            if (isFile(candidate)) {
                return toGeneric(candidate);
            }
        }
    }

    for (const auto& indexFile : indexFiles()) {
        fs::path candidate = *target / indexFile;
        if (isFile(candidate)) {
            return toGeneric(candidate);
        }
    }

    // Best effort: the primary extension of the import's own language
    fs::path fallback = *target;
    if (pathStyle) {
        if (fallback.empty()) {
            return std::nullopt;
        }
        fallback += fs::path(importingFile).extension();
    } else if (fallback.empty()) {
        fallback = "__init__.py";
    } else {
        fallback += ".py";
    }
    return toGeneric(fallback);
}

std::optional<fs::path> ImportResolver::dottedTarget(const fs::path& baseDir, const std::string& module) const {
    size_t dots = 0;
    while (dots < module.size() && module[dots] == '.') {
        ++dots;
    }

    fs::path target = baseDir;
    for (size_t i = 1; i < dots; ++i) {
        if (target.empty()) {
            return std::nullopt;
        }
        target = target.parent_path();
    }

    // Remaining dotted segments are nested directories
    const std::string rest = module.substr(dots);
    size_t start = 0;
    while (start < rest.size()) {
        size_t end = rest.find('.', start);
        if (end == std::string::npos) {
            end = rest.size();
        }
        if (end > start) {
            target /= rest.substr(start, end - start);
        }
        start = end + 1;
    }

    return target.lexically_normal();
}

std::optional<fs::path> ImportResolver::pathTarget(const fs::path& baseDir, const std::string& module) const {
    fs::path target = (baseDir / module).lexically_normal();

    std::string generic = target.generic_string();
    while (!generic.empty() && generic.back() == '/') {
        generic.pop_back();
    }
    if (generic == ".") {
        generic.clear();
    }

    target = fs::path(generic);
    if (escapesRoot(target)) {
        return std::nullopt;
    }
    return target;
}

bool ImportResolver::isFile(const fs::path& relativePath) const {
    std::error_code ec;
    return fs::is_regular_file(root_ / relativePath, ec);
}
