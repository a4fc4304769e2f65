#include <tyck/file_key.hpp>
#include <tyck/path_match.hpp>

namespace tyck {

std::string FileKey::suffix() const {
    auto slash = path_.find_last_of("/\\");
    size_t base = (slash == std::string::npos) ? 0 : slash + 1;
    auto dot = path_.rfind('.');
    // A leading dot names a hidden file, not an extension
    if (dot == std::string::npos || dot <= base) return "";
    return path_.substr(dot);
}

std::string FileKey::normalized() const {
    return normalize_filename_dir_sep(path_);
}

const char* FileKey::kind_name(Kind k) {
    switch (k) {
        case Kind::LibFile:      return "lib";
        case Kind::SourceFile:   return "source";
        case Kind::JsonFile:     return "json";
        case Kind::ResourceFile: return "resource";
    }
    return "unknown";
}

} // namespace tyck
