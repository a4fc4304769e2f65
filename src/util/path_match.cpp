#include <tyck/path_match.hpp>
#include <algorithm>

namespace tyck {

// ---- Helpers ----

// Forward slashes only, no repeated '/', no trailing '/' (except for "/").
static std::string normalize_slashes(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::vector<std::string> split_on_slash(const std::string& s) {
    std::vector<std::string> segs;
    size_t start = 0;
    while (true) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) {
            segs.push_back(s.substr(start));
            break;
        }
        segs.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
    return segs;
}

// Match one segment (no '/') with '*' and '?' wildcards.
static bool segment_match(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];
        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (segment_match(pat, pi, str, k)) return true;
            }
            return false;
        }
        if (si == str.size()) return false;
        if (pc != '?' && pc != str[si]) return false;
        pi++;
        si++;
    }
    return si == str.size();
}

static bool segments_match(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); k++) {
                if (segments_match(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si == path.size()) return false;
        if (!segment_match(pat[pi], 0, path[si], 0)) return false;
        pi++;
        si++;
    }
    return si == path.size();
}

// ---- Public API ----

std::string normalize_filename_dir_sep(const std::string& path) {
#ifdef _WIN32
    std::string out(path);
    std::replace(out.begin(), out.end(), '/', '\\');
    return out;
#else
    return path;
#endif
}

bool has_any_prefix(const std::string& path, const std::vector<std::string>& prefixes) {
    return std::any_of(prefixes.begin(), prefixes.end(), [&](const std::string& prefix) {
        return path.compare(0, prefix.size(), prefix) == 0;
    });
}

std::string expand_project_root(const std::string& pattern, const std::string& root) {
    static const std::string token = "<PROJECT_ROOT>";
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t hit = pattern.find(token, pos);
        if (hit == std::string::npos) {
            out.append(pattern, pos, std::string::npos);
            break;
        }
        out.append(pattern, pos, hit - pos);
        out += root;
        pos = hit + token.size();
    }
    return out;
}

bool path_glob_match(const std::string& pattern, const std::string& path) {
    return segments_match(split_on_slash(normalize_slashes(pattern)), 0,
                          split_on_slash(normalize_slashes(path)), 0);
}

} // namespace tyck
