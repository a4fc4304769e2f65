#pragma once

#include <string>

namespace tyck {

// Identity of a file seen by the checker. Only the path participates in
// option decisions; the kind is carried so callers can round-trip it.
class FileKey {
public:
    enum class Kind { LibFile, SourceFile, JsonFile, ResourceFile };

    FileKey(Kind kind, std::string path)
        : kind_(kind), path_(std::move(path)) {}

    static FileKey lib(std::string path) { return {Kind::LibFile, std::move(path)}; }
    static FileKey source(std::string path) { return {Kind::SourceFile, std::move(path)}; }
    static FileKey json(std::string path) { return {Kind::JsonFile, std::move(path)}; }
    static FileKey resource(std::string path) { return {Kind::ResourceFile, std::move(path)}; }

    Kind kind() const { return kind_; }
    const std::string& to_string() const { return path_; }
    bool is_lib() const { return kind_ == Kind::LibFile; }

    // Extension including the dot, or "" when the basename has none.
    std::string suffix() const;

    // Path with directory separators normalized for the host platform.
    std::string normalized() const;

    bool operator==(const FileKey& other) const {
        return kind_ == other.kind_ && path_ == other.path_;
    }
    bool operator!=(const FileKey& other) const { return !(*this == other); }

    static const char* kind_name(Kind k);

private:
    Kind kind_;
    std::string path_;
};

} // namespace tyck
