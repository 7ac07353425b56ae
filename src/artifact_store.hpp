#pragma once
#include <filesystem>
#include <optional>
#include <string>

struct PromotionResult {
    std::optional<std::string> reference;   // caller facing, e.g. /api/uploads/<session>/<file>
    std::optional<std::filesystem::path> stored_path;
    std::string warning;                    // bracketed stderr line, empty on success
};

// Durable, session partitioned artifact directory tree:
//   <root>/<session id>/plot_<uuid>.png
// Requests only ever add files; nothing here deletes or replaces.
class ArtifactStore {
public:
    ArtifactStore(std::filesystem::path root, std::string url_prefix);

    // Moves <work_dir>/plot.png into the session directory under a fresh name.
    // No artifact is not an error. Filesystem failures end up in `warning`.
    PromotionResult promote(const std::filesystem::path& work_dir, const std::string& session_id) const;

    // Stored artifact for a served path, or nullopt when the components are
    // unsafe or the file does not exist.
    std::optional<std::filesystem::path> locate(const std::string& session_id, const std::string& filename) const;

    const std::filesystem::path& root() const { return root_; }
    const std::string& url_prefix() const { return url_prefix_; }

    // One plain path component: non-empty, no separators, no "..".
    static bool is_safe_component(const std::string& s);
    static std::string new_artifact_name();

private:
    std::filesystem::path root_;
    std::string url_prefix_;
};

// Random RFC 4122 version 4 UUID from OpenSSL's CSPRNG. Throws std::runtime_error.
std::string random_uuid();

// Hex SHA-256 of a file's contents, served as the artifact's ETag.
std::string sha256_file(const std::filesystem::path& p);

std::string content_type_for(const std::filesystem::path& p);
