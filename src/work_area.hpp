#pragma once
#include <filesystem>
#include <optional>
#include <string>

// Private scratch directory owned by exactly one execution.
// Removed by close() or, at the latest, by the destructor.
class WorkArea {
public:
    // Creates <root>/codebox-XXXXXX with mode 0700. Throws std::runtime_error.
    static WorkArea open(const std::filesystem::path& root);

    WorkArea(WorkArea&& other) noexcept;
    WorkArea& operator=(WorkArea&&) = delete;
    WorkArea(const WorkArea&) = delete;
    WorkArea& operator=(const WorkArea&) = delete;
    ~WorkArea();

    const std::filesystem::path& path() const { return path_; }
    bool is_open() const { return !path_.empty(); }

    // Destination for a caller supplied file name, or nullopt when the name
    // would land on or outside the work area (absolute paths, "..", symlinks).
    std::optional<std::filesystem::path> resolve_inside(const std::string& name) const;

    // Best effort; failures are logged. Safe to call more than once.
    void close();

private:
    explicit WorkArea(std::filesystem::path p) : path_(std::move(p)) {}

    std::filesystem::path path_;
};

// True when `child` is below `parent` (and not equal to it).
// Both paths are expected to be canonical.
bool is_strictly_inside(const std::filesystem::path& parent, const std::filesystem::path& child);
