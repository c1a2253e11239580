#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <sys/types.h>
#include <sitecache/core/types.h>

namespace sitecache::provision {

struct FileOwner {
    uid_t uid{0};
    gid_t gid{0};
};

/// Look up a user/group pair; PreconditionFailed when either does not exist
Result<FileOwner> resolveOwner(const std::string& user, const std::string& group);

Result<std::string> readFile(const std::filesystem::path& path);

/**
 * Stage content in a temporary file next to the target, apply permissions and
 * ownership to the staged file, then rename it over the target. Readers see
 * either the old or the new file, never a partial write or looser permissions.
 */
Result<void> writeFileAtomic(const std::filesystem::path& path, std::string_view content,
                             std::filesystem::perms perms,
                             const std::optional<FileOwner>& owner = std::nullopt);

enum class ArtifactKind { BaseConfig, OverrideConfig, ServiceUnit };

const char* artifactKindName(ArtifactKind kind);

/**
 * Tracks which artifacts of one run were committed so a failure can report
 * the exact partial state left on disk.
 */
class ArtifactJournal {
public:
    enum class State { Pending, Written, Untouched };

    struct Entry {
        ArtifactKind kind;
        std::filesystem::path path;
        State state{State::Pending};
    };

    void expect(ArtifactKind kind, std::filesystem::path path);
    void markWritten(ArtifactKind kind);
    void markUntouched(ArtifactKind kind);

    const std::vector<Entry>& entries() const { return entries_; }
    bool anyWritten() const;

    /// "written: ...; not written: ..." summary for error messages
    std::string describe() const;

    /// Wrap a mutation failure with the partial-state summary
    Error failure(const Error& cause) const;

private:
    Entry& entry(ArtifactKind kind);

    std::vector<Entry> entries_;
};

} // namespace sitecache::provision
