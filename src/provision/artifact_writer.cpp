#include <sitecache/provision/artifact_writer.h>

#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <grp.h>
#include <pwd.h>
#include <sstream>
#include <unistd.h>

namespace sitecache::provision {

namespace fs = std::filesystem;

Result<FileOwner> resolveOwner(const std::string& user, const std::string& group) {
    const struct passwd* pw = ::getpwnam(user.c_str());
    if (!pw) {
        return Error{ErrorCode::PreconditionFailed,
                     "User '" + user + "' does not exist. Is the cache server properly installed?"};
    }
    const struct group* gr = ::getgrnam(group.c_str());
    if (!gr) {
        return Error{ErrorCode::PreconditionFailed, "Group '" + group + "' does not exist"};
    }
    return FileOwner{pw->pw_uid, gr->gr_gid};
}

Result<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot read " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::InvalidData, "Error reading " + path.string()};
    }
    return ss.str();
}

Result<void> writeFileAtomic(const fs::path& path, std::string_view content, fs::perms perms,
                             const std::optional<FileOwner>& owner) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::WriteError, "Failed to create directory " +
                                                path.parent_path().string() + ": " + ec.message()};
    }

    auto tempPath = path.parent_path() /
                    ("." + path.filename().string() + ".tmp." + std::to_string(::getpid()));

    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Error{ErrorCode::WriteError, "Failed to create temp file " + tempPath.string()};
        }
        // Tighten permissions before any content lands in the file
        fs::permissions(tempPath, perms, fs::perm_options::replace, ec);
        if (ec) {
            file.close();
            fs::remove(tempPath, ec);
            return Error{ErrorCode::WriteError,
                         "Failed to set permissions on " + tempPath.string()};
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            file.close();
            fs::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, "Failed to write " + tempPath.string()};
        }
    }

    if (owner) {
        if (::chown(tempPath.c_str(), owner->uid, owner->gid) != 0) {
            int saved = errno;
            fs::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, "Failed to change ownership of " + path.string() +
                                                    ": " + std::strerror(saved)};
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tempPath, rmEc);
        spdlog::error("Failed to rename {} to {}: {}", tempPath.string(), path.string(),
                      ec.message());
        return Error{ErrorCode::WriteError,
                     "Failed to move " + path.string() + " into place: " + ec.message()};
    }
    spdlog::debug("Wrote {} ({} bytes)", path.string(), content.size());
    return {};
}

const char* artifactKindName(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::BaseConfig: return "base config";
        case ArtifactKind::OverrideConfig: return "override config";
        case ArtifactKind::ServiceUnit: return "service unit";
    }
    return "artifact";
}

void ArtifactJournal::expect(ArtifactKind kind, fs::path path) {
    for (auto& e : entries_) {
        if (e.kind == kind) {
            e.path = std::move(path);
            e.state = State::Pending;
            return;
        }
    }
    entries_.push_back(Entry{kind, std::move(path), State::Pending});
}

ArtifactJournal::Entry& ArtifactJournal::entry(ArtifactKind kind) {
    for (auto& e : entries_) {
        if (e.kind == kind)
            return e;
    }
    entries_.push_back(Entry{kind, {}, State::Pending});
    return entries_.back();
}

void ArtifactJournal::markWritten(ArtifactKind kind) {
    entry(kind).state = State::Written;
}

void ArtifactJournal::markUntouched(ArtifactKind kind) {
    entry(kind).state = State::Untouched;
}

bool ArtifactJournal::anyWritten() const {
    for (const auto& e : entries_) {
        if (e.state == State::Written)
            return true;
    }
    return false;
}

std::string ArtifactJournal::describe() const {
    std::string written;
    std::string pending;
    for (const auto& e : entries_) {
        if (e.state == State::Untouched)
            continue;
        auto& target = e.state == State::Written ? written : pending;
        if (!target.empty())
            target += ", ";
        target += std::string(artifactKindName(e.kind)) + " (" + e.path.string() + ")";
    }
    return "written: [" + written + "]; not written: [" + pending + "]";
}

Error ArtifactJournal::failure(const Error& cause) const {
    return Error{cause.code, cause.message + "; partial state " + describe()};
}

} // namespace sitecache::provision
