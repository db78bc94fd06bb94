/*
 * gatedrepl C++ - Directory Artifact Sink
 */
#include <gatedrepl/repl/artifact_sink.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>

namespace gatedrepl {

// Session ids and names become path components; keep them flat
static bool is_safe_component(const std::string& s) {
    if (s.empty() || s == "." || s == "..") return false;
    return s.find('/') == std::string::npos && s.find('\\') == std::string::npos &&
           s.find('\0') == std::string::npos;
}

DirectoryArtifactSink::DirectoryArtifactSink(const std::string& root_dir)
    : root_dir_(root_dir) {}

std::string DirectoryArtifactSink::artifact_path(const std::string& session_id, const std::string& name,
                                                 int64_t version) const {
    return join_path(join_path(root_dir_, session_id), name + ".v" + std::to_string(version));
}

bool DirectoryArtifactSink::save_artifact(const std::string& session_id, const std::string& name,
                                          const std::string& content, int64_t& version) {
    if (!is_safe_component(session_id) || !is_safe_component(name)) {
        LOG_ERROR("[Artifacts] Refusing unsafe artifact path '%s/%s'", session_id.c_str(), name.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string dir = join_path(root_dir_, session_id);
    if (!create_directories(dir)) {
        LOG_ERROR("[Artifacts] Failed to create directory '%s'", dir.c_str());
        return false;
    }

    int64_t next = 0;
    while (file_exists(artifact_path(session_id, name, next))) ++next;

    std::string path = artifact_path(session_id, name, next);
    if (!write_file(path, content)) {
        LOG_ERROR("[Artifacts] Failed to write '%s'", path.c_str());
        return false;
    }

    version = next;
    LOG_DEBUG("[Artifacts] Saved %s (version %lld)", path.c_str(), static_cast<long long>(next));
    return true;
}

} // namespace gatedrepl
