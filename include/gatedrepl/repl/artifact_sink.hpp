/*
 * gatedrepl C++ - Artifact Sink
 *
 * Optional audit trail: the service hands each executed submission and its
 * output to a sink. A failing sink never fails the execution.
 */
#ifndef gatedrepl_REPL_ARTIFACT_SINK_HPP
#define gatedrepl_REPL_ARTIFACT_SINK_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace gatedrepl {

class ArtifactSink {
public:
    virtual ~ArtifactSink() {}

    // Store content under name; version receives the stored version number
    // (0 for the first save of a name). Returns false on failure.
    virtual bool save_artifact(const std::string& session_id, const std::string& name,
                               const std::string& content, int64_t& version) = 0;
};

typedef std::shared_ptr<ArtifactSink> ArtifactSinkPtr;

// Writes <root>/<session_id>/<name>.v<N>, N counting up from 0
class DirectoryArtifactSink : public ArtifactSink {
public:
    explicit DirectoryArtifactSink(const std::string& root_dir);

    bool save_artifact(const std::string& session_id, const std::string& name,
                       const std::string& content, int64_t& version) override;

    // Path of a stored version
    std::string artifact_path(const std::string& session_id, const std::string& name, int64_t version) const;

    const std::string& root_dir() const { return root_dir_; }

private:
    std::string root_dir_;
    std::mutex mutex_;
};

} // namespace gatedrepl

#endif // gatedrepl_REPL_ARTIFACT_SINK_HPP
