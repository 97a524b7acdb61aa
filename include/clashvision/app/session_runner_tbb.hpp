#pragma once

#include <clashvision/app/detection_session.hpp>
#include <functional>
#include <string>
#include <vector>

#ifdef CLASHVISION_HAS_TBB

namespace clashvision::app {

/// Callback for each processed path; receives the path and its result.
/// Invoked from TBB worker threads; must be thread-safe.
using ImageResultCallback =
    std::function<void(const std::string& image_path, const ImageResult& result)>;

/// Processes \p image_paths across \p sessions in parallel using TBB.
///
/// Paths are partitioned round-robin: path i goes to sessions[i % sessions.size()].
/// Each session's slice runs sequentially on one TBB task, so no session is
/// ever used from two threads at once. Every path is reported to \p callback,
/// failures included.
///
/// \param sessions Non-null sessions, one per worker. Caller keeps ownership.
/// \param image_paths Images to process.
/// \param output_dir Directory for the annotated image and the record.
/// \param callback Invoked once per path. Must be thread-safe.
void run_sessions_parallel_tbb(const std::vector<DetectionSession*>& sessions,
                               const std::vector<std::string>& image_paths,
                               const std::string& output_dir,
                               ImageResultCallback callback);

}  // namespace clashvision::app

#endif  // CLASHVISION_HAS_TBB
