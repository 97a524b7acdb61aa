#include <clashvision/app/session_runner_tbb.hpp>

#ifdef CLASHVISION_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace clashvision::app {

void run_sessions_parallel_tbb(const std::vector<DetectionSession*>& sessions,
                               const std::vector<std::string>& image_paths,
                               const std::string& output_dir,
                               ImageResultCallback callback) {
  if (image_paths.empty() || !callback) return;
  if (sessions.empty()) {
    throw std::invalid_argument("run_sessions_parallel_tbb requires at least one session");
  }
  for (const auto* session : sessions) {
    if (session == nullptr) {
      throw std::invalid_argument("run_sessions_parallel_tbb: null session");
    }
  }

  const std::size_t workers = sessions.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, workers, 1),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t w = range.begin(); w != range.end(); ++w) {
          DetectionSession* session = sessions[w];
          for (std::size_t i = w; i < image_paths.size(); i += workers) {
            const auto result = session->process_image(image_paths[i], output_dir);
            callback(image_paths[i], result);
          }
        }
      });
}

}  // namespace clashvision::app

#endif  // CLASHVISION_HAS_TBB
