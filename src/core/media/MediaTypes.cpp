#include "MediaTypes.hpp"

namespace mtc {

const char* to_string(UploadState s) {
  switch (s) {
    case UploadState::Uninitialized:  return "uninitialized";
    case UploadState::SessionCreated: return "session-created";
    case UploadState::Completed:      return "completed";
    case UploadState::Failed:         return "failed";
  }
  return "unknown";
}

} // namespace mtc
