#pragma once
#include <string>

#include "MediaTypes.hpp"
#include "core/transport/RequestExecutor.hpp"

namespace mtc {

// Media id -> metadata / transient fetch URL, and deletion.
class MediaResolver {
public:
  explicit MediaResolver(RequestExecutor& executor) : executor_(executor) {}

  // Throws ProtocolError when the metadata carries no url. Not retried: the
  // url may be withheld by policy rather than transiently missing.
  std::string resolve(const std::string& mediaId);

  MediaObject metadata(const std::string& mediaId);

  // Throws RejectedResult on {"success": false}, and when the remote reports
  // the media as not found (HTTP 404, e.g. a second delete).
  void remove(const std::string& mediaId);

private:
  RequestExecutor& executor_;
};

} // namespace mtc
