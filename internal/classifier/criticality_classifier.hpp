#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/request_record.hpp"
#include "internal/registry/request_registry.hpp"

namespace chains::classifier {

struct ClassifierOptions {
  model::Priority                  min_priority = model::Priority::kMedium;
  std::vector<model::ResourceType> render_blocking_types;
  std::vector<std::string>         favicon_prefixes;
  std::vector<std::string>         icon_mime_types;

  static ClassifierOptions Defaults();

  // Empty fields of the config section keep their defaults.
  static ClassifierOptions FromConfig(const chains::runtime::config::ClassifierConfig& config);
};

/*
  Decides whether a single request blocks rendering.

  Rules, first match wins:
    - the root document is critical
    - preloads, favicons, sub-frame documents, non-network URLs and
      image responses are not
    - a render-blocking type at or above the minimum priority is;
      XHR and Fetch only when the page parser issued them

  Unknown types and priorities never pass. Redirect hops fill an
  unspecified type or priority from the end of their chain.
*/
class CriticalityClassifier {
 public:
  CriticalityClassifier(const registry::RequestRegistry& registry, ClassifierOptions options);

  bool IsCritical(const model::RequestRecord& record) const;

  bool IsFavicon(const model::RequestRecord& record) const;

  const ClassifierOptions& Options() const {
    return options_;
  }

 private:
  bool IsRenderBlockingType(model::ResourceType type) const;
  bool IsFaviconUrl(const std::string& url) const;
  bool IsIconMime(const std::string& mime_type) const;

  model::InitiatorKind IssuedBy(const model::RequestRecord& record) const;

  const registry::RequestRegistry& registry_;
  ClassifierOptions                options_;
};

} // namespace chains::classifier
