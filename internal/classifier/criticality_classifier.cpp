#include "internal/classifier/criticality_classifier.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/model/proto_convert.hpp"
#include "internal/util/url.hpp"

namespace chains::classifier {

using model::Priority;
using model::RequestRecord;
using model::ResourceType;

ClassifierOptions ClassifierOptions::Defaults() {
  ClassifierOptions options;
  options.min_priority          = Priority::kMedium;
  options.render_blocking_types = {
      ResourceType::kDocument, ResourceType::kScript, ResourceType::kStylesheet,
      ResourceType::kXhr,      ResourceType::kFetch,
  };
  options.favicon_prefixes = {"favicon", "apple-touch-icon", "android-chrome-", "mstile-"};
  options.icon_mime_types  = {"image/x-icon", "image/vnd.microsoft.icon"};
  return options;
}

ClassifierOptions ClassifierOptions::FromConfig(const chains::runtime::config::ClassifierConfig& config) {
  auto options = Defaults();

  if (config.min_priority() != chains::analyzer::v1::RESOURCE_PRIORITY_UNSPECIFIED) {
    options.min_priority = model::FromProto(config.min_priority());
    if (!model::IsRanked(options.min_priority)) {
      throw std::runtime_error("classifier.min_priority is not a known priority");
    }
  }

  if (config.render_blocking_types_size() > 0) {
    options.render_blocking_types.clear();
    for (auto type : config.render_blocking_types()) {
      auto converted = model::FromProto(static_cast<chains::analyzer::v1::ResourceType>(type));
      if (converted == ResourceType::kUnspecified || converted == ResourceType::kUnknown) {
        throw std::runtime_error("classifier.render_blocking_types holds an unknown resource type");
      }
      options.render_blocking_types.push_back(converted);
    }
  }

  if (config.favicon_prefixes_size() > 0) {
    options.favicon_prefixes.clear();
    for (const auto& prefix : config.favicon_prefixes()) {
      options.favicon_prefixes.push_back(util::ToLower(prefix));
    }
  }

  if (config.icon_mime_types_size() > 0) {
    options.icon_mime_types.clear();
    for (const auto& mime : config.icon_mime_types()) {
      options.icon_mime_types.push_back(util::ToLower(mime));
    }
  }

  return options;
}

CriticalityClassifier::CriticalityClassifier(const registry::RequestRegistry& registry, ClassifierOptions options)
    : registry_(registry), options_(std::move(options)) {
}

// ------------------------------------------------------------
// IsCritical
// ------------------------------------------------------------

bool CriticalityClassifier::IsCritical(const RequestRecord& record) const {
  if (registry_.IsRoot(record)) {
    return true;
  }

  if (record.is_link_preload) {
    return false;
  }

  const auto destination = registry_.ResolveDestination(record);

  const auto type     = model::IsDeclared(record.resource_type) ? record.resource_type : destination.resource_type;
  const auto priority = model::IsDeclared(record.priority) ? record.priority : destination.priority;

  if (IsFavicon(record)) {
    return false;
  }

  const auto* root = registry_.Root();
  if (type == ResourceType::kDocument && root && destination.frame_id != root->frame_id) {
    return false;
  }

  if (util::IsNonNetworkUrl(record.url) || util::IsNonNetworkUrl(destination.url)) {
    return false;
  }

  if (util::StartsWith(util::ToLower(record.mime_type), "image/") ||
      util::StartsWith(util::ToLower(destination.mime_type), "image/")) {
    return false;
  }

  if (!IsRenderBlockingType(type) || !model::IsAtLeast(priority, options_.min_priority)) {
    return false;
  }

  if (type == ResourceType::kXhr || type == ResourceType::kFetch) {
    return IssuedBy(record) == model::InitiatorKind::kParser;
  }

  return true;
}

bool CriticalityClassifier::IsFavicon(const RequestRecord& record) const {
  const auto destination = registry_.ResolveDestination(record);

  return IsFaviconUrl(record.url) || IsFaviconUrl(destination.url) || IsIconMime(record.mime_type) ||
         IsIconMime(destination.mime_type);
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

namespace {

// "favicon" matches favicon.ico and favicon-32x32.png but not favicons-theme.css.
// A prefix ending in '-' already carries its separator.
bool MatchesIconStem(const std::string& file, const std::string& prefix) {
  if (prefix.empty() || !util::StartsWith(file, prefix)) {
    return false;
  }
  if (prefix.back() == '-' || file.size() == prefix.size()) {
    return true;
  }

  const char next = file[prefix.size()];
  return next == '.' || next == '-';
}

} // namespace

bool CriticalityClassifier::IsRenderBlockingType(ResourceType type) const {
  return std::find(options_.render_blocking_types.begin(), options_.render_blocking_types.end(), type) !=
         options_.render_blocking_types.end();
}

bool CriticalityClassifier::IsFaviconUrl(const std::string& url) const {
  const auto file = util::ToLower(util::LastPathComponent(url));
  if (file.empty()) {
    return false;
  }

  return std::any_of(options_.favicon_prefixes.begin(), options_.favicon_prefixes.end(),
                     [&file](const std::string& prefix) { return MatchesIconStem(file, prefix); });
}

bool CriticalityClassifier::IsIconMime(const std::string& mime_type) const {
  if (mime_type.empty()) {
    return false;
  }

  const auto lowered = util::ToLower(mime_type);
  return std::find(options_.icon_mime_types.begin(), options_.icon_mime_types.end(), lowered) !=
         options_.icon_mime_types.end();
}

// A redirect hop was issued by whoever issued the head of its chain.
model::InitiatorKind CriticalityClassifier::IssuedBy(const RequestRecord& record) const {
  const RequestRecord* head = &record;
  while (const auto* source = registry_.RedirectSourceOf(*head)) {
    head = source;
  }

  if (!head->initiator) {
    return model::InitiatorKind::kUnspecified;
  }
  return head->initiator->kind;
}

} // namespace chains::classifier
