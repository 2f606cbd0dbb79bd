#include "cache_policies.hpp"

#include <chrono>
#include <map>

#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

namespace offline::cache {

using namespace offline::v1;
using google::protobuf::Value;
using offline::observability::IntField;
using offline::observability::StringField;

namespace {

constexpr std::chrono::hours kProfileTtl{24};
constexpr std::chrono::hours kMessagesTtl{12};
constexpr std::chrono::hours kCommunitiesTtl{6};
constexpr std::chrono::hours kPriorityResourcesTtl{6};
constexpr std::chrono::hours kSubjectResourcesTtl{4};
constexpr std::chrono::hours kOfficialTtl{24};

} // namespace

std::string ProfileKey(const std::string& user_id) {
  return "profile:" + user_id;
}

std::string RecentMessagesKey(const std::string& user_id) {
  return "messages:recent:" + user_id;
}

std::string CommunitiesKey(const std::string& user_id) {
  return "communities:" + user_id;
}

std::string PriorityResourcesKey(const std::string& user_id) {
  return "resources:priority:" + user_id;
}

std::string SubjectResourcesKey(const std::string& subject) {
  return "resources:subject:" + subject;
}

std::string OfficialContentKey() {
  return "official:content";
}

std::string OfficialSourceKey(const std::string& source) {
  return "official:" + source;
}

void CacheUserProfile(CacheStore& store, const std::string& user_id, const Value& profile) {
  store.Set(ProfileKey(user_id), profile, CACHE_PRIORITY_HIGH, kProfileTtl);
}

void CacheRecentMessages(CacheStore& store, const std::string& user_id, const std::vector<Value>& messages,
                         std::size_t limit) {
  const auto end = messages.size() > limit ? messages.begin() + static_cast<std::ptrdiff_t>(limit) : messages.end();
  store.Set(RecentMessagesKey(user_id), util::ListValue(std::vector<Value>(messages.begin(), end)), CACHE_PRIORITY_HIGH,
            kMessagesTtl);
}

void CacheCommunities(CacheStore& store, const std::string& user_id, const std::vector<Value>& communities) {
  store.Set(CommunitiesKey(user_id), util::ListValue(communities), CACHE_PRIORITY_MEDIUM, kCommunitiesTtl);
}

void CachePriorityResources(CacheStore& store, const std::string& user_id, const std::vector<Value>& resources) {
  store.Set(PriorityResourcesKey(user_id), util::ListValue(resources), CACHE_PRIORITY_MEDIUM, kPriorityResourcesTtl);
}

void CacheResourcesBySubject(CacheStore& store, const std::string& subject, const std::vector<Value>& resources) {
  store.Set(SubjectResourcesKey(subject), util::ListValue(resources), CACHE_PRIORITY_MEDIUM, kSubjectResourcesTtl);
}

void CacheOfficialContent(CacheStore& store, const std::vector<Value>& items) {
  store.Set(OfficialContentKey(), util::ListValue(items), CACHE_PRIORITY_HIGH, kOfficialTtl);

  std::map<std::string, std::vector<Value>> by_source;
  for (const auto& item : items) {
    auto source = util::Field(item, "source");
    if (!source || source->kind_case() != Value::kStringValue) continue;
    by_source[source->string_value()].push_back(item);
  }

  for (const auto& [source, subset] : by_source) {
    store.Set(OfficialSourceKey(source), util::ListValue(subset), CACHE_PRIORITY_HIGH, kOfficialTtl);
  }

  OFFLINE_LOG_DEBUG("Official content cached", {IntField("items", static_cast<int64_t>(items.size())),
                                                IntField("sources", static_cast<int64_t>(by_source.size()))});
}

void CacheCriticalContent(CacheStore& store, const std::string& user_id, const CriticalContent& content) {
  if (content.profile) {
    CacheUserProfile(store, user_id, *content.profile);
  }
  if (!content.messages.empty()) {
    CacheRecentMessages(store, user_id, content.messages);
  }
  if (!content.communities.empty()) {
    CacheCommunities(store, user_id, content.communities);
  }
  if (!content.resources.empty()) {
    CachePriorityResources(store, user_id, content.resources);
  }

  OFFLINE_LOG_INFO("Critical content cached", {StringField("user_id", user_id)});
}

} // namespace offline::cache
