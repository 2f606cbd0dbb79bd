#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/cache_store.hpp"

namespace offline::cache {

/*
  Key conventions and TTLs for the data the app needs while offline.

    profile:<user>              high    24h
    messages:recent:<user>      high    12h   most recent N only
    communities:<user>          medium   6h
    resources:priority:<user>   medium   6h
    resources:subject:<subject> medium   4h
    official:content            high    24h   full collection
    official:<source>           high    24h   items whose "source" matches
*/

constexpr std::size_t kRecentMessageLimit = 50;

std::string ProfileKey(const std::string& user_id);
std::string RecentMessagesKey(const std::string& user_id);
std::string CommunitiesKey(const std::string& user_id);
std::string PriorityResourcesKey(const std::string& user_id);
std::string SubjectResourcesKey(const std::string& subject);
std::string OfficialContentKey();
std::string OfficialSourceKey(const std::string& source);

void CacheUserProfile(CacheStore& store, const std::string& user_id, const google::protobuf::Value& profile);

// Keeps the first `limit` messages; callers pass them newest first.
void CacheRecentMessages(CacheStore& store, const std::string& user_id,
                         const std::vector<google::protobuf::Value>& messages,
                         std::size_t limit = kRecentMessageLimit);

void CacheCommunities(CacheStore& store, const std::string& user_id,
                      const std::vector<google::protobuf::Value>& communities);

void CachePriorityResources(CacheStore& store, const std::string& user_id,
                            const std::vector<google::protobuf::Value>& resources);

void CacheResourcesBySubject(CacheStore& store, const std::string& subject,
                             const std::vector<google::protobuf::Value>& resources);

// Stores the whole collection plus one entry per distinct "source" field.
void CacheOfficialContent(CacheStore& store, const std::vector<google::protobuf::Value>& items);

struct CriticalContent {
  std::optional<google::protobuf::Value> profile;
  std::vector<google::protobuf::Value>   messages;
  std::vector<google::protobuf::Value>   communities;
  std::vector<google::protobuf::Value>   resources;
};

// Everything a user needs to open the app offline.
void CacheCriticalContent(CacheStore& store, const std::string& user_id, const CriticalContent& content);

} // namespace offline::cache
