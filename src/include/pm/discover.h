#pragma once

#include <map>
#include <string>

namespace pm {

// File name every platform directory carries.
inline const std::string kMetadataFileName = "metadata.pegasus.txt";

struct CollectionSource {
    std::string name;  // directory name, as shown to users
    std::string path;  // full path of the metadata file
};

// "FBNEO ACT" -> "fbneo_act". Only the last path segment is used.
std::string platform_key(const std::string& directory_name);

// Immediate subdirectories of `resource_root` holding a metadata file,
// keyed by platform_key(). A missing root yields an empty map.
std::map<std::string, CollectionSource> discover_collections(const std::string& resource_root);

}  // namespace pm
