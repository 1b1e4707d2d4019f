#include "AssetLibrary.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace megaphone {

LibraryManifest AssetLibrary::from_assets(const std::vector<AssetInfo>& assets) {
    LibraryManifest manifest;
    for (const auto& info : assets) {
        if (info.source_path.empty()) continue;
        manifest.entries.push_back(LibraryEntry{info.source_path, info.name});
    }
    return manifest;
}

std::string AssetLibrary::serialize(const LibraryManifest& manifest) {
    json j = manifest;
    return j.dump(4);
}

ErrorCode AssetLibrary::deserialize(LibraryManifest& manifest, const std::string& data) {
    try {
        json j = json::parse(data);
        manifest = j.get<LibraryManifest>();
        return ErrorCode::Ok;
    } catch (const json::exception& e) {
        std::cerr << "[AssetLibrary] Invalid manifest: " << e.what() << std::endl;
        return ErrorCode::ConfigError;
    }
}

bool AssetLibrary::save_to_file(const LibraryManifest& manifest, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[AssetLibrary] Failed to open for writing: " << path << std::endl;
        return false;
    }
    file << serialize(manifest);
    if (!file) {
        return false;
    }
    std::cout << "[AssetLibrary] Saved " << manifest.entries.size() << " clip(s) to " << path << std::endl;
    return true;
}

ErrorCode AssetLibrary::load_from_file(LibraryManifest& manifest, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[AssetLibrary] Failed to open file: " << path << std::endl;
        return ErrorCode::NotFound;
    }
    std::stringstream content;
    content << file.rdbuf();
    return deserialize(manifest, content.str());
}

} // namespace megaphone
