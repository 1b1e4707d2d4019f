/**
 * @file AssetLibrary.hpp
 * @brief Human-readable JSON manifest of the soundboard clips.
 */

#ifndef MEGAPHONE_ASSET_LIBRARY_HPP
#define MEGAPHONE_ASSET_LIBRARY_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "AudioAsset.hpp"
#include "Errors.hpp"

namespace megaphone {

using json = nlohmann::json;

/**
 * @brief One clip to re-decode when the library is restored.
 */
struct LibraryEntry {
    std::string path;
    std::string name;

    bool operator==(const LibraryEntry&) const = default;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(LibraryEntry, path, name)
};

struct LibraryManifest {
    int version = 1;
    std::vector<LibraryEntry> entries;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(LibraryManifest, version, entries)
};

/**
 * @brief Saves and loads LibraryManifest. Only the paths are stored, the PCM
 * is decoded again on restore.
 */
class AssetLibrary {
public:
    /**
     * @brief Manifest for the given assets. Clips loaded from memory have no
     * source path and are left out.
     */
    static LibraryManifest from_assets(const std::vector<AssetInfo>& assets);

    static bool save_to_file(const LibraryManifest& manifest, const std::string& path);

    /**
     * @return Ok, NotFound (no such file) or ConfigError (malformed manifest).
     */
    static ErrorCode load_from_file(LibraryManifest& manifest, const std::string& path);

    static std::string serialize(const LibraryManifest& manifest);
    static ErrorCode deserialize(LibraryManifest& manifest, const std::string& data);
};

} // namespace megaphone

#endif // MEGAPHONE_ASSET_LIBRARY_HPP
