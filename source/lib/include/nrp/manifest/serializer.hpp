#pragma once

#include <span>
#include <string>
#include <string_view>

#include <nrp/manifest/types.hpp>
#include <nrp/util.hpp>

// Brings every list of the manifest into its canonical order
void SortManifest(Manifest& manifest);

/*
        Canonical toml text of the manifest, identical manifests always produce identical text
*/
std::string DumpManifest(const Manifest& manifest);

struct ManifestOutput
{
    const Manifest* m_Manifest;
    fs::path m_Path;
};

/*
        Every output is first written next to its destination and only renamed into place
        once all of them were written successfully, throws SerializationError otherwise
*/
void WriteManifests(std::span<const ManifestOutput> outputs);

Manifest ReadManifest(const fs::path& path);
Manifest ParseManifest(std::string_view text, std::string_view source_name);
