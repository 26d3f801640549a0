#pragma once

#include "catalog.hpp"
#include "index_backend.hpp"
#include <memory>
#include <string>

// File names inside <LOCAL_DATA_PATH>/index/
constexpr const char* kIndexFileName = "faiss.index";
constexpr const char* kMetaFileName = "meta.json";

struct LoadedAssets {
    std::unique_ptr<IndexBackend> index;
    Catalog catalog;
};

// Loads faiss.index and meta.json from index_dir.
//
// Throws AssetNotFoundError if either file is missing, AssetFormatError if
// meta.json is not valid JSON, lacks an "items" array, or does not line up
// with the index (item count vs ntotal, declared dim vs index dim).
// A missing or non-positive "dim" is only logged; searches will fail with
// ServerFault until the asset is fixed.
LoadedAssets load_assets(const std::string& index_dir);

// Parses meta.json into a Catalog (same errors as above).
Catalog load_catalog(const std::string& meta_path);

// Cross-checks a loaded index against its catalog.
void check_alignment(const IndexBackend& index, const Catalog& catalog);
