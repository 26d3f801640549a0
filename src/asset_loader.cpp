#include "asset_loader.hpp"
#include "errors.hpp"
#include "knn_faiss.hpp"
#include "log.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

Catalog load_catalog(const std::string& meta_path) {
    std::ifstream file(meta_path);
    if (!file.is_open()) {
        throw AssetFormatError("Failed to open " + meta_path);
    }

    nlohmann::json meta;
    try {
        meta = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw AssetFormatError("Failed to parse " + meta_path + ": " + e.what());
    }

    return parse_catalog(meta);
}

void check_alignment(const IndexBackend& index, const Catalog& catalog) {
    if (index.get_count() != catalog.size()) {
        throw AssetFormatError(
            "meta.json has " + std::to_string(catalog.size()) + " items but the index holds " +
            std::to_string(index.get_count()) + " vectors");
    }
    if (catalog.dim > 0 && catalog.dim != index.get_dim()) {
        throw AssetFormatError(
            "meta.json declares dim " + std::to_string(catalog.dim) +
            " but the index has dim " + std::to_string(index.get_dim()));
    }
}

LoadedAssets load_assets(const std::string& index_dir) {
    fs::path dir(index_dir);
    fs::path index_path = dir / kIndexFileName;
    fs::path meta_path = dir / kMetaFileName;

    std::error_code ec;
    if (!fs::is_regular_file(index_path, ec) || !fs::is_regular_file(meta_path, ec)) {
        throw AssetNotFoundError(
            "Missing index assets (faiss.index/meta.json) in " + dir.string() +
            ". Run the offline index build first.");
    }

    LOG_INFO("Loading metadata from: " + meta_path.string());
    LoadedAssets assets;
    assets.catalog = load_catalog(meta_path.string());

    LOG_INFO("Loading index from: " + index_path.string());
    assets.index = FaissIndex::load(index_path.string());

    check_alignment(*assets.index, assets.catalog);

    if (assets.catalog.dim <= 0) {
        LOG_WARN("meta.json declares no positive dim; searches will be rejected");
    }

    LOG_INFO("Loaded " + std::to_string(assets.catalog.size()) + " items, dim=" +
             std::to_string(assets.index->get_dim()) + ", backend=" +
             assets.index->get_backend_name());
    return assets;
}
