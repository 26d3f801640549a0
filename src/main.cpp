// cinevec: nearest-neighbor search over a prebuilt movie embedding index
#include <memory>
#include "asset_loader.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "search_service.hpp"
#include "server.hpp"

int main() {
    std::shared_ptr<const SearchService> service;
    ServiceConfig config;

    try {
        config = load_config_from_env();
        LOG_INFO("Data root: " + config.data_root);

        LoadedAssets assets = load_assets(config.index_dir);
        service = std::make_shared<const SearchService>(std::move(assets.index),
                                                        std::move(assets.catalog));
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: " + std::string(e.what()));
        return 1;
    } catch (const AssetNotFoundError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load index assets: " + std::string(e.what()));
        return 1;
    }

    Server server(service, config.host, config.port);
    return server.run() ? 0 : 1;
}
