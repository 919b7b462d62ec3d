#pragma once

#include "ports/output/IHoldingsSource.hpp"
#include "settings/ISourceSettings.hpp"
#include "adapters/secondary/RawHoldingsMapper.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>

namespace holdings::adapters::secondary {

/**
 * @brief Источник снимков из JSON-файла
 *
 * Файл готовит внешний клиент данных (запросы к API, оценки).
 * Каждый вызов перечитывает файл и ставит метку времени получения.
 */
class JsonFileHoldingsSource : public ports::output::IHoldingsSource {
public:
    explicit JsonFileHoldingsSource(std::shared_ptr<settings::ISourceSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[JsonFileHoldingsSource] Created, path: " << settings_->getSnapshotPath() << std::endl;
    }

    domain::RawHoldingsSnapshot fetchSnapshot() override {
        const std::string path = settings_->getSnapshotPath();

        std::ifstream in(path);
        if (!in) {
            throw domain::HoldingsContractError("cannot open holdings snapshot: " + path);
        }

        nlohmann::ordered_json root;
        try {
            in >> root;
        } catch (const nlohmann::json::parse_error& e) {
            throw domain::HoldingsContractError("invalid JSON in " + path + ": " + e.what());
        }

        auto snapshot = RawHoldingsMapper::fromJson(root);
        snapshot.fetchedAt = domain::Timestamp::now();

        std::cout << "[JsonFileHoldingsSource] Loaded " << snapshot.entities.size()
                  << " entities from " << path << std::endl;
        return snapshot;
    }

private:
    std::shared_ptr<settings::ISourceSettings> settings_;
};

} // namespace holdings::adapters::secondary
