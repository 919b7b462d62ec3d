#pragma once

#include <cstdlib>
#include <string>
#include <vector>

namespace holdings::settings {

/**
 * @brief Настройки выбора участников и активов
 *
 * Читает из ENV:
 * - SELECTED_ENTITIES (список через запятую, пусто = выбор по умолчанию)
 * - SELECTED_ASSETS (список через запятую, пусто = выбор по умолчанию)
 * - DEFAULT_ENTITY_COUNT (default: 5)
 * - DEFAULT_ASSET_COUNT (default: 10)
 *
 * Пробелы вокруг запятых относятся к синтаксису списка и отбрасываются,
 * сами идентификаторы сравниваются точно.
 */
class SelectionSettings {
public:
    SelectionSettings() {
        if (const char* val = std::getenv("SELECTED_ENTITIES")) {
            entities_ = splitList(val);
        }
        if (const char* val = std::getenv("SELECTED_ASSETS")) {
            assets_ = splitList(val);
        }
        if (const char* val = std::getenv("DEFAULT_ENTITY_COUNT")) {
            defaultEntityCount_ = static_cast<std::size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("DEFAULT_ASSET_COUNT")) {
            defaultAssetCount_ = static_cast<std::size_t>(std::stoi(val));
        }
    }

    const std::vector<std::string>& getEntities() const { return entities_; }
    const std::vector<std::string>& getAssets() const { return assets_; }
    std::size_t getDefaultEntityCount() const { return defaultEntityCount_; }
    std::size_t getDefaultAssetCount() const { return defaultAssetCount_; }

    static std::vector<std::string> splitList(const std::string& value) {
        std::vector<std::string> result;
        std::size_t start = 0;
        while (start <= value.size()) {
            std::size_t end = value.find(',', start);
            if (end == std::string::npos) {
                end = value.size();
            }
            std::string item = value.substr(start, end - start);
            std::size_t first = item.find_first_not_of(" \t");
            std::size_t last = item.find_last_not_of(" \t");
            if (first != std::string::npos) {
                result.push_back(item.substr(first, last - first + 1));
            }
            start = end + 1;
        }
        return result;
    }

private:
    std::vector<std::string> entities_;
    std::vector<std::string> assets_;
    std::size_t defaultEntityCount_ = 5;
    std::size_t defaultAssetCount_ = 10;
};

} // namespace holdings::settings
