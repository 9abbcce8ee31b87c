#include "token_supply.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <fstream>

namespace data {

    TokenSupplyTable parseTokenSupplyTable(const nlohmann::json& table_json) {
        if (!table_json.is_object()) {
            throw core::DataLoadException("Token supply table must be a JSON object keyed by base asset");
        }

        TokenSupplyTable table;
        for (auto it = table_json.begin(); it != table_json.end(); ++it) {
            const auto& entry = it.value();
            try {
                TokenSupply supply;
                supply.circulating_supply = entry.at("circulating_supply").get<double>();
                supply.total_supply = entry.at("total_supply").get<double>();
                if (supply.circulating_supply <= 0.0 || supply.total_supply <= 0.0) {
                    core::logging::getLogger()->warn("Token supply for {} is not positive, skipping.", it.key());
                    continue;
                }
                table[it.key()] = supply;
            } catch (const nlohmann::json::exception& e) {
                core::logging::getLogger()->warn("Malformed token supply entry for {}: {}", it.key(), e.what());
            }
        }
        return table;
    }

    TokenSupplyTable loadTokenSupplyTable(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw core::DataLoadException("Cannot open token supply file: " + path);
        }

        nlohmann::json table_json;
        try {
            file >> table_json;
        } catch (const nlohmann::json::parse_error& e) {
            throw core::DataLoadException("Failed to parse token supply file '" + path + "': " + e.what());
        }

        TokenSupplyTable table = parseTokenSupplyTable(table_json);
        core::logging::getLogger()->info("Loaded token supply for {} assets from {}", table.size(), path);
        return table;
    }

} // namespace data
