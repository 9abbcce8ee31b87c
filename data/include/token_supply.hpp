#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace data {

    struct TokenSupply {
        double circulating_supply = 0.0;
        double total_supply = 0.0;
    };

    // Base asset ("PEPE") -> supply figures
    using TokenSupplyTable = std::map<std::string, TokenSupply>;

    // Entries with non-positive supplies are skipped with a warning
    TokenSupplyTable parseTokenSupplyTable(const nlohmann::json& table_json);

    // Throws core::DataLoadException if the file is missing or malformed
    TokenSupplyTable loadTokenSupplyTable(const std::string& path);

} // namespace data
