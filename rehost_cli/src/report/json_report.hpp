#ifndef REHOST_JSON_REPORT_HPP
#define REHOST_JSON_REPORT_HPP

#include "../../../librehost/include/errors.hpp"
#include "../../../librehost/include/types.hpp"
#include <nlohmann/json.hpp>
#include <vector>

nlohmann::json asset_to_json(const rehost::Asset& asset);

nlohmann::json assets_to_json(const std::vector<rehost::Asset>& assets);

/**
 * @brief {"html", "messages", "stats"}; html is omitted when @p include_html is false.
 */
nlohmann::json transform_to_json(const rehost::TransformResult& result, bool include_html = true);

/**
 * @brief {"error": {"kind", "message"[, "index", "cause"]}}
 */
nlohmann::json error_to_json(const rehost::RehostError& error);

#endif // REHOST_JSON_REPORT_HPP
