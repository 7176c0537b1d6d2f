#include "json_report.hpp"

using nlohmann::json;

json asset_to_json(const rehost::Asset& asset) {
    return {
        {"url", asset.public_url},
        {"mime", asset.mime},
        {"width", asset.width},
        {"height", asset.height},
        {"bytes", asset.byte_size},
        {"hash", asset.content_digest},
        {"deduped", asset.deduplicated},
        {"key", asset.storage_key}
    };
}

json assets_to_json(const std::vector<rehost::Asset>& assets) {
    json out = json::array();
    for (const auto& asset : assets) {
        out.push_back(asset_to_json(asset));
    }
    return out;
}

json transform_to_json(const rehost::TransformResult& result, const bool include_html) {
    json out;
    if (include_html) {
        out["html"] = result.html;
    }
    out["messages"] = result.messages;
    out["stats"] = {
        {"images_processed", result.stats.images_processed},
        {"images_rehosted", result.stats.images_rehosted},
        {"styles_removed", result.stats.styles_removed},
        {"scripts_removed", result.stats.scripts_removed}
    };
    return out;
}

json error_to_json(const rehost::RehostError& error) {
    json detail = {
        {"kind", std::string(rehost::to_string(error.kind()))},
        {"message", error.what()}
    };
    if (const auto* item = dynamic_cast<const rehost::BatchItemError*>(&error)) {
        detail["index"] = item->index();
        detail["cause"] = std::string(rehost::to_string(item->cause()));
    }
    return {{"error", detail}};
}
