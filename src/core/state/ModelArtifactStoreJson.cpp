#include "core/state/ModelArtifactStoreJson.h"

#include <cctype>
#include <fstream>
#include <system_error>

#include "common/Logger.h"

namespace harvestcast {
namespace core {

namespace {
// Percent-encodes every byte outside [A-Za-z0-9_-], so distinct keys never
// share a file. '.' is encoded too, keeping "." and ".." out of the names.
std::string encodeFileName(const std::string& key) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '_' || c == '-') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out.empty() ? std::string("%") : out;
}

nlohmann::json seasonalToJson(const forecast::SeasonalTrendParams& p) {
    nlohmann::json j;
    j["available"] = p.available;
    j["origin"] = p.origin;
    j["intercept"] = p.intercept;
    j["slope"] = p.slope;
    j["t_scale"] = p.t_scale;
    j["y_scale"] = p.y_scale;
    j["period"] = p.period_days;
    j["sin"] = p.sin_coeffs;
    j["cos"] = p.cos_coeffs;
    j["residual_std"] = p.residual_std;
    j["interval_z"] = p.interval_z;
    j["n"] = p.sample_size;
    return j;
}

forecast::SeasonalTrendParams seasonalFromJson(const nlohmann::json& j) {
    forecast::SeasonalTrendParams p;
    p.available = j.value("available", false);
    p.origin = j.value("origin", 0);
    p.intercept = j.value("intercept", 0.0);
    p.slope = j.value("slope", 0.0);
    p.t_scale = j.value("t_scale", 1.0);
    p.y_scale = j.value("y_scale", 1.0);
    p.period_days = j.value("period", 365.25);
    p.sin_coeffs = j.value("sin", std::vector<double>{});
    p.cos_coeffs = j.value("cos", std::vector<double>{});
    p.residual_std = j.value("residual_std", 0.0);
    p.interval_z = j.value("interval_z", p.interval_z);
    p.sample_size = j.value("n", static_cast<std::size_t>(0));
    if (p.sin_coeffs.size() != p.cos_coeffs.size()) {
        p.available = false;
    }
    return p;
}
}

ModelArtifactStoreJson::ModelArtifactStoreJson(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path ModelArtifactStoreJson::pathFor(const std::string& key) const {
    return directory_ / (encodeFileName(key) + ".json");
}

nlohmann::json ModelArtifactStoreJson::toJson(const ModelArtifact& artifact) {
    const auto& model = artifact.model;

    nlohmann::json raw;
    raw["schema_version"] = artifact.schema_version;
    raw["saved_at_ms"] = artifact.saved_at_ms;
    raw["key"] = model.key.str();
    raw["series"] = {
        {"commodity", model.key.commodity},
        {"region", model.key.region},
        {"market", model.key.market}
    };
    raw["trained_at_ms"] = model.trained_at_ms;
    raw["window"] = {{"first", model.window_first}, {"last", model.window_last}};
    raw["seasonal"] = seasonalToJson(model.seasonal);
    raw["linear"] = {{"intercept", model.linear.intercept}, {"slope", model.linear.slope}};
    raw["moving_average"] = {
        {"window", model.moving_average.window},
        {"value", model.moving_average.value}
    };

    nlohmann::json snapshot = nlohmann::json::array();
    for (const auto& sample : model.snapshot) {
        snapshot.push_back({{"date", sample.date}, {"price", sample.price}});
    }
    raw["snapshot"] = std::move(snapshot);
    return raw;
}

ModelArtifact ModelArtifactStoreJson::fromJson(const nlohmann::json& raw) {
    ModelArtifact artifact;
    artifact.schema_version = raw.at("schema_version").get<int>();
    artifact.saved_at_ms = raw.value("saved_at_ms", 0LL);

    auto& model = artifact.model;
    const auto series = raw.value("series", nlohmann::json::object());
    model.key.commodity = series.value("commodity", std::string());
    model.key.region = series.value("region", std::string());
    model.key.market = series.value("market", std::string("all"));
    model.trained_at_ms = raw.value("trained_at_ms", 0LL);

    const auto& window = raw.at("window");
    model.window_first = window.at("first").get<DayNumber>();
    model.window_last = window.at("last").get<DayNumber>();

    model.seasonal = seasonalFromJson(raw.value("seasonal", nlohmann::json::object()));

    const auto& linear = raw.at("linear");
    model.linear.intercept = linear.at("intercept").get<double>();
    model.linear.slope = linear.at("slope").get<double>();

    const auto& ma = raw.at("moving_average");
    model.moving_average.window = ma.at("window").get<std::size_t>();
    model.moving_average.value = ma.at("value").get<double>();

    for (const auto& item : raw.at("snapshot")) {
        SeriesSample sample;
        sample.date = item.at("date").get<DayNumber>();
        sample.price = item.at("price").get<double>();
        model.snapshot.push_back(sample);
    }
    return artifact;
}

std::optional<ModelArtifact> ModelArtifactStoreJson::load(const std::string& key) {
    const auto file_path = pathFor(key);
    if (!std::filesystem::exists(file_path)) {
        return std::nullopt;
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Model store: cannot open {}", file_path.string());
        return std::nullopt;
    }

    try {
        nlohmann::json raw;
        in >> raw;

        const int version = raw.value("schema_version", 0);
        if (version != ModelArtifact::kSchemaVersion) {
            LOG_WARN("Model store: {} has unsupported schema_version {}", file_path.string(), version);
            return std::nullopt;
        }
        if (raw.value("key", std::string()) != key) {
            LOG_WARN("Model store: {} holds key '{}', expected '{}'",
                     file_path.string(), raw.value("key", std::string()), key);
            return std::nullopt;
        }

        ModelArtifact artifact = fromJson(raw);
        if (artifact.model.snapshot.empty()) {
            LOG_WARN("Model store: {} has an empty snapshot", file_path.string());
            return std::nullopt;
        }
        return artifact;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Model store: corrupt artifact {}: {}", file_path.string(), e.what());
        return std::nullopt;
    }
}

bool ModelArtifactStoreJson::save(const std::string& key, const ModelArtifact& artifact) {
    const auto file_path = pathFor(key);
    nlohmann::json raw = toJson(artifact);
    raw["key"] = key;

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        LOG_ERROR("Model store: cannot create {}: {}", directory_.string(), ec.message());
        return false;
    }

    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Model store: cannot write {}", tmp_path.string());
            return false;
        }
        out << raw.dump(2);
        if (!out) {
            LOG_ERROR("Model store: short write to {}", tmp_path.string());
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (!ec) {
        return true;
    }

    // Some filesystems refuse rename over an existing file; fall back to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        LOG_ERROR("Model store: cannot replace {}: {}", file_path.string(), ec.message());
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace harvestcast
