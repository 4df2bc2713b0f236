#include "SyncConfig.h"

#include <string>

#include <toml++/toml.hpp>

#include "Logging.h"
#include "PathUtils.h"

namespace PSYNC::Core {
    namespace {
        constexpr const char *kLogCategory = "config";

        PSYNC_Result SetLoadError(ConfigLoadError &error,
                                  std::string_view source,
                                  PSYNC_Result code,
                                  const std::string &message) {
            error.code = code;
            error.message = message;
            if (!source.empty())
                error.file = std::string(source);
            return code;
        }

        struct ThresholdField {
            const char *key;
            double Color::ThresholdConfig::*member;
            double min;
            double max;
        };

        struct FallbackField {
            const char *key;
            Color::Color Color::FallbackColors::*member;
        };

        constexpr double kUnbounded = 1.0e300;

        const ThresholdField kThresholdFields[] = {
            {"background_luminance", &Color::ThresholdConfig::background_luminance, 0.0, 1.0},
            {"saturation_boost", &Color::ThresholdConfig::saturation_boost, 1.0, kUnbounded},
            {"max_accent_luminance", &Color::ThresholdConfig::max_accent_luminance, 0.0, 1.0},
            {"min_accent_contrast", &Color::ThresholdConfig::min_accent_contrast, 1.0, 21.0},
            {"contrast_floor_luminance", &Color::ThresholdConfig::contrast_floor_luminance, 0.0, 1.0},
        };

        const FallbackField kFallbackFields[] = {
            {"foreground", &Color::FallbackColors::foreground},
            {"background", &Color::FallbackColors::background},
            {"red", &Color::FallbackColors::red},
            {"green", &Color::FallbackColors::green},
            {"yellow", &Color::FallbackColors::yellow},
            {"blue", &Color::FallbackColors::blue},
            {"purple", &Color::FallbackColors::purple},
            {"aqua", &Color::FallbackColors::aqua},
        };

        bool ReadNumber(const toml::node &node, double &out) {
            if (auto *integer = node.as_integer()) {
                out = static_cast<double>(integer->get());
                return true;
            }
            if (auto *floating = node.as_floating_point()) {
                out = floating->get();
                return true;
            }
            return false;
        }

        bool ReadString(const toml::node *node, std::string &out) {
            if (!node)
                return false;
            if (auto val = node->value<std::string_view>()) {
                out.assign(val->begin(), val->end());
                return true;
            }
            return false;
        }

        template <typename Field, size_t N>
        bool IsKnownKey(const Field (&fields)[N], std::string_view key) {
            for (const auto &field : fields) {
                if (key == field.key)
                    return true;
            }
            return false;
        }

        void WarnUnknownKeys(const toml::table &table, std::string_view tableName, std::string_view source,
                             bool (*known)(std::string_view)) {
            for (const auto &[key, value] : table) {
                (void) value;
                if (!known(key.str())) {
                    CoreLog(PSYNC_LOG_WARN, kLogCategory, "%.*s: ignoring unknown key [%.*s].%.*s",
                            static_cast<int>(source.size()), source.data(),
                            static_cast<int>(tableName.size()), tableName.data(),
                            static_cast<int>(key.str().size()), key.str().data());
                }
            }
        }

        PSYNC_Result PopulateThresholds(const toml::table &table,
                                        Color::ThresholdConfig &out,
                                        ConfigLoadError &error,
                                        std::string_view source) {
            for (const auto &field : kThresholdFields) {
                const toml::node *node = table.get(field.key);
                if (!node)
                    continue;

                double value = 0.0;
                if (!ReadNumber(*node, value)) {
                    return SetLoadError(error, source, PSYNC_RESULT_CONFIG_TYPE_MISMATCH,
                                        std::string("[thresholds] ") + field.key + " must be a number");
                }
                if (!(value >= field.min && value <= field.max)) {
                    return SetLoadError(error, source, PSYNC_RESULT_CONFIG_VALUE_OUT_OF_RANGE,
                                        std::string("[thresholds] ") + field.key + " is out of range: " +
                                        std::to_string(value));
                }
                out.*field.member = value;
            }

            WarnUnknownKeys(table, "thresholds", source, [](std::string_view key) {
                return IsKnownKey(kThresholdFields, key);
            });
            return PSYNC_RESULT_OK;
        }

        PSYNC_Result PopulateFallback(const toml::table &table,
                                      Color::FallbackColors &out,
                                      ConfigLoadError &error,
                                      std::string_view source) {
            for (const auto &field : kFallbackFields) {
                const toml::node *node = table.get(field.key);
                if (!node)
                    continue;

                std::string text;
                if (!ReadString(node, text)) {
                    return SetLoadError(error, source, PSYNC_RESULT_CONFIG_TYPE_MISMATCH,
                                        std::string("[fallback] ") + field.key + " must be a string");
                }
                auto color = Color::ParseHexColor(text);
                if (!color) {
                    return SetLoadError(error, source, PSYNC_RESULT_CONFIG_TYPE_MISMATCH,
                                        std::string("[fallback] ") + field.key + " is not a #rrggbb color: " + text);
                }
                out.*field.member = *color;
            }

            WarnUnknownKeys(table, "fallback", source, [](std::string_view key) {
                return IsKnownKey(kFallbackFields, key);
            });
            return PSYNC_RESULT_OK;
        }

        PSYNC_Result PopulateOutput(const toml::table &table,
                                    SyncConfig &out,
                                    ConfigLoadError &error,
                                    std::string_view source) {
            if (const toml::node *node = table.get("palette_name")) {
                std::string name;
                if (!ReadString(node, name)) {
                    return SetLoadError(error, source, PSYNC_RESULT_CONFIG_TYPE_MISMATCH,
                                        "[output] palette_name must be a string");
                }
                if (!IsValidPaletteName(name)) {
                    return SetLoadError(error, source, PSYNC_RESULT_CONFIG_VALUE_OUT_OF_RANGE,
                                        "[output] palette_name must match [A-Za-z0-9_-]+: '" + name + "'");
                }
                out.palette_name = std::move(name);
            }

            WarnUnknownKeys(table, "output", source, [](std::string_view key) {
                return key == "palette_name";
            });
            return PSYNC_RESULT_OK;
        }

        // Tables are optional, but a present key must hold a table.
        const toml::table *GetTable(const toml::table &root, const char *name, bool &wrongType) {
            wrongType = false;
            const toml::node *node = root.get(name);
            if (!node)
                return nullptr;
            const toml::table *table = node->as_table();
            if (!table)
                wrongType = true;
            return table;
        }
    } // namespace

    bool IsValidPaletteName(std::string_view name) {
        if (name.empty())
            return false;
        for (char c : name) {
            const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '_' || c == '-';
            if (!ok)
                return false;
        }
        return true;
    }

    PSYNC_Result SyncConfigLoader::LoadFile(const std::string &path,
                                            SyncConfig &out_config,
                                            ConfigLoadError &out_error) const {
        if (path.empty() || !utils::FileExistsUtf8(path)) {
            CoreLog(PSYNC_LOG_DEBUG, kLogCategory, "No config at '%s', using defaults", path.c_str());
            return PSYNC_RESULT_OK;
        }

        std::string text;
        if (!utils::ReadTextFileUtf8(path, text)) {
            return SetLoadError(out_error, path, PSYNC_RESULT_IO_ERROR, "Failed to read config file");
        }
        return LoadString(text, path, out_config, out_error);
    }

    PSYNC_Result SyncConfigLoader::LoadString(std::string_view text,
                                              std::string_view source_path,
                                              SyncConfig &out_config,
                                              ConfigLoadError &out_error) const {
        toml::table root;
        try {
            root = toml::parse(text, source_path);
        } catch (const toml::parse_error &err) {
            out_error.code = PSYNC_RESULT_CONFIG_PARSE_ERROR;
            out_error.message = std::string(err.description());
            if (!source_path.empty())
                out_error.file = std::string(source_path);
            const auto &source = err.source();
            out_error.line = static_cast<int>(source.begin.line);
            out_error.column = static_cast<int>(source.begin.column);
            return out_error.code;
        }

        // Work on a copy so a failed load leaves the caller's config untouched
        SyncConfig config = out_config;
        bool wrongType = false;

        if (const auto *table = GetTable(root, "thresholds", wrongType)) {
            PSYNC_CHECK(PopulateThresholds(*table, config.thresholds, out_error, source_path));
        } else if (wrongType) {
            return SetLoadError(out_error, source_path, PSYNC_RESULT_CONFIG_TYPE_MISMATCH,
                                "[thresholds] must be a table");
        }

        if (const auto *table = GetTable(root, "fallback", wrongType)) {
            PSYNC_CHECK(PopulateFallback(*table, config.fallback, out_error, source_path));
        } else if (wrongType) {
            return SetLoadError(out_error, source_path, PSYNC_RESULT_CONFIG_TYPE_MISMATCH,
                                "[fallback] must be a table");
        }

        if (const auto *table = GetTable(root, "output", wrongType)) {
            PSYNC_CHECK(PopulateOutput(*table, config, out_error, source_path));
        } else if (wrongType) {
            return SetLoadError(out_error, source_path, PSYNC_RESULT_CONFIG_TYPE_MISMATCH,
                                "[output] must be a table");
        }

        out_config = std::move(config);
        CoreLog(PSYNC_LOG_DEBUG, kLogCategory,
                "Loaded config: threshold=%.4f boost=%.4f ceiling=%.4f contrast=%.4f floor=%.4f palette=%s",
                out_config.thresholds.background_luminance,
                out_config.thresholds.saturation_boost,
                out_config.thresholds.max_accent_luminance,
                out_config.thresholds.min_accent_contrast,
                out_config.thresholds.contrast_floor_luminance,
                out_config.palette_name.c_str());
        return PSYNC_RESULT_OK;
    }
} // namespace PSYNC::Core
