/**
 * @file volatility_model_factory.cpp
 * @brief Implementation of volatility model factory
 */

#include "models/volatility_model_factory.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace volaframe
{
    namespace models
    {

        // VolatilityModelConfig implementation
        VolatilityModelConfig VolatilityModelConfig::from_json(const nlohmann::json &doc)
        {
            VolatilityModelConfig config;

            // Type (required)
            if (!doc.is_object() || !doc.contains("type") || !doc["type"].is_string())
            {
                throw InvalidInput("Volatility model configuration must specify 'type'");
            }

            config.type = doc["type"].get<std::string>();

            if (doc.contains("ewma_lambda"))
            {
                config.ewma_lambda = doc["ewma_lambda"].get<double>();
            }

            if (doc.contains("window"))
            {
                config.window = doc["window"].get<int>();
            }

            if (doc.contains("demean"))
            {
                config.demean = doc["demean"].get<bool>();
            }

            return config;
        }

        nlohmann::json VolatilityModelConfig::to_json() const
        {
            return nlohmann::json{
                {"type", type},
                {"ewma_lambda", ewma_lambda},
                {"window", window},
                {"demean", demean}};
        }

        // VolatilityModelFactory implementation
        std::string VolatilityModelFactory::normalize_type(const std::string &type)
        {
            const auto first = type.find_first_not_of(" \t\n\r");
            if (first == std::string::npos)
            {
                return "";
            }
            const auto last = type.find_last_not_of(" \t\n\r");
            std::string normalized = type.substr(first, last - first + 1);

            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return normalized;
        }

        std::unique_ptr<VolatilityModel> VolatilityModelFactory::create(const VolatilityModelConfig &config)
        {
            std::string type = normalize_type(config.type);

            if (type == "ewma")
            {
                return std::make_unique<EWMAVolatility>(config.ewma_lambda);
            }
            else if (type == "rolling" || type == "rolling_window")
            {
                return std::make_unique<RollingWindowVolatility>(config.window, config.demean);
            }
            else
            {
                throw InvalidInput(
                    "Unknown volatility model type: '" + config.type + "'. "
                    "Valid options: ewma, rolling_window");
            }
        }

        std::unique_ptr<VolatilityModel> VolatilityModelFactory::create(const std::string &type, const nlohmann::json &params)
        {
            nlohmann::json config_json = params.is_null() ? nlohmann::json::object() : params;
            config_json["type"] = type;

            VolatilityModelConfig config = VolatilityModelConfig::from_json(config_json);
            return create(config);
        }

        std::unique_ptr<VolatilityModel> VolatilityModelFactory::create_ewma(double lambda)
        {
            return std::make_unique<EWMAVolatility>(lambda);
        }

        std::unique_ptr<VolatilityModel> VolatilityModelFactory::create_rolling_window(int window, bool demean)
        {
            return std::make_unique<RollingWindowVolatility>(window, demean);
        }

        std::vector<std::string> VolatilityModelFactory::get_supported_types()
        {
            return {
                "ewma",
                "rolling",
                "rolling_window"};
        }

    } // namespace models
} // namespace volaframe
