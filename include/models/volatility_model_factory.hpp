/**
 * @file volatility_model_factory.hpp
 * @brief Factory for creating volatility models from configuration
 *
 * Lets callers select an estimator and its hyperparameters from JSON
 * instead of code.
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "volatility_model": {
 *     "type": "ewma",
 *     "ewma_lambda": 0.94
 *   }
 * }
 * @endcode
 *
 * @code{.json}
 * {
 *   "volatility_model": {
 *     "type": "rolling_window",
 *     "window": 63,
 *     "demean": true
 *   }
 * }
 * @endcode
 */

#pragma once

#include "models/volatility_model.hpp"
#include "models/ewma_volatility.hpp"
#include "models/rolling_window_volatility.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace volaframe
{
    namespace models
    {

        /**
         * @struct VolatilityModelConfig
         * @brief Configuration parameters for volatility model creation
         *
         * Holds the parameters of every supported model. Fields that do not
         * apply to the selected type are ignored.
         */
        struct VolatilityModelConfig
        {
            /**
             * @brief Type of volatility model
             *
             * Supported values (case-insensitive):
             * - "ewma": EWMAVolatility
             * - "rolling" or "rolling_window": RollingWindowVolatility
             */
            std::string type;

            /**
             * @brief EWMA decay parameter
             *
             * Used by: EWMAVolatility
             * Valid range: (0, 1)
             * Default: 0.94 (RiskMetrics standard)
             */
            double ewma_lambda = 0.94;

            /**
             * @brief Trailing window length in periods
             *
             * Used by: RollingWindowVolatility
             * Default: 21 (one trading month)
             */
            int window = 21;

            /**
             * @brief Demean each window and apply Bessel's correction
             *
             * Used by: RollingWindowVolatility
             */
            bool demean = false;

            /**
             * @brief Create configuration from JSON
             * @param j JSON object containing model configuration
             * @return VolatilityModelConfig structure
             * @throws volaframe::InvalidInput if "type" is missing or not a string
             * @throws nlohmann::json::exception if a field has the wrong JSON type
             *
             * Missing optional fields keep their defaults.
             */
            static VolatilityModelConfig from_json(const nlohmann::json &j);

            /**
             * @brief Convert configuration to JSON
             */
            nlohmann::json to_json() const;
        };

        /**
         * @class VolatilityModelFactory
         * @brief Factory for creating volatility model instances
         *
         * Usage Pattern:
         * @code
         * auto config = VolatilityModelConfig::from_json(doc["volatility_model"]);
         * auto model = VolatilityModelFactory::create(config);
         * Eigen::VectorXd forecast = model->fit(returns).predict(10);
         * @endcode
         */
        class VolatilityModelFactory
        {
        public:
            /**
             * @brief Create volatility model from configuration
             * @throws volaframe::InvalidInput if type is unknown or a
             *         hyperparameter is out of range
             */
            static std::unique_ptr<VolatilityModel> create(const VolatilityModelConfig &config);

            /**
             * @brief Create volatility model from type string and JSON parameters
             * @param type Model type
             * @param params JSON object with parameters, e.g. {"ewma_lambda": 0.97}
             * @throws volaframe::InvalidInput if type is unknown
             */
            static std::unique_ptr<VolatilityModel> create(
                const std::string &type,
                const nlohmann::json &params);

            static std::unique_ptr<VolatilityModel> create_ewma(double lambda = 0.94);

            static std::unique_ptr<VolatilityModel> create_rolling_window(
                int window = 21,
                bool demean = false);

            /**
             * @brief Get list of supported model types
             */
            static std::vector<std::string> get_supported_types();

        private:
            /**
             * @brief Normalize type string (lowercase, trim)
             */
            static std::string normalize_type(const std::string &type);
        };

    } // namespace models
} // namespace volaframe
