/**
 * @file volatility_model.cpp
 * @brief Implementation of VolatilityModel base class utilities
 */

#include "models/volatility_model.hpp"
#include "core/errors.hpp"
#include <utility>

namespace volaframe
{
    namespace models
    {

        VolatilityModel::VolatilityModel(std::string name, ParameterMap params)
            : name_(std::move(name)), params_(std::move(params))
        {
        }

        VolatilityModel &VolatilityModel::fit(const data::ReturnSeries &returns)
        {
            fit_series(returns);
            return *this;
        }

        Eigen::VectorXd VolatilityModel::predict(int h) const
        {
            ensure_fitted();
            validate_horizon(h);
            return forecast(h);
        }

        double VolatilityModel::get_param(const std::string &key) const
        {
            auto it = params_.find(key);
            if (it == params_.end())
            {
                throw InvalidInput("Model '" + name_ + "' has no parameter '" + key + "'");
            }
            return it->second;
        }

        void VolatilityModel::ensure_fitted() const
        {
            if (!is_fitted())
            {
                throw NotFitted("Model '" + name_ + "' has not been fitted; call fit() first.");
            }
        }

        void VolatilityModel::validate_horizon(int h)
        {
            if (h < 1)
            {
                throw InvalidInput(
                    "Forecast horizon h must be a positive integer, got: " + std::to_string(h));
            }
        }

    } // namespace models
} // namespace volaframe
