/**
 * @file ewma_volatility.cpp
 * @brief Implementation of EWMA volatility model
 */

#include "models/ewma_volatility.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <utility>

namespace volaframe
{
    namespace models
    {

        EWMAVolatility::EWMAVolatility(double lambda)
            : VolatilityModel("EWMA", {{"lambda", validate_lambda(lambda)}}),
              lambda_(lambda)
        {
        }

        double EWMAVolatility::validate_lambda(double lambda)
        {
            // Negated comparison so that NaN is rejected too
            if (!(lambda > 0.0 && lambda < 1.0))
            {
                throw InvalidInput(
                    "Lambda must be in the range (0, 1), got: " +
                    std::to_string(lambda));
            }
            return lambda;
        }

        void EWMAVolatility::fit_series(const data::ReturnSeries &returns)
        {
            const Eigen::Index n_obs = returns.size();
            const Eigen::VectorXd squared = returns.squared();
            const double one_minus_lambda = 1.0 - lambda_;

            Eigen::VectorXd variance(n_obs);

            // Seed the recursion with the first squared return
            variance(0) = squared(0);

            // σ²_t = λ * σ²_{t-1} + (1-λ) * r_t²
            for (Eigen::Index t = 1; t < n_obs; ++t)
            {
                variance(t) = lambda_ * variance(t - 1) + one_minus_lambda * squared(t);
            }

            volatility_ = variance.array().sqrt().matrix();
            variance_ = std::move(variance);
        }

        Eigen::VectorXd EWMAVolatility::forecast(int h) const
        {
            // Flat term structure at the last fitted volatility
            return Eigen::VectorXd::Constant(h, volatility_(volatility_.size() - 1));
        }

        const Eigen::VectorXd &EWMAVolatility::fitted_volatility() const
        {
            ensure_fitted();
            return volatility_;
        }

        const Eigen::VectorXd &EWMAVolatility::fitted_variance() const
        {
            ensure_fitted();
            return variance_;
        }

        double EWMAVolatility::get_weight(int i) const
        {
            if (i < 0)
            {
                throw InvalidInput(
                    "Lag must be non-negative, got: " + std::to_string(i));
            }

            // w_i = (1-λ) * λ^i
            return (1.0 - lambda_) * std::pow(lambda_, static_cast<double>(i));
        }

    } // namespace models
} // namespace volaframe
