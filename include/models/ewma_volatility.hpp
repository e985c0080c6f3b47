/**
 * @file ewma_volatility.hpp
 * @brief Exponentially Weighted Moving Average volatility model
 *
 * Estimates the conditional variance of a return series with the
 * RiskMetrics recursion, weighting recent squared returns more heavily
 * than older ones:
 *
 *     σ²_0 = r_0²
 *     σ²_t = λ * σ²_{t-1} + (1-λ) * r_t²
 *
 * where:
 * - λ is the decay factor (0 < λ < 1)
 * - r_t is the return at time t (not demeaned)
 *
 * The fitted volatility is σ_t = sqrt(σ²_t).
 *
 * Forecasting:
 * The recursion has no mean-reversion term, so the best forecast for every
 * future period is the last fitted volatility. predict(h) returns a flat
 * term structure of length h.
 *
 * Effective Window:
 *     N_eff = 1 / (1 - λ)
 *
 * Examples:
 * - λ = 0.94 → N_eff ≈ 17 days (RiskMetrics standard)
 * - λ = 0.97 → N_eff ≈ 33 days
 * - λ = 0.99 → N_eff ≈ 100 days
 *
 * References:
 * - J.P. Morgan (1996), "RiskMetrics Technical Document"
 */

#pragma once

#include "models/volatility_model.hpp"

namespace volaframe
{
    namespace models
    {

        /**
         * @class EWMAVolatility
         * @brief Exponentially weighted moving average volatility estimator
         *
         * Larger λ gives longer memory and smoother estimates; smaller λ
         * adapts faster to recent shocks.
         *
         * Usage Example:
         * @code
         * EWMAVolatility ewma(0.94);
         * Eigen::VectorXd forecast = ewma.fit(returns).predict(5);
         * std::cout << "Effective window: "
         *           << ewma.get_effective_window() << " days\n";
         * @endcode
         *
         * Thread Safety: Safe for concurrent predict() on a fitted instance
         */
        class EWMAVolatility : public VolatilityModel
        {
        public:
            /**
             * @brief Construct EWMA volatility model
             * @param lambda Decay factor (0 < λ < 1)
             * @throws volaframe::InvalidInput if lambda not in (0, 1)
             *
             * Stored under parameter key "lambda"; model name is "EWMA".
             */
            explicit EWMAVolatility(double lambda = 0.94);

            ~EWMAVolatility() override = default;

            bool is_fitted() const override { return volatility_.size() > 0; }

            const Eigen::VectorXd &fitted_volatility() const override;

            /**
             * @brief In-sample variance σ²_t, one value per fitted return
             * @throws volaframe::NotFitted if the model is not fitted
             */
            const Eigen::VectorXd &fitted_variance() const;

            /**
             * @brief Get decay parameter
             */
            double get_lambda() const { return lambda_; }

            /**
             * @brief Approximate number of observations with significant weight
             *
             * Formula: N_eff = 1 / (1 - λ)
             */
            double get_effective_window() const { return 1.0 / (1.0 - lambda_); }

            /**
             * @brief Weight of the squared return i periods ago
             * @param i Number of periods in the past (0 = current)
             * @return (1-λ) * λ^i
             * @throws volaframe::InvalidInput if i < 0
             */
            double get_weight(int i) const;

        protected:
            /**
             * @brief Run the variance recursion over the series
             *
             * Time complexity: O(T)
             */
            void fit_series(const data::ReturnSeries &returns) override;

            Eigen::VectorXd forecast(int h) const override;

        private:
            double lambda_;              ///< Decay factor (0 < λ < 1)
            Eigen::VectorXd variance_;   ///< Fitted σ²_t, empty until fit()
            Eigen::VectorXd volatility_; ///< Fitted σ_t, empty until fit()

            /**
             * @brief Validate lambda parameter
             * @throws volaframe::InvalidInput if lambda not in (0, 1)
             *
             * λ = 0 would keep only the latest squared return and λ = 1 would
             * never move off the seed value.
             */
            static double validate_lambda(double lambda);
        };

    } // namespace models
} // namespace volaframe
