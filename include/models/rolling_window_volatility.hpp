/**
 * @file rolling_window_volatility.hpp
 * @brief Trailing fixed-window volatility model
 *
 * Estimates the variance at each time t from the last N returns only,
 * giving every observation inside the window equal weight and dropping
 * older observations entirely.
 *
 * Formula (demean = false, zero-mean convention):
 *     σ²_t = (1/k) * Σ_{s=t-k+1..t} r_s²
 *
 * Formula (demean = true, Bessel-corrected sample variance):
 *     σ²_t = (1/(k-1)) * Σ_{s=t-k+1..t} (r_s - mean_t)²
 *
 * where k = min(N, t + 1). The window expands during the first N-1
 * periods so every fitted index carries an estimate. With demean = true
 * the first index has a single observation and falls back to r_0².
 *
 * Forecasting holds the most recent window estimate flat.
 */

#pragma once

#include "models/volatility_model.hpp"

namespace volaframe
{
    namespace models
    {

        /**
         * @class RollingWindowVolatility
         * @brief Equal-weight trailing window volatility estimator
         *
         * Compared to EWMA, a shock keeps full weight for N periods and then
         * drops out abruptly ("ghost feature").
         *
         * Usage Example:
         * @code
         * RollingWindowVolatility rolling(21);  // one trading month
         * Eigen::VectorXd forecast = rolling.fit(returns).predict(5);
         * @endcode
         */
        class RollingWindowVolatility : public VolatilityModel
        {
        public:
            /**
             * @brief Construct rolling window volatility model
             * @param window Number of trailing returns per estimate (N >= 1)
             * @param demean Subtract the window mean and apply Bessel's correction
             * @throws volaframe::InvalidInput if window < 1, or window < 2 with demean
             *
             * Stored under parameter keys "window" and "demean" (0 or 1);
             * model name is "RollingWindow".
             */
            explicit RollingWindowVolatility(int window = 21, bool demean = false);

            ~RollingWindowVolatility() override = default;

            bool is_fitted() const override { return volatility_.size() > 0; }

            const Eigen::VectorXd &fitted_volatility() const override;

            /**
             * @brief In-sample windowed variance, one value per fitted return
             * @throws volaframe::NotFitted if the model is not fitted
             */
            const Eigen::VectorXd &fitted_variance() const;

            int get_window() const { return window_; }

            bool uses_demean() const { return demean_; }

        protected:
            /**
             * @brief Compute the windowed variance at every index
             *
             * Each window is computed directly rather than with running sums,
             * which keeps the demeaned estimate free of cancellation error.
             *
             * Time complexity: O(T * N)
             */
            void fit_series(const data::ReturnSeries &returns) override;

            Eigen::VectorXd forecast(int h) const override;

        private:
            int window_;
            bool demean_;
            Eigen::VectorXd variance_;
            Eigen::VectorXd volatility_;

            static int validate_window(int window, bool demean);
        };

    } // namespace models
} // namespace volaframe
