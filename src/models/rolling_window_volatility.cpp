/**
 * @file rolling_window_volatility.cpp
 * @brief Implementation of rolling window volatility model
 */

#include "models/rolling_window_volatility.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <utility>

namespace volaframe
{
    namespace models
    {

        RollingWindowVolatility::RollingWindowVolatility(int window, bool demean)
            : VolatilityModel("RollingWindow",
                              {{"window", static_cast<double>(validate_window(window, demean))},
                               {"demean", demean ? 1.0 : 0.0}}),
              window_(window),
              demean_(demean)
        {
        }

        int RollingWindowVolatility::validate_window(int window, bool demean)
        {
            if (window < 1)
            {
                throw InvalidInput(
                    "Window must be at least 1, got: " + std::to_string(window));
            }

            // Bessel's correction needs two observations per full window
            if (demean && window < 2)
            {
                throw InvalidInput(
                    "Window must be at least 2 when demean is enabled, got: " +
                    std::to_string(window));
            }
            return window;
        }

        void RollingWindowVolatility::fit_series(const data::ReturnSeries &returns)
        {
            const Eigen::VectorXd &r = returns.values();
            const Eigen::Index n_obs = r.size();
            const Eigen::Index window = static_cast<Eigen::Index>(window_);

            Eigen::VectorXd variance(n_obs);

            for (Eigen::Index t = 0; t < n_obs; ++t)
            {
                // Expanding window until N observations are available
                const Eigen::Index start = std::max<Eigen::Index>(0, t - window + 1);
                const Eigen::Index k = t - start + 1;
                const auto segment = r.segment(start, k);

                if (!demean_)
                {
                    variance(t) = segment.squaredNorm() / static_cast<double>(k);
                }
                else if (k < 2)
                {
                    variance(t) = r(t) * r(t);
                }
                else
                {
                    const double mean = segment.mean();
                    const double sum_sq = (segment.array() - mean).square().sum();
                    variance(t) = sum_sq / static_cast<double>(k - 1);
                }
            }

            volatility_ = variance.array().sqrt().matrix();
            variance_ = std::move(variance);
        }

        Eigen::VectorXd RollingWindowVolatility::forecast(int h) const
        {
            return Eigen::VectorXd::Constant(h, volatility_(volatility_.size() - 1));
        }

        const Eigen::VectorXd &RollingWindowVolatility::fitted_volatility() const
        {
            ensure_fitted();
            return volatility_;
        }

        const Eigen::VectorXd &RollingWindowVolatility::fitted_variance() const
        {
            ensure_fitted();
            return variance_;
        }

    } // namespace models
} // namespace volaframe
