/**
 * @file qlike.hpp
 * @brief QLIKE loss for evaluating variance forecasts
 *
 * For a realized variance r and a forecast variance f the quasi-likelihood
 * loss is
 *
 *     QLIKE(r, f) = r/f - ln(r/f) - 1
 *
 * It is zero when f == r, always non-negative for positive inputs, and
 * penalizes under-prediction of variance more heavily than
 * over-prediction. QLIKE is robust to noise in the realized-variance
 * proxy (Patton, 2011), which makes it the usual choice for ranking
 * volatility models.
 *
 * Inputs are not checked for positivity. A zero forecast or a
 * non-positive ratio yields inf or NaN in the corresponding output
 * element, following IEEE-754 semantics.
 *
 * References:
 * - Patton (2011), "Volatility forecast comparison using imperfect
 *   volatility proxies", Journal of Econometrics 160(1)
 */

#pragma once

#include <Eigen/Dense>

namespace volaframe
{
    namespace metrics
    {

        /**
         * @brief Elementwise QLIKE loss between two variance series
         * @param realized_var Realized variances (e.g. squared returns)
         * @param forecast_var Forecast variances, same length as realized_var
         * @return Freshly allocated loss vector, same length as the inputs
         * @throws volaframe::ShapeMismatch if the lengths differ
         *
         * Example:
         * @code
         * // One-step-ahead: forecast for t+1 made with data up to t
         * Eigen::VectorXd realized = returns.tail(n - 1).array().square();
         * Eigen::VectorXd forecast = volatility_to_variance(model.fitted_volatility().head(n - 1));
         * Eigen::VectorXd loss = qlike(realized, forecast);
         * @endcode
         */
        Eigen::VectorXd qlike(const Eigen::VectorXd &realized_var,
                              const Eigen::VectorXd &forecast_var);

        /**
         * @brief Elementwise QLIKE loss for two-dimensional arrays
         * @throws volaframe::ShapeMismatch if rows or columns differ
         *
         * Useful for scoring several horizons or several models at once
         * (one column each). Pass named Eigen objects: an unevaluated
         * expression converts equally well to either overload.
         */
        Eigen::MatrixXd qlike(const Eigen::MatrixXd &realized_var,
                              const Eigen::MatrixXd &forecast_var);

        /**
         * @brief Average QLIKE loss over all elements
         * @throws volaframe::ShapeMismatch if the lengths differ
         * @throws volaframe::InvalidInput if the inputs are empty
         */
        double mean_qlike(const Eigen::VectorXd &realized_var,
                          const Eigen::VectorXd &forecast_var);

        /**
         * @brief Square a volatility series into a variance series
         *
         * Models forecast volatility (standard deviation); QLIKE scores
         * variance.
         */
        Eigen::VectorXd volatility_to_variance(const Eigen::VectorXd &volatility);

    } // namespace metrics
} // namespace volaframe
