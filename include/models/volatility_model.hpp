/**
 * @file volatility_model.hpp
 * @brief Abstract interface for volatility forecasting models
 *
 * Provides a common fit/predict lifecycle for estimators of the
 * conditional volatility of a single return series. Concrete models
 * implement the estimation recursion and the forecast path; this class
 * owns argument checking and the method-chaining surface.
 *
 * Thread Safety: predict() is const and safe to call concurrently on a
 * fitted instance. fit() must not overlap with any other call on the
 * same instance.
 */

#pragma once

#include "data/return_series.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>

namespace volaframe
{
    namespace models
    {

        /**
         * @class VolatilityModel
         * @brief Abstract base class for volatility forecasting models
         *
         * Concrete implementations include EWMAVolatility and
         * RollingWindowVolatility.
         *
         * Usage Example:
         * @code
         * auto model = std::make_unique<EWMAVolatility>(0.94);
         * Eigen::VectorXd forecast = model->fit(returns).predict(10);
         * @endcode
         */
        class VolatilityModel
        {
        public:
            using ParameterMap = std::map<std::string, double>;

            virtual ~VolatilityModel() = default;

            /**
             * @brief Fit the model on a historical return series
             * @param returns Validated returns in time order
             * @return *this, so that fit(...).predict(...) can be chained
             *
             * Re-fitting replaces all previously fitted state. Empty or
             * non-finite input is rejected with volaframe::InvalidInput
             * when the ReturnSeries is built, before any state changes.
             */
            VolatilityModel &fit(const data::ReturnSeries &returns);

            /**
             * @brief Forecast volatility for the next h periods
             * @param h Forecast horizon (number of periods), must be >= 1
             * @return Vector of length h, one volatility per future period
             * @throws volaframe::NotFitted if fit() has not succeeded yet
             * @throws volaframe::InvalidInput if h < 1
             */
            Eigen::VectorXd predict(int h = 1) const;

            /**
             * @brief Get the model name
             */
            const std::string &get_name() const { return name_; }

            /**
             * @brief Get hyperparameters as passed at construction
             */
            const ParameterMap &get_params() const { return params_; }

            /**
             * @brief Look up one hyperparameter
             * @throws volaframe::InvalidInput if key is not a parameter of this model
             */
            double get_param(const std::string &key) const;

            /**
             * @brief Whether fit() has completed successfully
             */
            virtual bool is_fitted() const = 0;

            /**
             * @brief In-sample volatility, one value per fitted return
             * @throws volaframe::NotFitted if the model is not fitted
             */
            virtual const Eigen::VectorXd &fitted_volatility() const = 0;

        protected:
            /**
             * @brief Store name and hyperparameters verbatim
             *
             * No validation is performed here; each concrete model checks
             * its own hyperparameters.
             */
            VolatilityModel(std::string name, ParameterMap params);

            /**
             * @brief Compute and store fitted state for a validated series
             */
            virtual void fit_series(const data::ReturnSeries &returns) = 0;

            /**
             * @brief Produce the forecast path
             * @param h Horizon, already checked to be >= 1
             *
             * Only called on a fitted model.
             */
            virtual Eigen::VectorXd forecast(int h) const = 0;

            /**
             * @brief Throw NotFitted unless the model is fitted
             */
            void ensure_fitted() const;

            /**
             * @brief Validate forecast horizon
             * @throws volaframe::InvalidInput if h < 1
             */
            static void validate_horizon(int h);

        private:
            std::string name_;
            ParameterMap params_;
        };

    } // namespace models
} // namespace volaframe
