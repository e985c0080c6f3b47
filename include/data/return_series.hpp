/**
 * @file return_series.hpp
 * @brief Validated container for a single-asset return series
 *
 * Every estimator consumes returns through this type. Construction is the
 * single point where raw input is checked, so a ReturnSeries that exists
 * is always non-empty and finite.
 */

#pragma once

#include <Eigen/Dense>
#include <initializer_list>
#include <vector>

namespace volaframe
{
    namespace data
    {

        /**
         * @class ReturnSeries
         * @brief Time-ordered, non-empty, finite sequence of returns
         *
         * Holds its own copy of the values; the source container may be
         * discarded after construction.
         *
         * The converting constructors are intentionally implicit so that
         * callers can hand an Eigen vector, a std::vector or a braced list
         * straight to VolatilityModel::fit:
         * @code
         * EWMAVolatility model(0.94);
         * model.fit({0.012, -0.008, 0.021});
         * model.fit(returns_eigen);
         * @endcode
         *
         * Thread Safety: Immutable after construction
         */
        class ReturnSeries
        {
        public:
            /**
             * @brief Construct from an Eigen vector
             * @param values Returns in time order
             * @throws volaframe::InvalidInput if values is empty or contains NaN/Inf
             */
            ReturnSeries(const Eigen::VectorXd &values);

            /**
             * @brief Construct from a std::vector
             * @throws volaframe::InvalidInput if values is empty or contains NaN/Inf
             */
            ReturnSeries(const std::vector<double> &values);

            /**
             * @brief Construct from a braced list of returns
             * @throws volaframe::InvalidInput if the list is empty or contains NaN/Inf
             */
            ReturnSeries(std::initializer_list<double> values);

            ~ReturnSeries() = default;

            /**
             * @brief Underlying values
             */
            const Eigen::VectorXd &values() const { return values_; }

            /**
             * @brief Number of observations (always >= 1)
             */
            Eigen::Index size() const { return values_.size(); }

            /**
             * @brief Return at position t
             */
            double operator[](Eigen::Index t) const { return values_(t); }

            /**
             * @brief Squared returns r_t^2
             */
            Eigen::VectorXd squared() const;

        private:
            Eigen::VectorXd values_;

            /**
             * @brief Validate stored values
             * @throws volaframe::InvalidInput if validation fails
             */
            void validate() const;
        };

    } // namespace data
} // namespace volaframe
