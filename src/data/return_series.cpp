/**
 * @file return_series.cpp
 * @brief Implementation of the validated return series container
 */

#include "data/return_series.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <string>

namespace volaframe
{
    namespace data
    {

        ReturnSeries::ReturnSeries(const Eigen::VectorXd &values)
            : values_(values)
        {
            validate();
        }

        ReturnSeries::ReturnSeries(const std::vector<double> &values)
            : values_(Eigen::Map<const Eigen::VectorXd>(values.data(),
                                                        static_cast<Eigen::Index>(values.size())))
        {
            validate();
        }

        ReturnSeries::ReturnSeries(std::initializer_list<double> values)
            : values_(static_cast<Eigen::Index>(values.size()))
        {
            Eigen::Index t = 0;
            for (double v : values)
            {
                values_(t++) = v;
            }
            validate();
        }

        Eigen::VectorXd ReturnSeries::squared() const
        {
            return values_.array().square().matrix();
        }

        void ReturnSeries::validate() const
        {
            if (values_.size() == 0)
            {
                throw InvalidInput("returns must contain at least one observation.");
            }

            for (Eigen::Index t = 0; t < values_.size(); ++t)
            {
                if (!std::isfinite(values_(t)))
                {
                    throw InvalidInput(
                        "returns must be finite; found " + std::to_string(values_(t)) +
                        " at index " + std::to_string(t));
                }
            }
        }

    } // namespace data
} // namespace volaframe
