/**
 * @file qlike.cpp
 * @brief Implementation of the QLIKE loss
 */

#include "metrics/qlike.hpp"
#include "core/errors.hpp"
#include <string>

namespace volaframe
{
    namespace metrics
    {

        namespace
        {
            // Render shapes the way array libraries print them: "(n,)" or "(r, c)"
            std::string format_shape(Eigen::Index size)
            {
                return "(" + std::to_string(size) + ",)";
            }

            std::string format_shape(Eigen::Index rows, Eigen::Index cols)
            {
                return "(" + std::to_string(rows) + ", " + std::to_string(cols) + ")";
            }

            void throw_shape_mismatch(const std::string &realized_shape,
                                      const std::string &forecast_shape)
            {
                throw ShapeMismatch(
                    "realized_var and forecast_var must have the same shape; got " +
                    realized_shape + " and " + forecast_shape + ".");
            }
        } // namespace

        Eigen::VectorXd qlike(const Eigen::VectorXd &realized_var,
                              const Eigen::VectorXd &forecast_var)
        {
            if (realized_var.size() != forecast_var.size())
            {
                throw_shape_mismatch(format_shape(realized_var.size()),
                                     format_shape(forecast_var.size()));
            }

            const Eigen::ArrayXd ratio = realized_var.array() / forecast_var.array();
            return (ratio - ratio.log() - 1.0).matrix();
        }

        Eigen::MatrixXd qlike(const Eigen::MatrixXd &realized_var,
                              const Eigen::MatrixXd &forecast_var)
        {
            if (realized_var.rows() != forecast_var.rows() ||
                realized_var.cols() != forecast_var.cols())
            {
                throw_shape_mismatch(format_shape(realized_var.rows(), realized_var.cols()),
                                     format_shape(forecast_var.rows(), forecast_var.cols()));
            }

            const Eigen::ArrayXXd ratio = realized_var.array() / forecast_var.array();
            return (ratio - ratio.log() - 1.0).matrix();
        }

        double mean_qlike(const Eigen::VectorXd &realized_var,
                          const Eigen::VectorXd &forecast_var)
        {
            Eigen::VectorXd loss = qlike(realized_var, forecast_var);
            if (loss.size() == 0)
            {
                throw InvalidInput("Cannot average QLIKE over empty series.");
            }
            return loss.mean();
        }

        Eigen::VectorXd volatility_to_variance(const Eigen::VectorXd &volatility)
        {
            return volatility.array().square().matrix();
        }

    } // namespace metrics
} // namespace volaframe
