#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "models/ewma_volatility.hpp"
#include "models/rolling_window_volatility.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <memory>
#include <random>
#include <vector>

using namespace volaframe;
using namespace volaframe::models;
using Catch::Matchers::WithinAbs;

// Test fixture for shared test data
class VolatilityModelTestFixture
{
protected:
    // Three-point series used for hand-computed expectations
    std::vector<double> returns_3_{1.0, 2.0, 3.0};

    // Realistic daily returns (504 days, ~1% daily vol)
    Eigen::VectorXd returns_504_;

    VolatilityModelTestFixture()
    {
        returns_504_ = generate_synthetic_returns(504, 0.01, 42);
    }

    static Eigen::VectorXd generate_synthetic_returns(int n_obs, double daily_vol, unsigned seed)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(0.0, daily_vol);

        Eigen::VectorXd returns(n_obs);
        for (int t = 0; t < n_obs; ++t)
        {
            returns(t) = dist(gen);
        }
        return returns;
    }
};

TEST_CASE_METHOD(VolatilityModelTestFixture, "EWMAVolatility basic functionality", "[VolatilityModel][EWMAVolatility]")
{
    SECTION("Construct with default parameters")
    {
        EWMAVolatility ewma;
        REQUIRE_THAT(ewma.get_lambda(), WithinAbs(0.94, 1e-12));
        REQUIRE(ewma.get_name() == "EWMA");
        REQUIRE(ewma.get_params().size() == 1);
        REQUIRE_THAT(ewma.get_param("lambda"), WithinAbs(0.94, 1e-12));
        REQUIRE_THAT(ewma.get_effective_window(), WithinAbs(16.67, 0.1));
        REQUIRE_FALSE(ewma.is_fitted());
    }

    SECTION("Invalid lambda throws exception")
    {
        REQUIRE_THROWS_AS(EWMAVolatility(0.0), InvalidInput);
        REQUIRE_THROWS_AS(EWMAVolatility(1.0), InvalidInput);
        REQUIRE_THROWS_AS(EWMAVolatility(-0.5), InvalidInput);
        REQUIRE_THROWS_AS(EWMAVolatility(1.2), InvalidInput);
        REQUIRE_THROWS_AS(EWMAVolatility(std::nan("")), InvalidInput);

        // Also catchable as the standard base
        REQUIRE_THROWS_AS(EWMAVolatility(1.0), std::invalid_argument);
    }

    SECTION("Hand-computed recursion")
    {
        // var = {1.0, 0.9*1.0 + 0.1*4.0, 0.9*1.3 + 0.1*9.0} = {1.0, 1.3, 2.07}
        EWMAVolatility ewma(0.9);
        Eigen::VectorXd forecast = ewma.fit(returns_3_).predict(2);

        REQUIRE(forecast.size() == 2);
        REQUIRE_THAT(forecast(0), WithinAbs(std::sqrt(2.07), 1e-12));
        REQUIRE_THAT(forecast(0), WithinAbs(1.4387, 1e-4));
        REQUIRE(forecast(0) == forecast(1));

        const Eigen::VectorXd &variance = ewma.fitted_variance();
        REQUIRE(variance.size() == 3);
        REQUIRE_THAT(variance(0), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(variance(1), WithinAbs(1.3, 1e-12));
        REQUIRE_THAT(variance(2), WithinAbs(2.07, 1e-12));

        const Eigen::VectorXd &vol = ewma.fitted_volatility();
        REQUIRE_THAT(vol(1), WithinAbs(std::sqrt(1.3), 1e-12));
    }

    SECTION("Fluent chain on a braced list")
    {
        Eigen::VectorXd forecast = EWMAVolatility(0.9).fit({1.0, 2.0, 3.0}).predict(2);
        REQUIRE(forecast.size() == 2);
        REQUIRE_THAT(forecast(1), WithinAbs(1.4387, 1e-4));
    }

    SECTION("Forecast equals square root of final recursive variance")
    {
        for (double lambda : {0.5, 0.9, 0.94, 0.99})
        {
            EWMAVolatility ewma(lambda);
            ewma.fit(returns_504_);

            double var = returns_504_(0) * returns_504_(0);
            for (Eigen::Index t = 1; t < returns_504_.size(); ++t)
            {
                var = lambda * var + (1.0 - lambda) * returns_504_(t) * returns_504_(t);
            }

            Eigen::VectorXd forecast = ewma.predict(10);
            REQUIRE(forecast.size() == 10);
            for (Eigen::Index i = 0; i < forecast.size(); ++i)
            {
                REQUIRE_THAT(forecast(i), WithinAbs(std::sqrt(var), 1e-12));
            }
        }
    }

    SECTION("Default horizon is one period")
    {
        EWMAVolatility ewma;
        ewma.fit(returns_504_);
        REQUIRE(ewma.predict().size() == 1);
    }

    SECTION("Single observation seeds the recursion")
    {
        EWMAVolatility ewma(0.94);
        ewma.fit({-0.02});
        REQUIRE_THAT(ewma.predict(1)(0), WithinAbs(0.02, 1e-12));
    }

    SECTION("EWMA reacts to a recent volatility spike")
    {
        // Calm period followed by a short burst of large moves
        Eigen::VectorXd returns = returns_504_;
        for (Eigen::Index t = returns.size() - 5; t < returns.size(); ++t)
        {
            returns(t) *= 5.0;
        }

        EWMAVolatility fast(0.90);
        EWMAVolatility slow(0.99);
        double fast_vol = fast.fit(returns).predict(1)(0);
        double slow_vol = slow.fit(returns).predict(1)(0);

        REQUIRE(fast_vol > slow_vol);
    }

    SECTION("Weights decay geometrically")
    {
        EWMAVolatility ewma(0.94);
        REQUIRE_THAT(ewma.get_weight(0), WithinAbs(0.06, 1e-12));
        REQUIRE_THAT(ewma.get_weight(1), WithinAbs(0.06 * 0.94, 1e-12));
        REQUIRE(ewma.get_weight(10) < ewma.get_weight(9));
        REQUIRE_THROWS_AS(ewma.get_weight(-1), InvalidInput);
    }
}

TEST_CASE_METHOD(VolatilityModelTestFixture, "EWMAVolatility error handling", "[VolatilityModel][EWMAVolatility]")
{
    EWMAVolatility ewma(0.94);

    SECTION("Predict before fit")
    {
        REQUIRE_THROWS_AS(ewma.predict(), NotFitted);
        REQUIRE_THROWS_AS(ewma.predict(5), NotFitted);
        REQUIRE_THROWS_AS(ewma.fitted_volatility(), NotFitted);
        REQUIRE_THROWS_AS(ewma.fitted_variance(), NotFitted);
    }

    SECTION("Empty returns")
    {
        REQUIRE_THROWS_AS(ewma.fit(std::vector<double>{}), InvalidInput);
        REQUIRE_THROWS_AS(ewma.fit(Eigen::VectorXd()), InvalidInput);
        REQUIRE_FALSE(ewma.is_fitted());
        REQUIRE_THROWS_AS(ewma.predict(), NotFitted);
    }

    SECTION("Non-positive horizon")
    {
        ewma.fit(returns_3_);
        REQUIRE_THROWS_AS(ewma.predict(0), InvalidInput);
        REQUIRE_THROWS_AS(ewma.predict(-3), InvalidInput);
    }

    SECTION("Unknown parameter key")
    {
        REQUIRE_THROWS_AS(ewma.get_param("window"), InvalidInput);
    }

    SECTION("Failed fit keeps previous state")
    {
        ewma.fit(returns_3_);
        Eigen::VectorXd before = ewma.predict(3);

        std::vector<double> bad{0.01, std::nan(""), 0.02};
        REQUIRE_THROWS_AS(ewma.fit(bad), InvalidInput);

        REQUIRE(ewma.is_fitted());
        REQUIRE(ewma.predict(3) == before);
    }
}

TEST_CASE_METHOD(VolatilityModelTestFixture, "EWMAVolatility fitted state lifecycle", "[VolatilityModel][EWMAVolatility]")
{
    EWMAVolatility ewma(0.9);
    ewma.fit(returns_3_);

    SECTION("Predict is idempotent")
    {
        Eigen::VectorXd first = ewma.predict(4);
        Eigen::VectorXd second = ewma.predict(4);
        REQUIRE(first == second);
    }

    SECTION("Forecast is independent of later model changes")
    {
        Eigen::VectorXd forecast = ewma.predict(2);
        ewma.fit({10.0});
        REQUIRE_THAT(forecast(0), WithinAbs(std::sqrt(2.07), 1e-12));
    }

    SECTION("Re-fitting replaces prior state")
    {
        ewma.fit({0.5});
        REQUIRE(ewma.fitted_volatility().size() == 1);
        REQUIRE_THAT(ewma.predict(1)(0), WithinAbs(0.5, 1e-12));

        EWMAVolatility fresh(0.9);
        fresh.fit(returns_504_);
        ewma.fit(returns_504_);
        REQUIRE(ewma.predict(5) == fresh.predict(5));
    }
}

TEST_CASE_METHOD(VolatilityModelTestFixture, "RollingWindowVolatility basic functionality", "[VolatilityModel][RollingWindowVolatility]")
{
    SECTION("Construct with default parameters")
    {
        RollingWindowVolatility rolling;
        REQUIRE(rolling.get_window() == 21);
        REQUIRE_FALSE(rolling.uses_demean());
        REQUIRE(rolling.get_name() == "RollingWindow");
        REQUIRE_THAT(rolling.get_param("window"), WithinAbs(21.0, 1e-12));
        REQUIRE_THAT(rolling.get_param("demean"), WithinAbs(0.0, 1e-12));
    }

    SECTION("Invalid window throws exception")
    {
        REQUIRE_THROWS_AS(RollingWindowVolatility(0), InvalidInput);
        REQUIRE_THROWS_AS(RollingWindowVolatility(-5), InvalidInput);
        REQUIRE_THROWS_AS((RollingWindowVolatility(1, true)), InvalidInput);
        REQUIRE_NOTHROW(RollingWindowVolatility(1, false));
        REQUIRE_NOTHROW(RollingWindowVolatility(2, true));
    }

    SECTION("Mean of squared returns over trailing window")
    {
        // var = {1/1, (1+4)/2, (4+9)/2}
        RollingWindowVolatility rolling(2);
        Eigen::VectorXd forecast = rolling.fit(returns_3_).predict(3);

        const Eigen::VectorXd &variance = rolling.fitted_variance();
        REQUIRE_THAT(variance(0), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(variance(1), WithinAbs(2.5, 1e-12));
        REQUIRE_THAT(variance(2), WithinAbs(6.5, 1e-12));

        REQUIRE(forecast.size() == 3);
        for (Eigen::Index i = 0; i < forecast.size(); ++i)
        {
            REQUIRE_THAT(forecast(i), WithinAbs(std::sqrt(6.5), 1e-12));
        }
    }

    SECTION("Window longer than series expands over all data")
    {
        RollingWindowVolatility rolling(10);
        rolling.fit(returns_3_);
        REQUIRE_THAT(rolling.predict(1)(0), WithinAbs(std::sqrt(14.0 / 3.0), 1e-12));
    }

    SECTION("Demeaned sample variance with Bessel's correction")
    {
        // var = {1^2 fallback, var(1,2) = 0.5, var(1,2,3) = 1.0}
        RollingWindowVolatility rolling(3, true);
        rolling.fit(returns_3_);

        const Eigen::VectorXd &variance = rolling.fitted_variance();
        REQUIRE_THAT(variance(0), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(variance(1), WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(variance(2), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(rolling.predict(1)(0), WithinAbs(1.0, 1e-12));
    }

    SECTION("Old observations drop out of the window")
    {
        // A shock older than the window has no influence
        std::vector<double> returns{100.0, 0.01, -0.01, 0.01, -0.01};
        RollingWindowVolatility rolling(4);
        REQUIRE_THAT(rolling.fit(returns).predict(1)(0), WithinAbs(0.01, 1e-12));
    }

    SECTION("Full window matches direct computation on realistic data")
    {
        const int window = 63;
        RollingWindowVolatility rolling(window);
        rolling.fit(returns_504_);

        Eigen::VectorXd tail = returns_504_.tail(window);
        double expected = std::sqrt(tail.squaredNorm() / window);
        REQUIRE_THAT(rolling.predict(1)(0), WithinAbs(expected, 1e-12));
        REQUIRE_THAT(rolling.predict(1)(0), WithinAbs(0.01, 0.004));
    }
}

TEST_CASE_METHOD(VolatilityModelTestFixture, "RollingWindowVolatility error handling", "[VolatilityModel][RollingWindowVolatility]")
{
    RollingWindowVolatility rolling(5);

    SECTION("Predict before fit")
    {
        REQUIRE_THROWS_AS(rolling.predict(), NotFitted);
        REQUIRE_THROWS_AS(rolling.fitted_variance(), NotFitted);
    }

    SECTION("Empty returns")
    {
        REQUIRE_THROWS_AS(rolling.fit(std::vector<double>{}), InvalidInput);
    }

    SECTION("Non-positive horizon")
    {
        rolling.fit(returns_3_);
        REQUIRE_THROWS_AS(rolling.predict(0), InvalidInput);
        REQUIRE_THROWS_AS(rolling.predict(-3), InvalidInput);
    }

    SECTION("Re-fitting replaces prior state")
    {
        rolling.fit(returns_504_);
        rolling.fit({0.5});
        REQUIRE(rolling.fitted_volatility().size() == 1);
        REQUIRE_THAT(rolling.predict(1)(0), WithinAbs(0.5, 1e-12));
    }
}

TEST_CASE_METHOD(VolatilityModelTestFixture, "Models are interchangeable through the interface", "[VolatilityModel]")
{
    std::vector<std::unique_ptr<VolatilityModel>> models;
    models.push_back(std::make_unique<EWMAVolatility>(0.94));
    models.push_back(std::make_unique<RollingWindowVolatility>(21));

    for (auto &model : models)
    {
        REQUIRE_FALSE(model->is_fitted());
        REQUIRE_THROWS_AS(model->predict(1), NotFitted);

        Eigen::VectorXd forecast = model->fit(returns_504_).predict(5);
        REQUIRE(model->is_fitted());
        REQUIRE(model->fitted_volatility().size() == returns_504_.size());
        REQUIRE(forecast.size() == 5);
        REQUIRE(forecast(0) > 0.0);
        REQUIRE(forecast(4) == forecast(0));
        REQUIRE(forecast(0) == model->fitted_volatility()(returns_504_.size() - 1));
    }
}
