#include "compartmental/TimeGrid.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <string>
#include <utility>

namespace compartmental {

    TimeGrid::TimeGrid(std::vector<double> points)
        : points_(std::move(points))
    {
        if (points_.empty()) {
            THROW_CONFIGURATION_ERROR("TimeGrid::TimeGrid", "Time grid cannot be empty.");
        }
        for (std::size_t i = 0; i < points_.size(); ++i) {
            if (!std::isfinite(points_[i])) {
                THROW_CONFIGURATION_ERROR("TimeGrid::TimeGrid",
                                          "Time grid point " + std::to_string(i) + " is not finite.");
            }
            if (i > 0 && points_[i] <= points_[i - 1]) {
                THROW_CONFIGURATION_ERROR("TimeGrid::TimeGrid",
                                          "Time points must be strictly increasing. Found " +
                                          std::to_string(points_[i]) + " after " +
                                          std::to_string(points_[i - 1]) + ".");
            }
        }
    }

    TimeGrid TimeGrid::uniform(double start, double end, double step) {
        if (!std::isfinite(start) || !std::isfinite(end) || !std::isfinite(step)) {
            THROW_CONFIGURATION_ERROR("TimeGrid::uniform", "Start, end and step must be finite.");
        }
        if (step <= 0.0) {
            THROW_CONFIGURATION_ERROR("TimeGrid::uniform", "Step must be positive. Got: " + std::to_string(step));
        }
        if (end <= start) {
            THROW_CONFIGURATION_ERROR("TimeGrid::uniform",
                                      "End time (" + std::to_string(end) + ") must be greater than start time (" +
                                      std::to_string(start) + ").");
        }
        if (step > end - start) {
            THROW_CONFIGURATION_ERROR("TimeGrid::uniform",
                                      "Step (" + std::to_string(step) + ") cannot exceed the horizon (" +
                                      std::to_string(end - start) + ").");
        }

        const double slack = 1e-9 * step;
        const double intervals = std::floor((end - start + slack) / step);
        if (!std::isfinite(intervals) || intervals + 1.0 > static_cast<double>(kMaxPoints)) {
            THROW_CONFIGURATION_ERROR("TimeGrid::uniform",
                                      "Horizon " + std::to_string(end - start) + " with step " + std::to_string(step) +
                                      " needs more than " + std::to_string(kMaxPoints) + " output points.");
        }
        const auto count = static_cast<std::size_t>(intervals) + 1;

        std::vector<double> points;
        points.reserve(count);
        for (std::size_t k = 0; k < count; ++k) {
            points.push_back(start + static_cast<double>(k) * step);
        }
        if (std::fabs(points.back() - end) <= slack) {
            points.back() = end;
        }
        return TimeGrid(std::move(points));
    }

} // namespace compartmental
