#ifndef TIME_GRID_HPP
#define TIME_GRID_HPP

#include <vector>
#include <cstddef>

namespace compartmental {

    /**
     * @class TimeGrid
     * @brief Strictly increasing, finite sequence of output time points.
     */
    class TimeGrid {
    public:
        /// Largest number of points uniform() will generate.
        static constexpr std::size_t kMaxPoints = 10000000;

        /**
         * @throws ConfigurationException If `points` is empty, contains a non-finite value,
         *         or is not strictly increasing.
         */
        explicit TimeGrid(std::vector<double> points);

        /**
         * @brief Points start, start+step, start+2*step, ... up to and including `end`.
         *
         * The last point is included when it lies within 1e-9*step of `end`, and is then
         * snapped to `end` exactly. When (end - start) is not a multiple of `step` the grid
         * stops at the last point below `end`.
         *
         * @throws ConfigurationException If `step` is not positive, `end` is not greater than
         *         `start`, `step` exceeds `end - start`, any argument is not finite, or the grid would
         *         hold more than kMaxPoints points.
         */
        static TimeGrid uniform(double start, double end, double step);

        const std::vector<double>& getPoints() const { return points_; }
        std::size_t size() const { return points_.size(); }
        double front() const { return points_.front(); }
        double back() const { return points_.back(); }
        double operator[](std::size_t i) const { return points_[i]; }

    private:
        std::vector<double> points_;
    };

} // namespace compartmental

#endif // TIME_GRID_HPP
