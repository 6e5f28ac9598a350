#pragma once

#include "gevrisk/core/structure.hpp"

#include <cstddef>
#include <vector>

namespace gevrisk::core {

inline constexpr std::size_t kWindowLength = 30;
inline constexpr std::size_t kFullSpanLength = 50;

/**
 * @struct WindowSpec
 * @brief Position of one analysis window inside an observation series.
 */
struct WindowSpec {
	std::size_t index = 0; ///< zero-based window number
	std::size_t start = 0;
	std::size_t length = 0;
	bool full_span = false;

	std::size_t end() const {
		return start + length;
	}
};

/**
 * @class WindowPlan
 * @brief Geometry of the rolling analysis: (span / step) + 1 sliding windows of
 * window_length observations advanced by step, followed by one window over the
 * first full_span_length observations.
 *
 * span = full_span_length - window_length, 20 with the standard lengths.
 */
class WindowPlan {
public:
	/**
	 * @throws std::invalid_argument if step is zero or window_length exceeds
	 * full_span_length.
	 */
	explicit WindowPlan(std::size_t step = 1, std::size_t window_length = kWindowLength,
	                    std::size_t full_span_length = kFullSpanLength);

	std::size_t step() const {
		return step_;
	}
	std::size_t windowLength() const {
		return window_length_;
	}
	std::size_t fullSpanLength() const {
		return full_span_length_;
	}

	std::size_t slidingCount() const;
	std::size_t windowCount() const;

	/// All windows in analysis order.
	const std::vector<WindowSpec> &windows() const {
		return windows_;
	}

	const WindowSpec &window(std::size_t index) const;

	/**
	 * @brief Copies a window's observations out of a series.
	 * @throws InsufficientDataError if the series ends before the window does.
	 */
	static ObservationSeries extract(const ObservationSeries &series, const WindowSpec &window);

private:
	std::size_t step_;
	std::size_t window_length_;
	std::size_t full_span_length_;
	std::vector<WindowSpec> windows_;
};

} // namespace gevrisk::core
