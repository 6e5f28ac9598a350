#include "gevrisk/core/window.hpp"
#include "gevrisk/errors.hpp"

#include <stdexcept>
#include <string>

namespace gevrisk::core {

WindowPlan::WindowPlan(std::size_t step, std::size_t window_length, std::size_t full_span_length)
    : step_(step), window_length_(window_length), full_span_length_(full_span_length) {
	if (step_ == 0) {
		throw std::invalid_argument("Window step must be a positive integer.");
	}
	if (window_length_ == 0 || window_length_ > full_span_length_) {
		throw std::invalid_argument("Window length must be positive and no longer than the full span.");
	}

	const std::size_t sliding = slidingCount();
	windows_.reserve(sliding + 1);
	for (std::size_t j = 0; j < sliding; ++j) {
		windows_.push_back(WindowSpec{j, j * step_, window_length_, false});
	}
	// The last window always covers the start of the record, whatever the step.
	windows_.push_back(WindowSpec{sliding, 0, full_span_length_, true});
}

std::size_t WindowPlan::slidingCount() const {
	return (full_span_length_ - window_length_) / step_ + 1;
}

std::size_t WindowPlan::windowCount() const {
	return slidingCount() + 1;
}

const WindowSpec &WindowPlan::window(std::size_t index) const {
	if (index >= windows_.size()) {
		throw std::out_of_range("Window index " + std::to_string(index) + " is out of range.");
	}
	return windows_[index];
}

ObservationSeries WindowPlan::extract(const ObservationSeries &series, const WindowSpec &window) {
	if (window.end() > series.size()) {
		throw InsufficientDataError("Window " + std::to_string(window.index + 1) + " needs observations [" +
		                            std::to_string(window.start) + ", " + std::to_string(window.end()) +
		                            ") but the series has " + std::to_string(series.size()) + ".");
	}
	const auto first = series.begin() + static_cast<std::ptrdiff_t>(window.start);
	return ObservationSeries(first, first + static_cast<std::ptrdiff_t>(window.length));
}

} // namespace gevrisk::core
