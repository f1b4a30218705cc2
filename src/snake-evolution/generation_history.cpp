#include "generation_history.h"
#include <algorithm>
#include <stdexcept>

namespace snake_evolution {

GenerationHistory::GenerationHistory(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Generation history needs room for at least one entry");
    }
}

void GenerationHistory::record(const GenerationSummary& summary) {
    scores_.push_back(summary.generation_best_score);
    times_.push_back(summary.elapsed_seconds);
    while (scores_.size() > capacity_) {
        scores_.pop_front();
        times_.pop_front();
    }
}

uint32_t GenerationHistory::max_score() const {
    if (scores_.empty()) {
        return 0;
    }
    return *std::max_element(scores_.begin(), scores_.end());
}

double GenerationHistory::max_time() const {
    if (times_.empty()) {
        return 0.0;
    }
    return *std::max_element(times_.begin(), times_.end());
}

} // namespace snake_evolution
