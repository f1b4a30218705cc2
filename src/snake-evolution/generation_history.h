#ifndef SNAKE_EVOLUTION_GENERATION_HISTORY_H
#define SNAKE_EVOLUTION_GENERATION_HISTORY_H

#include "simulation_driver.h"
#include <cstddef>
#include <cstdint>
#include <deque>

namespace snake_evolution {

// Best score and duration of the most recent generations, oldest first.
class GenerationHistory {
public:
    static constexpr size_t DEFAULT_CAPACITY = 45;

    explicit GenerationHistory(size_t capacity = DEFAULT_CAPACITY);

    void record(const GenerationSummary& summary);

    const std::deque<uint32_t>& get_scores() const { return scores_; }
    const std::deque<double>& get_times() const { return times_; }

    uint32_t max_score() const;
    double max_time() const;

    size_t size() const { return scores_.size(); }
    size_t get_capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::deque<uint32_t> scores_;
    std::deque<double> times_;
};

} // namespace snake_evolution

#endif // SNAKE_EVOLUTION_GENERATION_HISTORY_H
