#pragma once
#include <cstddef>
#include <mutex>
#include <utility>
#include <string>
#include <iomanip>
#include "logger.hpp"

/*
Usage:
------
   ProgressTracker tracker(n_units, 10, "chromosomes"); // print every 10%
   // from any thread:
   tracker.hit();
   tracker.finish(); // ensure the final 100% is printed

   Example output:
   [I::...::check_progress_..] [chromosomes]  50% ( 4/ 8) done
   [I::...::check_progress_..] [chromosomes] 100% ( 8/ 8) done

hit() may be called concurrently from worker threads.
*/

class ProgressTracker {
public:
    explicit ProgressTracker(std::size_t total, std::size_t step_percent = 10, std::string label = "Progress")
        : total_(total),
          step_percent_(step_percent ? step_percent : 1),
          next_step_(static_cast<double>(step_percent ? step_percent : 1)),
          width_count_(total ? int(std::to_string(total).size()) : 1),
          label_(std::move(label)) {}

    void hit() {
        std::lock_guard<std::mutex> lk(mtx_);
        ++processed_;
        check_progress_();
    }

    void finish() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!finished_printed_ && total_ > 0) print_(100);
        finished_printed_ = true;
    }

private:
    void print_(int percent) {
        log_stream()
            << "[" << label_ << "] " << std::setw(3) << percent << "% ("
            << std::setw(width_count_) << processed_ << "/" << std::setw(width_count_) << total_
            << ") done\n";
    }

    void check_progress_() {
        if (total_ == 0 || finished_printed_) return;

        double percent = (100.0 * processed_) / total_;
        if (percent >= 100.0) {
            print_(100);
            finished_printed_ = true;
            return;
        }
        if (percent >= next_step_) {
            print_(static_cast<int>(percent));
            while (next_step_ <= percent) next_step_ += step_percent_;
        }
    }

    std::mutex mtx_;

    std::size_t total_{0};
    std::size_t step_percent_{10};
    double      next_step_{10};
    std::size_t processed_{0};
    bool        finished_printed_{false};
    int         width_count_{1};
    std::string label_;
};
