// progress.hpp — console progress bar over completed reads (p-ranav/indicators)
#pragma once

#include <cstddef>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include <indicators/progress_bar.hpp>

#include "sim/anneal.hpp"

namespace io {

/**
 * @brief Single bar whose progress is the number of finished reads.
 *
 * tick() is called from TBB workers; the mutex keeps bar updates serialized.
 * The bar draws on `out` (stderr by default) and never touches stdout, which
 * carries the sample table. The console cursor is left alone: indicators'
 * cursor control writes its escape codes to stdout.
 */
class ReadProgress {
public:
    explicit ReadProgress(std::size_t total_reads, std::ostream& out = std::cerr)
        : total_(total_reads) {
        bar_ = std::make_unique<indicators::ProgressBar>(
            indicators::option::BarWidth{40},
            indicators::option::Start{"["},
            indicators::option::Fill{"="},
            indicators::option::Lead{">"},
            indicators::option::Remainder{" "},
            indicators::option::End{"]"},
            indicators::option::PrefixText{"reads "},
            indicators::option::ForegroundColor{indicators::Color::green},
            indicators::option::ShowElapsedTime{true},
            indicators::option::ShowRemainingTime{true},
            indicators::option::MaxProgress{total_reads},
            indicators::option::Stream{out}
        );
    }

    ~ReadProgress() { finish(); }

    ReadProgress(const ReadProgress&) = delete;
    ReadProgress& operator=(const ReadProgress&) = delete;

    void tick(std::size_t done, std::size_t total) {
        std::lock_guard<std::mutex> lk(mu_);
        if (finished_ || done <= shown_) return;
        shown_ = done;
        bar_->set_option(indicators::option::PostfixText{std::to_string(done) + "/" + std::to_string(total)});
        bar_->set_progress(done);
    }

    void finish() {
        std::lock_guard<std::mutex> lk(mu_);
        if (finished_) return;
        finished_ = true;
        if (shown_ < total_ && !bar_->is_completed()) bar_->mark_as_completed();
    }

    // Hook for sim::RunControl::on_read_done.
    void attach(sim::RunControl& ctl) {
        ctl.on_read_done = [this](std::size_t done, std::size_t total) { tick(done, total); };
    }

private:
    std::size_t total_;
    std::size_t shown_{0};
    bool finished_{false};
    std::mutex mu_;
    std::unique_ptr<indicators::ProgressBar> bar_;
};

} // namespace io
