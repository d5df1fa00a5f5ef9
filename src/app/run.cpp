// run.cpp — CLI run orchestration (load → anneal → write → summary)

#include "app/run.hpp"

#include <cstddef>
#include <exception>
#include <fstream>
#include <iomanip>
#include <memory>
#include <stdexcept>
#include <string>

#include "core/errors.hpp"
#include "io/progress.hpp"
#include "io/sample_writer.hpp"
#include "model/problem_io.hpp"
#include "sampler/sampler.hpp"
#include "util/timing.hpp"

namespace app {

namespace {

model::BinaryQuadraticModel load(const cli::Options& opt, std::istream& in) {
    if (opt.input == "-") return model::read_problem(in, opt.vartype);
    std::ifstream file(opt.input);
    if (!file.is_open()) throw std::runtime_error("cannot open " + opt.input);
    return model::read_problem(file, opt.vartype);
}

} // namespace

int run(const cli::Options& opt,
        std::istream& in,
        std::ostream& out,
        std::ostream& err,
        const std::atomic<bool>* cancel) {
    util::PhaseTimer timer;
    model::BinaryQuadraticModel bqm;
    try {
        bqm = load(opt, in);
    } catch (const core::ParseError& e) {
        err << "error: " << opt.input << ": " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        err << "error: " << e.what() << '\n';
        return 1;
    }
    timer.lap("load");

    sampler::Params params;
    params.num_reads  = opt.num_reads;
    params.sweeps     = opt.sweeps;
    params.beta_range = opt.beta_range;
    params.schedule   = opt.schedule;
    params.seed       = opt.seed;
    params.threads    = opt.threads;

    sim::RunControl control;
    control.cancel = cancel;
    std::unique_ptr<io::ReadProgress> progress;
    if (opt.progress && opt.num_reads > 0) {
        progress = std::make_unique<io::ReadProgress>(static_cast<std::size_t>(opt.num_reads), err);
        progress->attach(control);
    }

    if (!opt.quiet) {
        err << "problem: " << bqm.num_variables() << " variables, " << bqm.num_interactions()
            << " interactions (" << model::to_string(bqm.vartype()) << ")\n";
        err << "reads=" << opt.num_reads << " sweeps=" << opt.sweeps
            << " schedule=" << schedule::to_string(opt.schedule) << '\n';
    }

    // ---- Run ----
    sampler::SampleSet samples;
    try {
        samples = sampler::sample(bqm, params, &control);
    } catch (const std::invalid_argument& e) {
        if (progress) progress->finish();
        err << "error: " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        // Allocation failure, an oversized request or a hardened-build assertion.
        if (progress) progress->finish();
        err << "error: " << e.what() << '\n';
        return 1;
    }
    timer.lap("anneal");
    if (progress) progress->finish();

    if (samples.cancelled) {
        err << "interrupted: " << samples.size() << " of " << opt.num_reads << " reads completed\n";
    }

    io::write_samples(out, samples);
    out.flush();
    timer.lap("write");
    if (!out) {
        err << "error: failed writing samples\n";
        return 1;
    }

    if (!opt.quiet) {
        err << "seed=" << samples.seed << " reads=" << samples.size() << '\n';
        if (!samples.empty()) {
            err << "lowest energy: " << std::setprecision(17) << samples.energy(samples.lowest()) << '\n';
        }
        timer.report(err);
    }
    return samples.cancelled ? 130 : 0;
}

} // namespace app
