// run.hpp — one CLI run: load a problem, anneal it, print the sample table
#pragma once

#include <atomic>
#include <istream>
#include <ostream>

#include "cli/cli.hpp"

namespace app {

/*
Exit codes
  0    all reads completed
  1    I/O failure, or a run that could not be carried out (allocation,
       hardened-build check)
  2    malformed problem file or invalid run parameters
  130  cancelled; the completed reads are still printed

`out` receives only the sample table. Every diagnostic, the run summary and
the progress bar go to `err`. `in` is read when opt.input is "-".
*/
int run(const cli::Options& opt,
        std::istream& in,
        std::ostream& out,
        std::ostream& err,
        const std::atomic<bool>* cancel = nullptr);

} // namespace app
