// file      : libwasixcc/tool.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/tool.hxx>

#include <libwasixcc/diagnostics.hxx>

using namespace std;

namespace wasixcc
{
  tool_runner::
  ~tool_runner ()
  {
  }

  void process_runner::
  run (const path& p, const strings& args)
  {
    process_path pp (run_search (p, true /* init */));
    cstrings cargs (process_args (pp.recall_string (), args));

    process pr (run_start (3 /* verbosity */, pp, cargs));
    run_finish (cargs, pr, 2 /* verbosity */);
  }
}
