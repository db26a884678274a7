// file      : libwasixcc/tool.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_TOOL_HXX
#define LIBWASIXCC_TOOL_HXX

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

namespace wasixcc
{
  // Runner of the underlying tools (clang, wasm-ld, wasm-opt, llvm-ar, etc).
  //
  class tool_runner
  {
  public:
    // Run the program with the specified arguments and wait for it to
    // finish. The program is either a path with a directory or a name to be
    // searched for in PATH.
    //
    // Issue diagnostics and throw failed if the program cannot be executed
    // or exits with other than zero status.
    //
    virtual void
    run (const path& program, const strings& args) = 0;

    tool_runner () = default;

    virtual
    ~tool_runner ();

    tool_runner (const tool_runner&) = delete;
    tool_runner& operator= (const tool_runner&) = delete;
  };

  // Run the tools as child processes. The command line is printed at
  // verbosity level 3 and higher.
  //
  class process_runner: public tool_runner
  {
  public:
    virtual void
    run (const path&, const strings&) override;
  };
}

#endif // LIBWASIXCC_TOOL_HXX
