// file      : libwasixcc/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_UTILITY_HXX
#define LIBWASIXCC_UTILITY_HXX

#include <string>      // to_string()
#include <utility>     // move()
#include <cassert>     // assert()
#include <algorithm>   // *

#include <libbutl/utility.hxx>  // icasecmp(), trim(), getenv(), etc

#include <libwasixcc/types.hxx>

namespace wasixcc
{
  using std::move;

  using std::to_string;

  // <libbutl/utility.hxx>
  //
  using butl::icasecmp;
  using butl::digit;
  using butl::trim;
  using butl::getenv;

  // Perform process-wide initializations/adjustments. Should be called once
  // early in main(). On POSIX this ignores SIGPIPE.
  //
  void
  init_process ();

  // Diagnostics state (verbosity level; see <libwasixcc/diagnostics.hxx>).
  //
  // Initialize the diagnostics state. Should be called once early in main().
  // The default value is for unit tests.
  //
  void
  init_diag (uint16_t verbosity);

  const uint16_t verb_never = 7;
  extern uint16_t verb;

  // Driver process path (argv0.initial is argv[0]). Must be initialized in
  // main() with init().
  //
  extern process_path argv0;

  void
  init (const char* argv0);

  // Basic process utilities.
  //
  // The child inherits the standard streams. The arguments are as returned
  // by process_args() below.

  // Search for a process executable. Issue diagnostics and throw failed in
  // case of an error.
  //
  process_path
  run_search (const path&, bool init = false);

  // Start a process with the specified arguments. Issue diagnostics and throw
  // failed in case of an error. Print the process command line if the
  // verbosity level is at least the specified value.
  //
  process
  run_start (uint16_t verbosity, const process_path&, const cstrings& args);

  // Wait for process termination. If the child process exited abnormally or
  // normally with non-0 code, then issue diagnostics to this effect and throw
  // failed. Additionally, if the verbosity level is between 1 and the
  // specified value, then print the command line as info after the error.
  //
  // Normally the specified verbosity will be 1 less than what gets passed to
  // run_start() so that the command line is printed exactly once.
  //
  void
  run_finish (const cstrings& args, process&, uint16_t verbosity);

  // Concatenate the program path and arguments into a shallow NULL-terminated
  // vector of C-strings.
  //
  cstrings
  process_args (const char* program, const strings& args);

  inline cstrings
  process_args (const string& program, const strings& args)
  {
    return process_args (program.c_str (), args);
  }

  // Append all the values to the argument list. If excl is not NULL, then
  // filter this option out (note: case sensitive).
  //
  void
  append_options (strings&, const strings&, const char* excl = nullptr);

  void
  append_options (strings&, initializer_list<const char*>);

  // Return the iterator to the first argument equal to the option or end if
  // there is none.
  //
  template <typename I>
  I
  find_option (const char* option, I begin, I end, bool ignore_case = false);

  // As above but look for several options returning the first argument (in
  // the argument order) that matches any of them or NULL if none does.
  //
  const string*
  find_options (const initializer_list<const char*>&,
                const strings&,
                bool = false);

  // Try to parse a string as a non-negative number returning nullopt if the
  // argument is not a valid number or the number is greater than the
  // specified maximum.
  //
  optional<uint64_t>
  parse_number (const string&, uint64_t max = UINT64_MAX);
}

#include <libwasixcc/utility.ixx>

#endif // LIBWASIXCC_UTILITY_HXX
